#include "opsgate/config.h"
#include "opsgate/json.h"
#include "opsgate/text.h"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace opsgate {

Profile detect_profile() {
    const char* env = std::getenv("OPSGATE_PROFILE");
    if (!env) return Profile::DEV;

    std::string val = lower_ascii(env);
    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

GatewayConfig default_config() {
    GatewayConfig c;
    c.profile = detect_profile();

    c.sandbox.allowed_roots = {"/opt/saga-graph", "/app", "/var/log", "/tmp"};
    c.sandbox.blocked_patterns = {
        R"(\.env$)", R"(\.env\.local$)", "credentials", "secrets",
        R"(\.pem$)", R"(\.key$)", "password", R"(\.ssh)",
    };
    c.sandbox.allowed_services = {
        "frontend", "apis", "worker-main", "worker-sources",
        "neo4j", "nginx", "qdrant", "mcp-server",
    };
    c.sandbox.repo_paths = {
        {"saga-fe", "/opt/saga-graph/saga-fe"},
        {"saga-be", "/opt/saga-graph/saga-be"},
        {"graph-functions", "/opt/saga-graph/graph-functions"},
        {"victor_deployment", "/opt/saga-graph/victor_deployment"},
    };
    c.sandbox.command_prefixes = {
        "docker ps", "docker logs", "docker inspect", "docker stats --no-stream",
        "df -h", "free", "uptime", "ps aux", "netstat -tlnp",
        "ls ", "cat /proc/", "wc -l", "head ", "tail ",
    };

    c.service_repos = {
        {"frontend", "saga-fe"},
        {"apis", "saga-be"},
        {"worker-main", "graph-functions"},
        {"worker-sources", "graph-functions"},
    };
    c.compose_dir = "/opt/saga-graph/victor_deployment";
    c.backend_url = "http://apis:8000";
    c.stats_url = "http://apis:8000/api/stats";
    // Fixed script: the query travels as JSON on stdin, never inside the program text.
    c.query_command = {
        "docker", "exec", "-i", "-w", "/app/graph-functions", "apis", "python", "-c",
        "import json, sys\n"
        "from src.graph.neo4j_client import run_cypher\n"
        "req = json.load(sys.stdin)\n"
        "print(json.dumps(run_cypher(req['query'], req.get('params') or {}), default=str))\n",
    };
    return c;
}

namespace {

std::string read_file_all(const std::string& path, std::string* err) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        *err = "cannot open config file: " + path;
        return "";
    }
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

void overlay_strings(json_object* root, const char* key, std::vector<std::string>* dst) {
    json_object* v = json::member(root, key);
    if (v && json_object_is_type(v, json_type_array)) *dst = json::get_array_strings(root, key);
}

void overlay_map(json_object* root, const char* key, std::map<std::string, std::string>* dst) {
    json_object* v = json::member(root, key);
    if (!json::is_object(v)) return;
    dst->clear();
    json_object_object_foreach(v, k, val) {
        if (val && json_object_is_type(val, json_type_string)) (*dst)[k] = json_object_get_string(val);
    }
}

bool parse_port(const std::string& s, int* out) {
    try {
        size_t pos = 0;
        int v = std::stoi(s, &pos);
        if (pos != s.size()) return false;
        *out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

std::string load_config_file(const std::string& path, GatewayConfig* cfg) {
    std::string err;
    std::string text = read_file_all(path, &err);
    if (!err.empty()) return err;

    json::Doc doc = json::parse(text);
    if (!json::is_object(doc.get())) return "config file is not a JSON object: " + path;
    json_object* root = doc.get();

    if (auto v = json::get_string(root, "host")) cfg->host = *v;
    if (auto v = json::get_int(root, "port")) cfg->port = (int)*v;
    if (auto v = json::get_int(root, "max_body_bytes")) {
        if (*v <= 0) return "max_body_bytes must be positive";
        cfg->max_body_bytes = (size_t)*v;
    }
    if (auto v = json::get_int(root, "max_connections")) cfg->max_connections = (int)*v;
    if (auto v = json::get_int(root, "socket_timeout_sec")) cfg->socket_timeout_sec = (int)*v;

    overlay_strings(root, "api_keys", &cfg->api_keys);
    overlay_strings(root, "allowed_paths", &cfg->sandbox.allowed_roots);
    overlay_strings(root, "blocked_patterns", &cfg->sandbox.blocked_patterns);
    overlay_strings(root, "allowed_services", &cfg->sandbox.allowed_services);
    overlay_strings(root, "command_prefixes", &cfg->sandbox.command_prefixes);
    overlay_strings(root, "query_command", &cfg->query_command);
    overlay_map(root, "repo_paths", &cfg->sandbox.repo_paths);
    overlay_map(root, "service_repos", &cfg->service_repos);

    if (auto v = json::get_string(root, "compose_dir")) cfg->compose_dir = *v;
    if (auto v = json::get_string(root, "backend_url")) cfg->backend_url = *v;
    if (auto v = json::get_string(root, "stats_url")) cfg->stats_url = *v;
    if (auto v = json::get_string(root, "audit_log")) cfg->audit_log_path = *v;
    return "";
}

std::string apply_env_overrides(GatewayConfig* cfg) {
    if (const char* v = std::getenv("OPSGATE_API_KEYS")) cfg->api_keys = split_csv(v);
    if (const char* v = std::getenv("OPSGATE_HOST")) cfg->host = v;
    if (const char* v = std::getenv("OPSGATE_PORT")) {
        if (!parse_port(v, &cfg->port)) return std::string("OPSGATE_PORT is not a number: ") + v;
    }
    if (const char* v = std::getenv("OPSGATE_ALLOWED_PATHS")) cfg->sandbox.allowed_roots = split_csv(v);
    if (const char* v = std::getenv("OPSGATE_ALLOWED_SERVICES")) {
        cfg->sandbox.allowed_services = split_csv(v);
        // deploy mappings follow the narrowed service set
        for (auto it = cfg->service_repos.begin(); it != cfg->service_repos.end(); ) {
            if (!service_allowed(cfg->sandbox, it->first)) it = cfg->service_repos.erase(it);
            else ++it;
        }
    }
    if (const char* v = std::getenv("OPSGATE_AUDIT_LOG")) cfg->audit_log_path = v;
    if (const char* v = std::getenv("OPSGATE_COMPOSE_DIR")) cfg->compose_dir = v;
    if (const char* v = std::getenv("OPSGATE_BACKEND_URL")) cfg->backend_url = v;
    if (const char* v = std::getenv("OPSGATE_MAX_BODY_BYTES")) {
        try {
            long long n = std::stoll(v);
            if (n <= 0) return "OPSGATE_MAX_BODY_BYTES must be positive";
            cfg->max_body_bytes = (size_t)n;
        } catch (const std::exception&) {
            return std::string("OPSGATE_MAX_BODY_BYTES is not a number: ") + v;
        }
    }
    return "";
}

std::string finalize_config(GatewayConfig* cfg) {
    if (cfg->port < 1 || cfg->port > 65535) return "port out of range: " + std::to_string(cfg->port);
    if (cfg->max_connections < 1) return "max_connections must be positive";
    if (cfg->socket_timeout_sec < 1) return "socket_timeout_sec must be positive";
    if (cfg->sandbox.allowed_roots.empty()) return "at least one allowed path is required";

    for (const auto& kv : cfg->sandbox.repo_paths) {
        if (kv.second.empty() || kv.second[0] != '/') {
            return "repo path must be absolute: " + kv.first + " -> " + kv.second;
        }
    }
    for (const auto& kv : cfg->service_repos) {
        if (!service_allowed(cfg->sandbox, kv.first)) {
            return "service_repos references unknown service: " + kv.first;
        }
        if (!cfg->sandbox.repo_paths.count(kv.second)) {
            return "service_repos references unknown repo: " + kv.second;
        }
    }
    if (!cfg->compose_dir.empty() && cfg->compose_dir[0] != '/') {
        return "compose_dir must be absolute: " + cfg->compose_dir;
    }

    std::vector<std::string> keys;
    for (auto& k : cfg->api_keys) {
        std::string t = trim_ws(k);
        if (!t.empty()) keys.push_back(t);
    }
    cfg->api_keys = std::move(keys);

    if (cfg->profile == Profile::PROD) {
        if (cfg->api_keys.empty()) return "prod profile requires OPSGATE_API_KEYS";
        if (cfg->audit_log_path.empty()) return "prod profile requires an audit log path";
    } else if (cfg->api_keys.empty()) {
        std::cerr << "[config] no API keys configured: every authenticated call will be rejected\n";
    }

    std::string err = compile_policy(cfg->sandbox);
    if (!err.empty()) return err;
    return "";
}

} // namespace opsgate
