#include "test_common.h"
#include "opsgate/config.h"

#include <cstdlib>

using namespace opsgate;

static void clear_env() {
    for (const char* v : {"OPSGATE_PROFILE", "OPSGATE_API_KEYS", "OPSGATE_HOST", "OPSGATE_PORT",
                          "OPSGATE_ALLOWED_PATHS", "OPSGATE_ALLOWED_SERVICES", "OPSGATE_AUDIT_LOG",
                          "OPSGATE_COMPOSE_DIR", "OPSGATE_BACKEND_URL", "OPSGATE_MAX_BODY_BYTES"}) {
        unsetenv(v);
    }
}

int main() {
    clear_env();
    std::string dir = make_temp_dir("config");

    // Test 1: profile detection
    {
        expect_true(detect_profile() == Profile::DEV, "default should be DEV");
        setenv("OPSGATE_PROFILE", "prod", 1);
        expect_true(detect_profile() == Profile::PROD, "should detect PROD");
        setenv("OPSGATE_PROFILE", "PROD", 1);
        expect_true(detect_profile() == Profile::PROD, "should detect PROD case-insensitive");
        unsetenv("OPSGATE_PROFILE");
        expect_eq_str(profile_name(Profile::DEV), "dev", "dev name");
        expect_eq_str(profile_name(Profile::PROD), "prod", "prod name");
    }

    // Test 2: compiled defaults carry no credentials and finalize in DEV
    {
        GatewayConfig cfg = default_config();
        expect_true(cfg.api_keys.empty(), "no compiled-in keys");
        expect_eq_ll(cfg.port, 8002, "default port");
        expect_eq_ll((long long)cfg.sandbox.allowed_services.size(), 8, "default services");
        expect_eq_ll((long long)cfg.sandbox.repo_paths.size(), 4, "default repos");
        expect_true(!cfg.query_command.empty(), "default query command");
        expect_true(finalize_config(&cfg).empty(), "defaults finalize in DEV");
        expect_eq_ll((long long)cfg.sandbox.blocked_regex.size(), (long long)cfg.sandbox.blocked_patterns.size(),
                     "blocklist compiled");
    }

    // Test 3: config file overlays only the keys it names
    {
        std::string path = dir + "/opsgate.json";
        write_text(path, "{\"port\": 9100, \"allowed_paths\": [\"" + dir + "\"],"
                         " \"api_keys\": [\"file-key\"],"
                         " \"repo_paths\": {\"ops\": \"" + dir + "/ops\"},"
                         " \"service_repos\": {}, \"audit_log\": \"" + dir + "/audit.jsonl\"}");
        GatewayConfig cfg = default_config();
        expect_true(load_config_file(path, &cfg).empty(), "config file loads");
        expect_eq_ll(cfg.port, 9100, "port from file");
        expect_eq_str(cfg.host, "0.0.0.0", "host kept");
        expect_eq_ll((long long)cfg.sandbox.repo_paths.size(), 1, "repo map replaced");
        expect_eq_str(cfg.api_keys.at(0), "file-key", "keys from file");
        expect_eq_str(cfg.audit_log_path, dir + "/audit.jsonl", "audit path from file");
        expect_true(finalize_config(&cfg).empty(), "file config finalizes");

        GatewayConfig c2 = default_config();
        expect_true(!load_config_file(dir + "/missing.json", &c2).empty(), "missing file is an error");
        write_text(dir + "/bad.json", "[1,2]");
        expect_true(!load_config_file(dir + "/bad.json", &c2).empty(), "non-object file is an error");
    }

    // Test 4: environment overrides win over the file
    {
        GatewayConfig cfg = default_config();
        setenv("OPSGATE_API_KEYS", " k1 , k2,,", 1);
        setenv("OPSGATE_PORT", "9200", 1);
        setenv("OPSGATE_ALLOWED_SERVICES", "apis,nginx", 1);
        expect_true(apply_env_overrides(&cfg).empty(), "env overrides apply");
        expect_eq_ll(cfg.port, 9200, "port from env");
        expect_eq_ll((long long)cfg.api_keys.size(), 2, "keys split and trimmed");
        expect_eq_str(cfg.api_keys[0], "k1", "first key trimmed");
        expect_eq_ll((long long)cfg.service_repos.size(), 1, "service_repos pruned to allowed services");
        expect_true(cfg.service_repos.count("apis") == 1, "apis mapping kept");
        expect_true(finalize_config(&cfg).empty(), "narrowed config finalizes");

        setenv("OPSGATE_PORT", "eighty", 1);
        GatewayConfig bad = default_config();
        expect_true(!apply_env_overrides(&bad).empty(), "non-numeric port rejected");
        clear_env();
    }

    // Test 5: validation failures
    {
        GatewayConfig a = default_config();
        a.port = 70000;
        expect_true(contains(finalize_config(&a), "port"), "port range");

        GatewayConfig b = default_config();
        b.sandbox.allowed_roots.clear();
        expect_true(!finalize_config(&b).empty(), "no allowed paths");

        GatewayConfig c = default_config();
        c.sandbox.allowed_roots = {"relative"};
        expect_true(!finalize_config(&c).empty(), "relative allowed path");

        GatewayConfig d = default_config();
        d.sandbox.repo_paths["x"] = "not/absolute";
        expect_true(!finalize_config(&d).empty(), "relative repo path");

        GatewayConfig e = default_config();
        e.service_repos["ghost"] = "saga-be";
        expect_true(contains(finalize_config(&e), "unknown service"), "unknown service in map");

        GatewayConfig f = default_config();
        f.service_repos["apis"] = "nope";
        expect_true(contains(finalize_config(&f), "unknown repo"), "unknown repo in map");
    }

    // Test 6: PROD requires keys and an audit trail
    {
        GatewayConfig cfg = default_config();
        cfg.profile = Profile::PROD;
        expect_true(!finalize_config(&cfg).empty(), "prod without keys rejected");
        cfg.api_keys = {"k"};
        expect_true(!finalize_config(&cfg).empty(), "prod without audit log rejected");
        cfg.audit_log_path = dir + "/audit.jsonl";
        expect_true(finalize_config(&cfg).empty(), "prod with keys and audit accepted");
    }

    remove_tree(dir);
    std::cerr << "test_config: ALL PASSED" << std::endl;
    return 0;
}
