#include "opsgate/sandbox.h"
#include "opsgate/text.h"

#include <algorithm>
#include <filesystem>

namespace opsgate {

namespace fs = std::filesystem;

namespace {

const char* const kMutationKeywords[] = {"CREATE", "MERGE", "DELETE", "SET", "REMOVE", "DROP"};

std::string strip_trailing_slashes(std::string s) {
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

} // namespace

std::optional<std::string> canonical_path(const std::string& p) {
    if (p.empty() || p.find('\0') != std::string::npos) return std::nullopt;
    try {
        std::error_code ec;
        fs::path abs = fs::absolute(fs::path(strip_trailing_slashes(p)), ec);
        if (ec) return std::nullopt;
        fs::path c = fs::weakly_canonical(abs, ec);
        if (ec) return std::nullopt;
        return strip_trailing_slashes(c.lexically_normal().generic_string());
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool path_under(const std::string& p, const std::string& root) {
    if (root.empty()) return false;
    if (p == root) return true;
    std::string rs = root;
    if (rs.back() != '/') rs.push_back('/');
    return p.rfind(rs, 0) == 0;
}

std::string compile_policy(SandboxPolicy& policy) {
    std::vector<std::string> roots;
    for (const auto& r : policy.allowed_roots) {
        if (r.empty() || r[0] != '/') return "allowed path must be absolute: " + r;
        auto c = canonical_path(r);
        if (!c) return "cannot resolve allowed path: " + r;
        roots.push_back(*c);
    }
    policy.allowed_roots = std::move(roots);

    policy.blocked_regex.clear();
    for (const auto& pat : policy.blocked_patterns) {
        try {
            policy.blocked_regex.emplace_back(pat, std::regex::ECMAScript | std::regex::icase);
        } catch (const std::regex_error& e) {
            return "invalid blocked pattern '" + pat + "': " + e.what();
        }
    }
    return "";
}

bool path_blocked(const SandboxPolicy& policy, const std::string& canonical) {
    for (const auto& re : policy.blocked_regex) {
        if (std::regex_search(canonical, re)) return true;
    }
    return false;
}

PathVerdict validate_path(const SandboxPolicy& policy, const std::string& path) {
    PathVerdict v;
    auto c = canonical_path(path);
    bool under = false;
    if (c) {
        for (const auto& root : policy.allowed_roots) {
            if (path_under(*c, root)) { under = true; break; }
        }
    }
    if (!under) {
        v.reason = "Access denied: " + path + " is outside allowed directories";
        return v;
    }
    if (path_blocked(policy, *c)) {
        v.reason = "Access denied: " + path + " matches blocked pattern";
        return v;
    }
    v.allowed = true;
    v.canonical = *c;
    return v;
}

bool path_allowed(const SandboxPolicy& policy, const std::string& path) {
    return validate_path(policy, path).allowed;
}

bool command_allowed(const SandboxPolicy& policy, const std::string& command) {
    for (const auto& p : policy.command_prefixes) {
        if (!p.empty() && starts_with(command, p)) return true;
    }
    return false;
}

bool service_allowed(const SandboxPolicy& policy, const std::string& name) {
    return std::find(policy.allowed_services.begin(), policy.allowed_services.end(), name)
        != policy.allowed_services.end();
}

std::optional<std::string> repo_path(const SandboxPolicy& policy, const std::string& name) {
    auto it = policy.repo_paths.find(name);
    if (it == policy.repo_paths.end()) return std::nullopt;
    return it->second;
}

std::string find_mutation_keyword(const std::string& query) {
    const std::string up = upper_ascii(query);
    for (const char* kw : kMutationKeywords) {
        if (up.find(kw) != std::string::npos) return kw;
    }
    return "";
}

std::string join_names(const std::vector<std::string>& names) {
    std::string out;
    for (size_t i = 0; i < names.size(); i++) {
        if (i) out += ", ";
        out += names[i];
    }
    return out;
}

} // namespace opsgate
