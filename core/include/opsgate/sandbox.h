#pragma once

// opsgate sandbox: software-level allowlisting for every tool argument that
// names a path, a command line, a service, a repository or a query.
//
// All checks are pure: no filesystem writes, no process spawns. Path checks
// read the filesystem only to resolve symlinks.

#include <map>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace opsgate {

struct SandboxPolicy {
    std::vector<std::string> allowed_roots;
    std::vector<std::string> blocked_patterns;          // ECMAScript, case-insensitive
    std::vector<std::string> allowed_services;
    std::map<std::string, std::string> repo_paths;      // repo name -> absolute directory
    std::vector<std::string> command_prefixes;

    // Filled by compile_policy().
    std::vector<std::regex> blocked_regex;
};

// Canonicalize allowed_roots and compile blocked_patterns.
// Returns empty string on success, error message on failure.
std::string compile_policy(SandboxPolicy& policy);

// Absolute, symlink-resolved, lexically normal form of p without a trailing
// slash. nullopt on any resolution error.
std::optional<std::string> canonical_path(const std::string& p);

// True if canonical path p equals root or lies below it on a component boundary.
bool path_under(const std::string& p, const std::string& root);

struct PathVerdict {
    bool allowed{false};
    std::string canonical;  // set when allowed
    std::string reason;     // set when rejected
};

// Allowlist check first (resolution errors reject), then the blocklist.
PathVerdict validate_path(const SandboxPolicy& policy, const std::string& path);
bool path_allowed(const SandboxPolicy& policy, const std::string& path);
bool path_blocked(const SandboxPolicy& policy, const std::string& canonical);

// Literal prefix match against the configured command prefixes.
bool command_allowed(const SandboxPolicy& policy, const std::string& command);

bool service_allowed(const SandboxPolicy& policy, const std::string& name);
std::optional<std::string> repo_path(const SandboxPolicy& policy, const std::string& name);

// First mutating keyword found in the uppercased query, or empty.
std::string find_mutation_keyword(const std::string& query);
inline bool query_is_mutation(const std::string& query) { return !find_mutation_keyword(query).empty(); }

std::string join_names(const std::vector<std::string>& names);

} // namespace opsgate
