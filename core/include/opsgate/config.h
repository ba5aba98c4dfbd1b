#pragma once

#include "opsgate/sandbox.h"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace opsgate {

enum class Profile { DEV, PROD };

// Detect profile from OPSGATE_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Everything the gateway needs, fixed at startup and only ever handed out
// as const GatewayConfig&.
struct GatewayConfig {
    Profile profile{Profile::DEV};

    std::string host{"0.0.0.0"};
    int port{8002};
    size_t max_body_bytes{2 * 1024 * 1024};
    int max_connections{32};
    int socket_timeout_sec{10};

    std::string server_name{"opsgate"};
    std::string version{"1.0.0"};

    std::vector<std::string> api_keys;
    SandboxPolicy sandbox;

    // Services built from a repository; deploy pulls the repo first.
    std::map<std::string, std::string> service_repos;

    std::string compose_dir;
    std::string backend_url;
    std::string stats_url;

    // Read-only query runner. Receives {"query": ..., "params": {...}} on stdin,
    // prints the rows as JSON on stdout.
    std::vector<std::string> query_command;

    std::string audit_log_path;
};

// Compiled defaults of the production deployment. No credentials.
GatewayConfig default_config();

// Overlay a JSON config file. Keys absent from the file keep their value.
// Returns empty string on success, error message on failure.
std::string load_config_file(const std::string& path, GatewayConfig* cfg);

// Overlay OPSGATE_* environment variables.
std::string apply_env_overrides(GatewayConfig* cfg);

// Validate and compile the sandbox policy. Must run before the config is used.
std::string finalize_config(GatewayConfig* cfg);

} // namespace opsgate
