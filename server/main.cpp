#include "cmd_serve.h"

#include "opsgate/config.h"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

static void usage() {
    std::cerr << "opsgate_server [--config <file.json>] [--host <addr>] [--port <n>]\n";
}

int main(int argc, char** argv) {
    using namespace opsgate;

    std::string config_path;
    if (const char* e = std::getenv("OPSGATE_CONFIG")) config_path = e;
    std::string host;
    std::string port;

    for (int i = 1; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) { config_path = argv[++i]; continue; }
        if (a == "--host" && i + 1 < argc) { host = argv[++i]; continue; }
        if (a == "--port" && i + 1 < argc) { port = argv[++i]; continue; }
        if (a == "-h" || a == "--help") { usage(); return 0; }
        std::cerr << "unknown argument: " << a << "\n";
        usage();
        return 2;
    }

    GatewayConfig cfg = default_config();
    std::string err;
    if (!config_path.empty()) {
        err = load_config_file(config_path, &cfg);
        if (!err.empty()) { std::cerr << "[config] " << err << "\n"; return 2; }
    }
    err = apply_env_overrides(&cfg);
    if (!err.empty()) { std::cerr << "[config] " << err << "\n"; return 2; }

    if (!host.empty()) cfg.host = host;
    if (!port.empty()) {
        try {
            cfg.port = std::stoi(port);
        } catch (const std::exception&) {
            std::cerr << "[config] --port is not a number: " << port << "\n";
            return 2;
        }
    }

    err = finalize_config(&cfg);
    if (!err.empty()) { std::cerr << "[config] " << err << "\n"; return 2; }

    return cmd_serve(cfg);
}
