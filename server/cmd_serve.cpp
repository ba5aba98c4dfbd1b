#include "cmd_serve.h"
#include "serve_http.h"

#include "opsgate/audit.h"
#include "opsgate/auth.h"
#include "opsgate/dispatcher.h"
#include "opsgate/gateway.h"
#include "opsgate/proc.h"
#include "opsgate/registry.h"
#include "tools/ops/ops_tools.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace opsgate {

namespace {

std::atomic<bool> g_serve_running{true};

void on_stop_signal(int) { g_serve_running.store(false); }

// Live connection count; shutdown waits for it to reach zero.
struct ConnCounter {
    std::mutex mu;
    std::condition_variable cv;
    int active{0};

    bool try_acquire(int limit) {
        std::lock_guard<std::mutex> lk(mu);
        if (active >= limit) return false;
        active++;
        return true;
    }
    void release() {
        std::lock_guard<std::mutex> lk(mu);
        active--;
        cv.notify_all();
    }
    void wait_idle() {
        std::unique_lock<std::mutex> lk(mu);
        cv.wait(lk, [&] { return active == 0; });
    }
};

struct ConnGuard {
    ConnCounter& c;
    int fd;
    ~ConnGuard() {
        ::close(fd);
        c.release();
    }
};

void serve_connection(int cfd, const Gateway& gateway, const GatewayConfig& cfg) {
    auto t0 = std::chrono::steady_clock::now();

    std::string head, body;
    if (!read_http_request(cfd, head, body, cfg.max_body_bytes)) return;

    HttpRequest req;
    if (!parse_http_head(head, &req)) {
        send_response(cfd, detail_response(400, "Malformed request"));
        return;
    }
    req.body = std::move(body);

    HttpResponse resp = gateway.handle(req);
    send_response(cfd, resp);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();
    std::cerr << "[http] " << req.method << " " << req.path << " -> " << resp.status
              << " (" << ms << " ms)\n";
}

} // namespace

int cmd_serve(const GatewayConfig& cfg) {
    ::signal(SIGPIPE, SIG_IGN);
    ::signal(SIGINT, on_stop_signal);
    ::signal(SIGTERM, on_stop_signal);

    ToolRegistry registry;
    try {
        register_ops_tools(registry);
    } catch (const std::exception& e) {
        std::cerr << "[serve] tool registration failed: " << e.what() << "\n";
        return 2;
    }

    AuditLog audit(cfg.audit_log_path);
    if (!audit.error().empty()) {
        std::cerr << "[audit] " << audit.error() << "\n";
        if (cfg.profile == Profile::PROD) return 2;
    }

    SystemProcessRunner runner;
    Dispatcher dispatcher(registry, cfg, runner, &audit);
    AuthGate auth(cfg.api_keys);
    Gateway gateway(dispatcher, auth);

    int sfd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (sfd < 0) { std::cerr << "[serve] socket failed\n"; return 2; }
    {
        int one = 1;
        ::setsockopt(sfd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons((uint16_t)cfg.port);
    if (::inet_pton(AF_INET, cfg.host.c_str(), &addr.sin_addr) <= 0) {
        std::cerr << "[serve] bad host: " << cfg.host << "\n";
        ::close(sfd);
        return 2;
    }
    if (::bind(sfd, (sockaddr*)&addr, sizeof(addr)) < 0) {
        std::cerr << "[serve] bind failed on " << cfg.host << ":" << cfg.port << "\n";
        ::close(sfd);
        return 2;
    }
    if (::listen(sfd, 64) < 0) {
        std::cerr << "[serve] listen failed\n";
        ::close(sfd);
        return 2;
    }

    std::cerr << "[serve] http://" << cfg.host << ":" << cfg.port
              << " profile=" << profile_name(cfg.profile)
              << " tools=" << registry.size()
              << " api_keys=" << auth.key_count()
              << " audit=" << (audit.enabled() ? audit.path() : std::string("off")) << "\n";

    ConnCounter conns;
    while (g_serve_running.load()) {
        struct pollfd pfd{sfd, POLLIN, 0};
        int pr = ::poll(&pfd, 1, 500);
        if (pr <= 0) continue; // timeout or EINTR; re-check the flag

        sockaddr_in caddr{};
        socklen_t clen = sizeof(caddr);
        int cfd = ::accept(sfd, (sockaddr*)&caddr, &clen);
        if (cfd < 0) continue;

        if (!conns.try_acquire(cfg.max_connections)) {
            send_response(cfd, detail_response(503, "Too many connections"));
            ::close(cfd);
            continue;
        }
        set_socket_timeouts(cfd, cfg.socket_timeout_sec);

        try {
            std::thread([&conns, &gateway, &cfg, cfd]() {
                ConnGuard guard{conns, cfd};
                serve_connection(cfd, gateway, cfg);
            }).detach();
        } catch (const std::system_error& e) {
            std::cerr << "[serve] thread spawn failed: " << e.what() << "\n";
            ::close(cfd);
            conns.release();
        }
    }

    std::cerr << "[serve] stopping, waiting for in-flight requests\n";
    ::close(sfd);
    conns.wait_idle();
    std::cerr << "[serve] stopped\n";
    return 0;
}

} // namespace opsgate
