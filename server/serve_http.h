#pragma once

// Socket-level HTTP/1.1 helpers for the serve loop. One request per
// connection; the response always closes the connection.

#include "opsgate/http.h"
#include "opsgate/text.h"

#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <string>

#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace opsgate {

// Per-connection recv/send timeouts (slow client defense).
inline void set_socket_timeouts(int fd, int timeout_sec = 10) {
    struct timeval tv;
    tv.tv_sec = timeout_sec;
    tv.tv_usec = 0;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

// Read head and body. Returns false on disconnect, timeout, an oversized
// head or body, or a duplicate Content-Length; the caller drops the connection.
inline bool read_http_request(int fd, std::string& head, std::string& body, size_t max_body) {
    head.clear();
    body.clear();
    std::string buf;
    buf.resize(8192);
    std::string all;

    while (all.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(fd, &buf[0], buf.size(), 0);
        if (n <= 0) return false;
        all.append(buf.data(), (size_t)n);
        if (all.size() > 64 * 1024) return false; // header cap
    }

    size_t p = all.find("\r\n\r\n");
    head = all.substr(0, p + 4);
    std::string rest = all.substr(p + 4);

    size_t cl = 0;
    int cl_count = 0;
    std::istringstream iss(head);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (starts_with(lower_ascii(line), "content-length:")) {
            if (++cl_count > 1) return false; // request smuggling
            try { cl = (size_t)std::stoull(trim_ws(line.substr(15))); } catch (const std::exception&) { return false; }
        }
    }

    if (cl > max_body) return false;

    body = rest;
    while (body.size() < cl) {
        ssize_t n = ::recv(fd, &buf[0], buf.size(), 0);
        if (n <= 0) return false;
        body.append(buf.data(), (size_t)n);
        if (body.size() > max_body) return false;
    }
    if (body.size() > cl) body.resize(cl);
    return true;
}

// Request line and headers into an HttpRequest. False on a malformed request line.
inline bool parse_http_head(const std::string& head, HttpRequest* req) {
    std::istringstream iss(head);
    std::string line;
    if (!std::getline(iss, line)) return false;
    if (!line.empty() && line.back() == '\r') line.pop_back();

    std::istringstream rl(line);
    std::string method, target, version;
    rl >> method >> target >> version;
    if (method.empty() || target.empty() || target[0] != '/') return false;
    req->method = upper_ascii(method);
    split_target(target, &req->path, &req->query);

    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        size_t c = line.find(':');
        if (c == std::string::npos) continue;
        req->headers[lower_ascii(trim_ws(line.substr(0, c)))] = trim_ws(line.substr(c + 1));
    }
    return true;
}

inline void send_response(int fd, const HttpResponse& resp) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << resp.status << " " << status_reason(resp.status) << "\r\n";
    if (!resp.body.empty() || resp.status != 204) {
        oss << "Content-Type: " << resp.content_type << "\r\n";
    }
    oss << "Content-Length: " << resp.body.size() << "\r\n";
    for (const auto& h : resp.headers) oss << h.first << ": " << h.second << "\r\n";
    oss << "Connection: close\r\n\r\n";
    oss << resp.body;
    std::string s = oss.str();
    size_t sent = 0;
    while (sent < s.size()) {
        ssize_t n = ::send(fd, s.data() + sent, s.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) break;
        sent += (size_t)n;
    }
}

} // namespace opsgate
