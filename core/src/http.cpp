#include "opsgate/http.h"
#include "opsgate/text.h"

namespace opsgate {

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(lower_ascii(name));
    return it == headers.end() ? std::string() : it->second;
}

std::string HttpRequest::query_param(const std::string& name) const {
    auto it = query.find(name);
    return it == query.end() ? std::string() : it->second;
}

namespace {

int hexval(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string percent_decode(const std::string& s, bool form) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        char c = s[i];
        if (c == '%' && i + 2 < s.size()) {
            int hi = hexval(s[i + 1]);
            int lo = hexval(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back((char)(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        if (c == '+' && form) {
            out.push_back(' ');
            continue;
        }
        out.push_back(c);
    }
    return out;
}

void split_target(const std::string& target, std::string* path, std::map<std::string, std::string>* query) {
    size_t q = target.find('?');
    std::string raw_path = q == std::string::npos ? target : target.substr(0, q);
    *path = percent_decode(raw_path, false);
    query->clear();
    if (q == std::string::npos) return;

    std::string qs = target.substr(q + 1);
    size_t hash = qs.find('#');
    if (hash != std::string::npos) qs.resize(hash);

    size_t start = 0;
    while (start <= qs.size()) {
        size_t amp = qs.find('&', start);
        std::string part = qs.substr(start, amp == std::string::npos ? std::string::npos : amp - start);
        if (!part.empty()) {
            size_t eq = part.find('=');
            std::string k = percent_decode(part.substr(0, eq), true);
            std::string v = eq == std::string::npos ? std::string() : percent_decode(part.substr(eq + 1), true);
            if (!k.empty()) (*query)[k] = v;
        }
        if (amp == std::string::npos) break;
        start = amp + 1;
    }
}

const char* status_reason(int code) {
    switch (code) {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
    }
    return "ERR";
}

} // namespace opsgate
