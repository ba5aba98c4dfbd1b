#include "opsgate/auth.h"
#include "opsgate/crypto.h"

namespace opsgate {

std::optional<std::string> AuthGate::credential(const HttpRequest& req) {
    std::string h = req.header("x-api-key");
    if (!h.empty()) return h;
    if (req.has_query("key")) {
        std::string q = req.query_param("key");
        if (!q.empty()) return q;
    }
    return std::nullopt;
}

bool AuthGate::is_valid(const std::string& credential) const {
    if (credential.empty()) return false;
    bool found = false;
    for (const auto& k : keys_) {
        if (constant_time_eq(credential, k)) found = true;
    }
    return found;
}

bool AuthGate::authorize(const HttpRequest& req) const {
    auto c = credential(req);
    return c && is_valid(*c);
}

} // namespace opsgate
