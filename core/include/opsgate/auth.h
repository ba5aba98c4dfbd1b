#pragma once

#include "opsgate/http.h"

#include <optional>
#include <string>
#include <vector>

namespace opsgate {

// Credential check against the fixed key set loaded at startup.
// Possession of any key authorizes every tool; there are no scopes.
class AuthGate {
public:
    explicit AuthGate(std::vector<std::string> keys) : keys_(std::move(keys)) {}

    // X-API-Key header, else the "key" query parameter. nullopt if neither.
    static std::optional<std::string> credential(const HttpRequest& req);

    // Constant-time membership; every key is compared.
    bool is_valid(const std::string& credential) const;

    bool authorize(const HttpRequest& req) const;

    size_t key_count() const { return keys_.size(); }

private:
    std::vector<std::string> keys_;
};

} // namespace opsgate
