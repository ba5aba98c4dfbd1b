#pragma once

// Tamper-evident audit trail for destructive operations.
//
// One canonical JSON object per line (keys sorted):
//   {chain_hash, chain_prev, event, payload, seq, ts}
// chain_hash = SHA256(chain_prev || canonical {event, payload, seq, ts}).
// The first record chains from 64 zeros; reopening continues the chain.

#include "opsgate/json.h"

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace opsgate {

// Serialize with object keys sorted, recursively.
std::string canonical_json(json_object* obj);

class AuditLog {
public:
    // Empty path disables the trail; events are dropped.
    explicit AuditLog(const std::string& path);

    bool enabled() const { return enabled_; }
    const std::string& path() const { return path_; }
    // Non-empty when the file could not be opened or its tail could not be read.
    const std::string& error() const { return error_; }

    // payload is borrowed. Thread-safe.
    void event(const std::string& name, json_object* payload);

    uint64_t seq() const;
    std::string chain_head() const;

private:
    std::string path_;
    bool enabled_{false};
    std::string error_;

    mutable std::mutex mu_;
    std::ofstream out_;
    std::string chain_prev_;
    uint64_t seq_{0};
};

// Re-derive every chain_hash in an audit file.
// Returns empty string if the chain is intact, else the first problem found.
std::string verify_audit_chain(const std::string& path, size_t* records = nullptr);

} // namespace opsgate
