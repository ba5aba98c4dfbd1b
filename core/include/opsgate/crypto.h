#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace opsgate {

// Incremental SHA-256.
class Sha256 {
public:
    Sha256();
    void update(const uint8_t* data, size_t n);
    void update(const std::string& s) {
        update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    }
    std::array<uint8_t, 32> finish();

private:
    void block(const uint8_t* p);

    uint32_t h_[8];
    uint8_t buf_[64];
    size_t buf_len_{0};
    uint64_t total_{0};
};

std::string sha256_hex(const std::string& s);

// Constant-time string equality (credential comparison).
bool constant_time_eq(const std::string& a, const std::string& b);

} // namespace opsgate
