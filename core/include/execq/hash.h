#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace execq {

// Streaming SHA-256. Used for snapshot hashes and the event-log hash chain.
class Sha256 {
public:
    Sha256();

    void update(const uint8_t* data, size_t n);
    void update(const std::string& s) {
        update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    }

    // Finalizes the digest. The object must not be updated afterwards.
    std::array<uint8_t, 32> finish();
    std::string finish_hex();

private:
    void compress(const uint8_t block[64]);

    uint32_t state_[8];
    uint8_t buf_[64];
    size_t buf_len_{0};
    uint64_t total_len_{0};
};

std::string sha256_hex(const std::string& s);
std::string to_hex(const uint8_t* data, size_t n);

// Constant-time equality for comparing tokens.
bool constant_time_eq(const std::string& a, const std::string& b);

} // namespace execq
