#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>

namespace gitsnip {

// FIPS 180-4 SHA-256. Used as the digest behind every cache key.
class SHA256 {
public:
    using Digest = std::array<uint8_t, 32>;

    SHA256();

    void update(const uint8_t* data, size_t len);
    void update(const std::string& s);

    // Object must not be fed again after finalize().
    Digest finalize();

    static std::string hash_hex(const std::string& input);

    // First `len` hex characters of hash_hex(input)
    static std::string short_hex(const std::string& input, size_t len = 8);

    static std::string to_hex(const Digest& digest);

private:
    void compress(const uint8_t* block);

    std::array<uint32_t, 8> h_;
    std::array<uint8_t, 64> pending_;
    size_t pending_len_ = 0;
    uint64_t length_ = 0;
};

} // namespace gitsnip
