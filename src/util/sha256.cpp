#include <gitsnip/sha256.hpp>
#include <cstring>

namespace gitsnip {

namespace {

// Round constants, FIPS 180-4 section 4.2.2
constexpr uint32_t kRound[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
};

// Initial hash value, FIPS 180-4 section 5.3.3
constexpr std::array<uint32_t, 8> kInit = {
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
    0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19
};

inline uint32_t rotr(uint32_t x, unsigned n) {
    return (x >> n) | (x << (32 - n));
}

inline uint32_t load_be32(const uint8_t* p) {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16)
         | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

inline void store_be32(uint8_t* p, uint32_t v) {
    for (int i = 3; i >= 0; --i) {
        p[i] = uint8_t(v);
        v >>= 8;
    }
}

} // namespace

SHA256::SHA256() : h_(kInit) {}

void SHA256::compress(const uint8_t* block) {
    uint32_t w[64];
    for (int t = 0; t < 16; ++t) {
        w[t] = load_be32(block + 4 * t);
    }
    for (int t = 16; t < 64; ++t) {
        uint32_t s0 = rotr(w[t - 15], 7) ^ rotr(w[t - 15], 18) ^ (w[t - 15] >> 3);
        uint32_t s1 = rotr(w[t - 2], 17) ^ rotr(w[t - 2], 19) ^ (w[t - 2] >> 10);
        w[t] = w[t - 16] + s0 + w[t - 7] + s1;
    }

    // v = {a, b, c, d, e, f, g, h}
    std::array<uint32_t, 8> v = h_;
    for (int t = 0; t < 64; ++t) {
        uint32_t e = v[4];
        uint32_t a = v[0];
        uint32_t sum1 = rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25);
        uint32_t choose = (e & v[5]) ^ (~e & v[6]);
        uint32_t t1 = v[7] + sum1 + choose + kRound[t] + w[t];
        uint32_t sum0 = rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22);
        uint32_t majority = (a & v[1]) ^ (a & v[2]) ^ (v[1] & v[2]);
        uint32_t t2 = sum0 + majority;

        for (int i = 7; i > 0; --i) v[i] = v[i - 1];
        v[4] += t1;
        v[0] = t1 + t2;
    }

    for (size_t i = 0; i < 8; ++i) h_[i] += v[i];
}

void SHA256::update(const uint8_t* data, size_t len) {
    length_ += len;
    while (len > 0) {
        if (pending_len_ == 0 && len >= pending_.size()) {
            compress(data);
            data += pending_.size();
            len -= pending_.size();
            continue;
        }
        size_t take = pending_.size() - pending_len_;
        if (take > len) take = len;
        std::memcpy(pending_.data() + pending_len_, data, take);
        pending_len_ += take;
        data += take;
        len -= take;
        if (pending_len_ == pending_.size()) {
            compress(pending_.data());
            pending_len_ = 0;
        }
    }
}

void SHA256::update(const std::string& s) {
    update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

SHA256::Digest SHA256::finalize() {
    const uint64_t bit_len = length_ * 8;

    // 0x80, zeros up to 56 mod 64, then the 64-bit big-endian bit length
    uint8_t tail[128] = {0};
    size_t tail_len = (pending_len_ < 56) ? 64 : 128;
    std::memcpy(tail, pending_.data(), pending_len_);
    tail[pending_len_] = 0x80;
    store_be32(tail + tail_len - 8, uint32_t(bit_len >> 32));
    store_be32(tail + tail_len - 4, uint32_t(bit_len));

    compress(tail);
    if (tail_len == 128) compress(tail + 64);
    pending_len_ = 0;

    Digest out;
    for (size_t i = 0; i < 8; ++i) {
        store_be32(out.data() + 4 * i, h_[i]);
    }
    return out;
}

std::string SHA256::to_hex(const Digest& digest) {
    static const char digits[] = "0123456789abcdef";
    std::string out(digest.size() * 2, '0');
    for (size_t i = 0; i < digest.size(); ++i) {
        out[2 * i] = digits[digest[i] >> 4];
        out[2 * i + 1] = digits[digest[i] & 0x0f];
    }
    return out;
}

std::string SHA256::hash_hex(const std::string& input) {
    SHA256 ctx;
    ctx.update(input);
    return to_hex(ctx.finalize());
}

std::string SHA256::short_hex(const std::string& input, size_t len) {
    return hash_hex(input).substr(0, len);
}

} // namespace gitsnip
