#pragma once

// ============================================================
// hash.hpp -- xxHash3 keys and SHA-256 content digests
// ============================================================

#include "platform.hpp"
#include <cstddef>
#include <array>
#include <memory>
#include <string>
#include <stdexcept>

// We include xxhash.h with XXH_STATIC_LINKING_ONLY for the XXH3 API
#define XXH_STATIC_LINKING_ONLY
#include <xxhash.h>

struct evp_md_ctx_st;

namespace hash {

// 16-byte (128-bit) hash result
using Hash128 = std::array<u8, 16>;

// 32-byte SHA-256 digest
using Digest256 = std::array<u8, 32>;

// Compute xxh3_128 of a memory buffer, stored big-endian for determinism
inline Hash128 xxh3_128(const void* data, size_t len) {
    XXH128_hash_t h = XXH3_128bits(data, len);
    Hash128 result;
    for (int i = 0; i < 8; ++i) {
        result[(size_t)i]     = (u8)(h.high64 >> (56 - 8 * i));
        result[(size_t)i + 8] = (u8)(h.low64  >> (56 - 8 * i));
    }
    return result;
}

inline Hash128 xxh3_128(const std::string& s) {
    return xxh3_128(s.data(), s.size());
}

// Lowercase hex of 'len' bytes
inline std::string to_hex(const u8* b, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += digits[b[i] >> 4];
        out += digits[b[i] & 0x0f];
    }
    return out;
}

// First 8 bytes -> 16 hex chars (enough to be unique for file names)
inline std::string bytes_to_hex8(const Hash128& h) {
    return to_hex(h.data(), 8);
}

// Incremental SHA-256 over OpenSSL EVP
class Sha256Stream {
public:
    Sha256Stream();
    ~Sha256Stream();

    Sha256Stream(const Sha256Stream&) = delete;
    Sha256Stream& operator=(const Sha256Stream&) = delete;

    void update(const void* data, size_t len);
    Digest256 digest();

private:
    struct CtxDeleter {
        void operator()(evp_md_ctx_st* ctx) const noexcept;
    };
    std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
};

// Hex SHA-256 of a whole file; throws std::runtime_error if unreadable
std::string sha256_file(const std::string& path);

// Hex SHA-256 of a memory buffer
std::string sha256_hex(const void* data, size_t len);

} // namespace hash
