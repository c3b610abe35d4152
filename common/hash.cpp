// ============================================================
// hash.cpp -- SHA-256 via OpenSSL EVP
// ============================================================

#include "hash.hpp"
#include "file_io.hpp"

#include <openssl/evp.h>
#include <openssl/err.h>

namespace hash {

static std::string openssl_error(const char* what) {
    unsigned long code = ERR_get_error();
    char buf[256] = {0};
    if (code != 0) ERR_error_string_n(code, buf, sizeof(buf));
    return std::string(what) + " failed" + (code ? std::string(": ") + buf : std::string());
}

void Sha256Stream::CtxDeleter::operator()(evp_md_ctx_st* ctx) const noexcept {
    EVP_MD_CTX_free(ctx);
}

Sha256Stream::Sha256Stream() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) throw std::runtime_error(openssl_error("EVP_MD_CTX_new"));
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error(openssl_error("EVP_DigestInit_ex"));
    }
}

Sha256Stream::~Sha256Stream() = default;

void Sha256Stream::update(const void* data, size_t len) {
    if (len == 0) return;
    if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
        throw std::runtime_error(openssl_error("EVP_DigestUpdate"));
    }
}

Digest256 Sha256Stream::digest() {
    Digest256 out{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &len) != 1 || len != out.size()) {
        throw std::runtime_error(openssl_error("EVP_DigestFinal_ex"));
    }
    return out;
}

std::string sha256_file(const std::string& path) {
    // 8 MB slices keep the digest loop cache friendly on multi-GB artifacts
    static constexpr u64 SLICE = 8ULL * 1024 * 1024;

    file_io::MmapReader reader(path);
    Sha256Stream h;
    for (u64 off = 0; off < reader.size(); off += SLICE) {
        h.update(reader.chunk_ptr(off), (size_t)reader.chunk_len(off, SLICE));
    }
    Digest256 d = h.digest();
    return to_hex(d.data(), d.size());
}

std::string sha256_hex(const void* data, size_t len) {
    Sha256Stream h;
    h.update(data, len);
    Digest256 d = h.digest();
    return to_hex(d.data(), d.size());
}

} // namespace hash
