#pragma once

// ============================================================
// compress.hpp -- zstd streaming file compression
// ============================================================

#include "platform.hpp"
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <vector>
#include <stdexcept>

#include <zstd.h>

namespace compress {

// Default level for artifacts: good ratio, still fast
static constexpr int ZSTD_LEVEL = 3;

struct CCtxDeleter {
    void operator()(ZSTD_CCtx* c) const noexcept { ZSTD_freeCCtx(c); }
};
struct DCtxDeleter {
    void operator()(ZSTD_DCtx* d) const noexcept { ZSTD_freeDCtx(d); }
};
struct FileCloser {
    void operator()(FILE* f) const noexcept { if (f) std::fclose(f); }
};
using FilePtr = std::unique_ptr<FILE, FileCloser>;

inline void check(size_t rc, const char* what) {
    if (ZSTD_isError(rc)) {
        throw std::runtime_error(std::string("ZSTD ") + what + " error: " + ZSTD_getErrorName(rc));
    }
}

inline FilePtr open_file(const std::string& path, const char* mode) {
    FilePtr f(std::fopen(path.c_str(), mode));
    if (!f) {
        throw std::runtime_error("Cannot open " + path + ": " + std::strerror(errno));
    }
    return f;
}

inline void write_all(FILE* f, const void* data, size_t len, const std::string& path) {
    if (len > 0 && std::fwrite(data, 1, len, f) != len) {
        throw std::runtime_error("write failed: " + path);
    }
}

// Compress src into dst as one zstd frame. dst is created or truncated.
// Returns the compressed size. Throws std::runtime_error.
inline u64 compress_file(const std::string& src, const std::string& dst, int level = ZSTD_LEVEL) {
    std::unique_ptr<ZSTD_CCtx, CCtxDeleter> cctx(ZSTD_createCCtx());
    if (!cctx) throw std::runtime_error("ZSTD_createCCtx failed");
    check(ZSTD_CCtx_setParameter(cctx.get(), ZSTD_c_compressionLevel, level), "setParameter");
    check(ZSTD_CCtx_setParameter(cctx.get(), ZSTD_c_checksumFlag, 1), "setParameter");

    FilePtr in  = open_file(src, "rb");
    FilePtr out = open_file(dst, "wb");

    std::vector<char> ibuf(ZSTD_CStreamInSize());
    std::vector<char> obuf(ZSTD_CStreamOutSize());
    u64 written = 0;

    for (;;) {
        size_t n = std::fread(ibuf.data(), 1, ibuf.size(), in.get());
        if (n == 0 && std::ferror(in.get())) {
            throw std::runtime_error("read failed: " + src);
        }
        bool last = n < ibuf.size();
        ZSTD_EndDirective mode = last ? ZSTD_e_end : ZSTD_e_continue;
        ZSTD_inBuffer input{ibuf.data(), n, 0};
        bool finished = false;
        do {
            ZSTD_outBuffer output{obuf.data(), obuf.size(), 0};
            size_t remaining = ZSTD_compressStream2(cctx.get(), &output, &input, mode);
            check(remaining, "compress");
            write_all(out.get(), obuf.data(), output.pos, dst);
            written += output.pos;
            finished = last ? (remaining == 0) : (input.pos == input.size);
        } while (!finished);
        if (last) break;
    }

    if (std::fflush(out.get()) != 0) throw std::runtime_error("flush failed: " + dst);
    return written;
}

// Inverse of compress_file. Returns the decompressed size.
inline u64 decompress_file(const std::string& src, const std::string& dst) {
    std::unique_ptr<ZSTD_DCtx, DCtxDeleter> dctx(ZSTD_createDCtx());
    if (!dctx) throw std::runtime_error("ZSTD_createDCtx failed");

    FilePtr in  = open_file(src, "rb");
    FilePtr out = open_file(dst, "wb");

    std::vector<char> ibuf(ZSTD_DStreamInSize());
    std::vector<char> obuf(ZSTD_DStreamOutSize());
    u64 written = 0;
    size_t last_rc = 0;

    size_t n;
    while ((n = std::fread(ibuf.data(), 1, ibuf.size(), in.get())) > 0) {
        ZSTD_inBuffer input{ibuf.data(), n, 0};
        bool out_full = false;
        while (input.pos < input.size || out_full) {
            ZSTD_outBuffer output{obuf.data(), obuf.size(), 0};
            last_rc = ZSTD_decompressStream(dctx.get(), &output, &input);
            check(last_rc, "decompress");
            write_all(out.get(), obuf.data(), output.pos, dst);
            written += output.pos;
            // A full output buffer may leave decoded bytes inside the context
            out_full = output.pos == output.size;
        }
    }
    if (std::ferror(in.get())) throw std::runtime_error("read failed: " + src);
    if (last_rc != 0) throw std::runtime_error("truncated zstd frame: " + src);
    return written;
}

} // namespace compress
