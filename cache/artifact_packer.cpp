// ============================================================
// artifact_packer.cpp -- zstd packing of the transfer artifact
// ============================================================

#include "artifact_packer.hpp"
#include "../common/compress.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <stdexcept>

PackResult ArtifactPacker::prepare(const std::string& artifact, const std::string& source, bool force) {
    PackResult res;
    std::string dst = file_io::normalize_path(artifact);

    if (source.empty()) {
        if (!file_io::stat_file(dst)) {
            throw std::runtime_error("artifact not found: " + dst);
        }
        if (!force && !cache_.should_rebuild(dst)) {
            auto entry = cache_.lookup(dst);
            if (entry) {
                res.entry = *entry;
                return res;
            }
        }
        res.entry = cache_.record(dst);
        res.rebuilt = true;
        return res;
    }

    std::string src = file_io::normalize_path(source);
    auto src_st = file_io::stat_file(src);
    if (!src_st) {
        throw std::runtime_error("artifact source not found: " + src);
    }
    auto dst_st = file_io::stat_file(dst);

    bool rebuild = force || !dst_st || cache_.should_rebuild(dst) ||
                   src_st->mtime_ns > dst_st->mtime_ns;
    if (!rebuild) {
        auto entry = cache_.lookup(dst);
        if (entry) {
            LOG_INFO("Reusing cached artifact " + dst);
            res.entry = *entry;
            return res;
        }
    }

    LOG_INFO("Compressing " + src + " (" + utils::format_bytes(src_st->size) + ") -> " + dst);
    u64 start = utils::now_ms();
    file_io::ensure_parent_dirs(dst);
    std::string tmp = dst + ".tmp." + std::to_string(::getpid());
    try {
        u64 out = compress::compress_file(src, tmp);
        if (std::rename(tmp.c_str(), dst.c_str()) != 0) {
            throw std::runtime_error("rename " + tmp + " -> " + dst + " failed: " + strerror(errno));
        }
        LOG_INFO("Compressed to " + utils::format_bytes(out) + " in " +
                 std::to_string(utils::now_ms() - start) + " ms");
    } catch (const std::exception&) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw;
    }

    res.entry = cache_.record(dst);
    res.rebuilt = true;
    return res;
}
