// ============================================================
// resumable_upload.cpp -- Resume check, transfer, checkpoints
// ============================================================

#include "resumable_upload.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"

ResumableUpload::ResumableUpload(ResumeStore& store, RemoteSession& session,
                                 std::function<void(u64, u64)> progress)
    : store_(store), session_(session), progress_(std::move(progress)) {}

UploadResult ResumableUpload::run(const std::string& local_path,
                                  const std::string& remote_host,
                                  const std::string& remote_path) {
    auto st = file_io::stat_file(local_path);
    if (!st) {
        throw TransferError("local file not found: " + local_path);
    }
    const std::string tag = "[" + remote_host + "] ";
    const std::string key = ResumeStore::make_key(local_path, remote_host, remote_path);

    UploadResult res;
    res.total_bytes = st->size;

    // ---- decide the starting offset ----
    u64 offset = 0;
    ResumeLookup found = store_.load_resumable(key, *st);
    if (found.record && found.record->transferred_bytes > 0) {
        offset = found.record->transferred_bytes;
        auto remote = session_.remote_size(remote_path);
        if (!remote || *remote < offset) {
            LOG_INFO(tag + "Remote partial file " + remote_path + " is " +
                     (remote ? utils::format_bytes(*remote) : std::string("missing")) +
                     ", expected " + utils::format_bytes(offset) + "; restarting at 0");
            store_.remove(key);
            offset = 0;
        }
    }

    if (offset > 0 && offset == st->size) {
        // Fully sent before, only the cleanup was lost
        LOG_INFO(tag + remote_path + " already complete, nothing to resume");
        store_.remove(key);
        res.resumed_from = offset;
        if (progress_) progress_(offset, st->size);
        return res;
    }

    ResumeRecord rec;
    rec.resume_key        = key;
    rec.local_path        = file_io::normalize_path(local_path);
    rec.remote_host       = remote_host;
    rec.remote_path       = remote_path;
    rec.transferred_bytes = offset;
    rec.total_bytes       = st->size;
    rec.local_mtime       = st->mtime_ns;

    bool track = st->size > 0;
    if (track) store_.save(rec);

    if (offset > 0) {
        LOG_INFO(tag + "Resuming " + remote_path + " from " + utils::format_bytes(offset) +
                 " (" + utils::format_percent(offset, st->size) + ")");
    } else {
        LOG_INFO(tag + "Uploading " + rec.local_path + " -> " + remote_path +
                 " (" + utils::format_bytes(st->size) + ")");
    }
    res.resumed_from = offset;

    u64 start_ms = utils::now_ms();
    ChunkAckFn on_ack = [&](u64 acked) {
        if (progress_) progress_(acked, st->size);
        if (!track || acked <= rec.transferred_bytes) return;
        rec.transferred_bytes = acked;
        try {
            store_.save(rec);
        } catch (const std::exception& e) {
            LOG_WARN(tag + "Cannot checkpoint progress: " + std::string(e.what()));
        }
    };

    // TransferError propagates with the last checkpoint left in place
    res.bytes_sent = session_.transfer_file(local_path, remote_path, offset, on_ack);

    if (track) store_.remove(key);

    u64 elapsed = utils::now_ms() - start_ms;
    double speed = elapsed > 0 ? (double)res.bytes_sent * 1000.0 / (double)elapsed : 0.0;
    LOG_INFO(tag + "Upload complete: " + utils::format_bytes(res.bytes_sent) + " in " +
             utils::format_duration_s(elapsed / 1000) + " (" + utils::format_speed(speed) + ")");
    return res;
}
