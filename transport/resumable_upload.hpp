#pragma once

// ============================================================
// resumable_upload.hpp -- Upload with persisted, resumable progress
// ============================================================

#include "remote_session.hpp"
#include "resume_store.hpp"
#include <functional>
#include <string>

struct UploadResult {
    u64  bytes_sent{0};      // sent during this call
    u64  resumed_from{0};    // starting offset, 0 for a fresh upload
    u64  total_bytes{0};
};

class ResumableUpload {
public:
    // 'progress' (optional) sees every acknowledged total, for the display
    ResumableUpload(ResumeStore& store, RemoteSession& session,
                    std::function<void(u64 acked, u64 total)> progress = {});

    // Upload local_path to remote_path on the session's host.
    // remote_host is the identity that goes into the resume key.
    // Throws TransferError; the last checkpoint is kept for the next run.
    UploadResult run(const std::string& local_path,
                     const std::string& remote_host,
                     const std::string& remote_path);

private:
    ResumeStore& store_;
    RemoteSession& session_;
    std::function<void(u64, u64)> progress_;
};
