// ============================================================
// transfer_scheduler.cpp -- Worker pool driving per-target sessions
// ============================================================

#include "transfer_scheduler.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/thread_pool.hpp"
#include "../common/utils.hpp"
#include "../transport/resumable_upload.hpp"
#include <algorithm>
#include <future>

// Keep transfer_errors.log lines bounded; newlines folded to spaces
static std::string clip_output(const std::string& text) {
    const size_t limit = 2048;
    std::string out = utils::trim(text.size() > limit ? text.substr(text.size() - limit) : text);
    std::replace(out.begin(), out.end(), '\n', ' ');
    if (text.size() > limit) out = "..." + out;
    return out;
}

TransferScheduler::TransferScheduler(const CredentialResolver& resolver,
                                     SessionOpener& opener,
                                     ResumeStore& store,
                                     TransportOptions global,
                                     const SshConfig* ssh_config,
                                     SchedulerOptions opts)
    : resolver_(resolver)
    , opener_(opener)
    , store_(store)
    , global_(std::move(global))
    , ssh_config_(ssh_config)
    , opts_(opts) {}

int TransferScheduler::clamp_concurrency(int requested) {
    int n = utils::clamp(requested, MIN_CONCURRENCY, MAX_CONCURRENCY);
    if (n != requested) {
        LOG_WARN("max concurrency " + std::to_string(requested) + " out of range [" +
                 std::to_string(MIN_CONCURRENCY) + ", " + std::to_string(MAX_CONCURRENCY) +
                 "], using " + std::to_string(n));
    }
    return n;
}

std::vector<TransferOutcome> TransferScheduler::run(const std::vector<TransferTask>& tasks,
                                                    int max_concurrency) {
    int workers = clamp_concurrency(max_concurrency);

    if (opts_.purge_before_run) {
        try {
            store_.purge_older_than(opts_.retention_s);
        } catch (const std::exception& e) {
            LOG_WARN("Resume record cleanup failed: " + std::string(e.what()));
        }
    }

    if (stats_) {
        stats_->targets_total += (u32)tasks.size();
        for (const auto& t : tasks) stats_->bytes_total += file_io::get_file_size(t.local_path);
    }

    LOG_INFO("Transferring to " + std::to_string(tasks.size()) + " target(s), " +
             std::to_string(workers) + " at a time");

    std::vector<TransferOutcome> outcomes(tasks.size());
    {
        ThreadPool pool((size_t)std::min<size_t>((size_t)workers, std::max<size_t>(tasks.size(), 1)));
        std::vector<std::future<TransferOutcome>> futures;
        futures.reserve(tasks.size());
        for (size_t i = 0; i < tasks.size(); ++i) {
            futures.push_back(pool.submit([this, i, &tasks] { return run_one(i, tasks[i]); }));
        }
        for (size_t i = 0; i < futures.size(); ++i) {
            outcomes[i] = futures[i].get();
        }
    }

    size_t ok = 0;
    for (const auto& o : outcomes) {
        if (o.success) ++ok;
    }
    LOG_INFO("Transfer finished: " + std::to_string(ok) + "/" + std::to_string(outcomes.size()) +
             " target(s) succeeded");
    return outcomes;
}

TransferOutcome TransferScheduler::run_one(size_t index, const TransferTask& task) {
    TransferOutcome out;
    out.target = task.target.label();
    if (stats_) stats_->add_active(out.target);

    u64 acked_here = 0;   // bytes credited to stats by this task
    auto progress = [&](u64 acked, u64 /*total*/) {
        if (!stats_ || acked <= acked_here) return;
        stats_->bytes_sent += acked - acked_here;
        acked_here = acked;
    };

    try {
        ResolvedTarget rt = resolver_.resolve(task.target, global_, ssh_config_);
        std::unique_ptr<RemoteSession> session = opener_.open(rt);

        std::string remote_host = rt.hostname + ":" + std::to_string(rt.port);
        ResumableUpload upload(store_, *session, progress);
        UploadResult r = upload.run(task.local_path, remote_host, task.remote_path);
        out.bytes_sent   = r.bytes_sent;
        out.resumed_from = r.resumed_from;

        if (post_) post_(index, task, *session);
        session->close();
        out.success = true;
    } catch (const AuthenticationExhausted& e) {
        out.error_kind = ErrorKind::AUTHENTICATION;
        out.error = e.what();
        out.attempted_methods = e.attempted();
    } catch (const ConnectionError& e) {
        out.error_kind = ErrorKind::CONNECTION;
        out.error = e.what();
    } catch (const TransferError& e) {
        out.error_kind = ErrorKind::TRANSFER;
        out.error = e.what();
        out.bytes_sent = e.bytes_sent();
    } catch (const PostActionFailed& e) {
        out.error_kind = ErrorKind::POST_ACTION;
        out.error = e.what();
    } catch (const ExecutionError& e) {
        out.error_kind = ErrorKind::EXECUTION;
        out.error = e.what();
        out.partial_stdout = e.partial_stdout();
        out.partial_stderr = e.partial_stderr();
    } catch (const std::exception& e) {
        out.error_kind = ErrorKind::INTERNAL;
        out.error = e.what();
    }

    if (stats_) {
        stats_->remove_active(out.target);
        if (out.success) ++stats_->targets_done;
        else             ++stats_->targets_failed;
    }
    if (out.success) {
        LOG_INFO("[" + out.target + "] done (" + utils::format_bytes(out.bytes_sent) + " sent" +
                 (out.resumed_from ? ", resumed at " + utils::format_bytes(out.resumed_from) : "") + ")");
    } else {
        std::string msg = std::string(error_kind_str(out.error_kind)) + ": " + out.error;
        if (!out.partial_stdout.empty()) msg += " | stdout: " + clip_output(out.partial_stdout);
        if (!out.partial_stderr.empty()) msg += " | stderr: " + clip_output(out.partial_stderr);
        Logger::get().transfer_error(out.target, msg);
    }
    return out;
}
