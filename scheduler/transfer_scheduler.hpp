#pragma once

// ============================================================
// transfer_scheduler.hpp -- Bounded-concurrency multi-target transfer
//
// One task per target. Each task runs, inside one worker slot:
//   resolve -> open -> resume check -> transfer -> post hook -> close
// A failing task only affects its own outcome.
// ============================================================

#include "../common/errors.hpp"
#include "../common/tui.hpp"
#include "../transport/credentials.hpp"
#include "../transport/remote_session.hpp"
#include "../transport/resume_store.hpp"
#include <functional>
#include <string>
#include <vector>

struct TransferTask {
    Target      target;
    std::string local_path;
    std::string remote_path;
};

struct TransferOutcome {
    std::string target;                 // Target::label()
    bool        success{false};
    u64         bytes_sent{0};
    u64         resumed_from{0};
    ErrorKind   error_kind{ErrorKind::NONE};
    std::string error;
    std::vector<std::string> attempted_methods;   // AUTHENTICATION only
    std::string partial_stdout;                   // EXECUTION only: output captured
    std::string partial_stderr;                   // before the command failed
};

// Called with the session still open after a successful transfer.
// Throw PostActionFailed / ExecutionError to fail the task.
using PostTransferFn = std::function<void(size_t task_index, const TransferTask&, RemoteSession&)>;

struct SchedulerOptions {
    u64  retention_s{7ULL * 24 * 3600};   // resume record age limit
    bool purge_before_run{true};
};

class TransferScheduler {
public:
    static constexpr int MIN_CONCURRENCY     = 1;
    static constexpr int MAX_CONCURRENCY     = 10;
    static constexpr int DEFAULT_CONCURRENCY = 2;

    // ssh_config may be null. All references must outlive the scheduler.
    TransferScheduler(const CredentialResolver& resolver,
                      SessionOpener& opener,
                      ResumeStore& store,
                      TransportOptions global,
                      const SshConfig* ssh_config,
                      SchedulerOptions opts = SchedulerOptions());

    void set_post_transfer(PostTransferFn fn) { post_ = std::move(fn); }

    // Optional shared counters for the progress display
    void set_stats(TransferStats* stats) { stats_ = stats; }

    // Clamp to [MIN_CONCURRENCY, MAX_CONCURRENCY], warning when adjusted
    static int clamp_concurrency(int requested);

    // Run every task; returns one outcome per task, in task order
    std::vector<TransferOutcome> run(const std::vector<TransferTask>& tasks,
                                     int max_concurrency = DEFAULT_CONCURRENCY);

private:
    TransferOutcome run_one(size_t index, const TransferTask& task);

    const CredentialResolver& resolver_;
    SessionOpener&            opener_;
    ResumeStore&              store_;
    TransportOptions          global_;
    const SshConfig*          ssh_config_;
    SchedulerOptions          opts_;
    PostTransferFn            post_;
    TransferStats*            stats_{nullptr};
};
