// ============================================================
// deploy_app.cpp -- cargoline command implementations
// ============================================================

#include "deploy_app.hpp"
#include "../cache/artifact_packer.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/tui.hpp"
#include "../common/utils.hpp"
#include "../transport/ssh_session.hpp"
#include <iomanip>
#include <iostream>

static const char* kDefaultStateDir = "~/.cargoline";

DeployApp::DeployApp(DeployOptions opts) : opts_(std::move(opts)) {
    if (opts_.verbose) Logger::get().set_level(LogLevel::DEBUG);
}

std::string DeployApp::state_dir(const RunConfig* cfg) const {
    std::string dir = !opts_.state_dir.empty() ? opts_.state_dir
                    : cfg ? cfg->state_dir : std::string(kDefaultStateDir);
    return utils::expand_user(dir);
}

void DeployApp::setup_logging(const std::string& dir) const {
    fs::create_directories(dir);
    Logger::get().set_log_file((fs::path(dir) / "cargoline.log").string());
    Logger::get().set_transfer_error_file((fs::path(dir) / "transfer_errors.log").string());
}

int DeployApp::validate() {
    RunConfig cfg = RunConfig::load(opts_.config_path);
    auto problems = cfg.validate();
    if (!problems.empty()) {
        for (const auto& p : problems) LOG_ERROR("Invalid configuration: " + p);
        return 1;
    }
    std::cout << "Configuration OK: " << cfg.targets.size() << " target(s), artifact "
              << cfg.artifact.local_path << " -> " << cfg.artifact.remote_path << "\n";
    for (const auto& t : cfg.targets) {
        std::cout << "  " << t.target.label()
                  << (has_post_action(select_post_action(cfg.post, t.post)) ? "  (post action)" : "")
                  << "\n";
    }
    return 0;
}

int DeployApp::deploy() {
    RunConfig cfg = RunConfig::load(opts_.config_path);
    auto problems = cfg.validate();
    if (!problems.empty()) {
        for (const auto& p : problems) LOG_ERROR("Invalid configuration: " + p);
        return 1;
    }

    std::string dir = state_dir(&cfg);
    setup_logging(dir);
    LOG_INFO("State directory: " + dir);

    // ---- artifact ----
    ArtifactCache cache((fs::path(dir) / "cache").string());
    if (opts_.clear_cache) cache.clear();
    ArtifactPacker packer(cache);
    PackResult pack = packer.prepare(cfg.artifact.local_path, cfg.artifact.source, opts_.no_cache);
    LOG_INFO("Artifact " + pack.entry.local_path + " (" + utils::format_bytes(pack.entry.size_bytes) +
             (pack.rebuilt ? ", rebuilt" : ", cached") + ")");

    // ---- transport ----
    SshConfig ssh_config = SshConfig::load(cfg.ssh_config);
    CredentialResolver resolver;

    SshOptions sopts;
    sopts.known_hosts     = cfg.known_hosts;
    sopts.verify_host_key = !opts_.skip_host_verification;
    SshSessionOpener opener(sopts);

    ResumeStore store((fs::path(dir) / "resume").string());

    std::vector<TransferTask> tasks;
    std::vector<PostAction> actions;
    for (const auto& tc : cfg.targets) {
        tasks.push_back(TransferTask{tc.target, pack.entry.local_path, cfg.artifact.remote_path});
        actions.push_back(select_post_action(cfg.post, tc.post));
    }

    SchedulerOptions sched_opts;
    sched_opts.retention_s = (u64)cfg.retention_days * 24 * 3600;
    TransferScheduler scheduler(resolver, opener, store, cfg.transport, &ssh_config, sched_opts);
    scheduler.set_post_transfer([&actions](size_t i, const TransferTask& t, RemoteSession& s) {
        run_post_action(actions[i], s, t.remote_path);
    });

    TransferStats stats;
    scheduler.set_stats(&stats);
    Tui tui(stats);
    bool tty = Tui::is_tty();
    // The display owns the terminal while it runs; the log file keeps everything
    if (tty) Logger::get().set_console(false);
    tui.start();
    std::vector<TransferOutcome> outcomes = scheduler.run(tasks, opts_.max_concurrent);
    tui.stop();
    if (tty) Logger::get().set_console(true);

    print_summary(outcomes);
    for (const auto& o : outcomes) {
        if (!o.success) return 1;
    }
    return 0;
}

void DeployApp::print_summary(const std::vector<TransferOutcome>& outcomes) {
    size_t ok = 0;
    std::cout << "\n";
    for (const auto& o : outcomes) {
        if (o.success) {
            ++ok;
            std::cout << "  OK    " << o.target << "  " << utils::format_bytes(o.bytes_sent);
            if (o.resumed_from) std::cout << " (resumed at " << utils::format_bytes(o.resumed_from) << ")";
            std::cout << "\n";
            continue;
        }
        std::cout << "  FAIL  " << o.target << "  " << error_kind_str(o.error_kind) << ": " << o.error << "\n";
        if (!o.attempted_methods.empty()) {
            std::cout << "        tried:";
            for (const auto& m : o.attempted_methods) std::cout << " " << m;
            std::cout << "\n";
        }
        if (!o.partial_stderr.empty()) std::cout << "        stderr: " << utils::trim(o.partial_stderr) << "\n";
        else if (!o.partial_stdout.empty()) std::cout << "        stdout: " << utils::trim(o.partial_stdout) << "\n";
    }
    std::cout << "\n" << ok << "/" << outcomes.size() << " target(s) succeeded\n";
}

int DeployApp::cache(bool clear, bool verify) {
    std::string dir = state_dir(nullptr);
    ArtifactCache cache((fs::path(dir) / "cache").string());
    if (clear) {
        cache.clear();
        std::cout << "Cache cleared: " << cache.dir() << "\n";
        return 0;
    }

    auto entries = cache.entries();
    std::cout << "Cache: " << cache.dir() << "\n"
              << "  entries: " << entries.size() << "\n"
              << "  total:   " << utils::format_bytes(cache.total_size()) << "\n";
    int rc = 0;
    for (const auto& e : entries) {
        std::cout << "  " << e.sha256.substr(0, 16) << "  " << std::setw(10)
                  << utils::format_bytes(e.size_bytes) << "  " << e.local_path;
        if (verify) {
            bool good = cache.verify(e.local_path);
            std::cout << (good ? "  [ok]" : "  [stale]");
            if (!good) rc = 1;
        }
        std::cout << "\n";
    }
    return rc;
}

int DeployApp::resume(int purge_days) {
    std::string dir = state_dir(nullptr);
    ResumeStore store((fs::path(dir) / "resume").string());
    if (purge_days > 0) {
        size_t n = store.purge_older_than((u64)purge_days * 24 * 3600);
        std::cout << "Purged " << n << " record(s) older than " << purge_days << " day(s)\n";
    }

    auto records = store.list();
    if (records.empty()) {
        std::cout << "No pending transfers\n";
        return 0;
    }
    std::cout << "Pending transfers (" << records.size() << "):\n";
    for (const auto& r : records) {
        std::cout << "  " << r.resume_key << "  " << r.remote_host << ":" << r.remote_path
                  << "  " << utils::format_bytes(r.transferred_bytes) << "/"
                  << utils::format_bytes(r.total_bytes)
                  << " (" << utils::format_percent(r.transferred_bytes, r.total_bytes) << ")"
                  << "  " << r.local_path << "\n";
    }
    return 0;
}
