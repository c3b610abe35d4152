#pragma once

// ============================================================
// deploy_app.hpp -- cargoline commands: deploy, validate, cache, resume
// ============================================================

#include "run_config.hpp"
#include "../scheduler/transfer_scheduler.hpp"
#include <string>
#include <vector>

struct DeployOptions {
    std::string config_path;
    int         max_concurrent{TransferScheduler::DEFAULT_CONCURRENCY};
    bool        no_cache{false};
    bool        clear_cache{false};
    bool        skip_host_verification{false};
    std::string state_dir;          // overrides the config's state_dir
    bool        verbose{false};
};

class DeployApp {
public:
    explicit DeployApp(DeployOptions opts);

    // Exit codes: 0 every target succeeded, 1 a target failed or the
    // config is unusable. Fatal errors propagate as exceptions.
    int deploy();

    int validate();

    // Cache statistics; optionally clear the store or re-hash every entry
    int cache(bool clear, bool verify);

    // Pending partial transfers; purge_days > 0 purges older records first
    int resume(int purge_days);

    // One line per outcome, failures with their kind and attempted methods
    static void print_summary(const std::vector<TransferOutcome>& outcomes);

private:
    std::string state_dir(const RunConfig* cfg) const;
    void setup_logging(const std::string& state_dir) const;

    DeployOptions opts_;
};
