// ============================================================
// app/main.cpp -- cargoline entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "deploy_app.hpp"
#include <iostream>
#include <string>
#include <cstdlib>
#include <cstring>
#include <csignal>

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <command> [options]\n"
        << "\nCommands:\n"
        << "  deploy   -c FILE   transfer the artifact to every target, then run post actions\n"
        << "  validate -c FILE   check a configuration file\n"
        << "  cache              show cached artifacts\n"
        << "  resume             show pending partial transfers\n"
        << "\nOptions:\n"
        << "  -c, --config FILE          run configuration (JSON)\n"
        << "  --max-concurrent N         parallel targets, 1-10 (default: 2)\n"
        << "  --no-cache                 rebuild the artifact even if cached\n"
        << "  --clear-cache              drop the artifact cache before deploying\n"
        << "  --skip-host-verification   do not check or record SSH host keys\n"
        << "  --state-dir DIR            cache/resume/log directory (default: ~/.cargoline)\n"
        << "  --clear                    (cache) remove the cache\n"
        << "  --verify                   (cache) re-hash every cached artifact\n"
        << "  --purge-days N             (resume) purge records older than N days\n"
        << "  --verbose                  enable debug logging\n"
        << "\nExit status: 0 all targets succeeded, 1 a target failed or bad usage, 2 fatal error\n"
        << "\nExamples:\n"
        << "  " << prog << " deploy -c deploy.json --max-concurrent 4\n"
        << "  " << prog << " resume --purge-days 3\n";
}

static bool parse_int_arg(const char* s, int& out) {
    try {
        u64 v = utils::parse_u64(s);
        if (v > 1000000) return false;
        out = (int)v;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

int main(int argc, char* argv[]) {
    // Broken SSH connections must surface as errors, not kill the process
    signal(SIGPIPE, SIG_IGN);

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }
    std::string command = argv[1];
    if (command == "-h" || command == "--help" || command == "help") {
        print_usage(argv[0]);
        return 0;
    }

    DeployOptions opts;
    bool cache_clear = false;
    bool cache_verify = false;
    int  purge_days = 0;

    for (int i = 2; i < argc; ++i) {
        if ((std::strcmp(argv[i], "-c") == 0 || std::strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--max-concurrent") == 0 && i + 1 < argc) {
            if (!parse_int_arg(argv[++i], opts.max_concurrent)) {
                std::cerr << "ERROR: Invalid --max-concurrent: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--no-cache") == 0) {
            opts.no_cache = true;
        } else if (std::strcmp(argv[i], "--clear-cache") == 0) {
            opts.clear_cache = true;
        } else if (std::strcmp(argv[i], "--skip-host-verification") == 0) {
            opts.skip_host_verification = true;
        } else if (std::strcmp(argv[i], "--state-dir") == 0 && i + 1 < argc) {
            opts.state_dir = argv[++i];
        } else if (std::strcmp(argv[i], "--clear") == 0) {
            cache_clear = true;
        } else if (std::strcmp(argv[i], "--verify") == 0) {
            cache_verify = true;
        } else if (std::strcmp(argv[i], "--purge-days") == 0 && i + 1 < argc) {
            if (!parse_int_arg(argv[++i], purge_days) || purge_days <= 0) {
                std::cerr << "ERROR: Invalid --purge-days: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            opts.verbose = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if ((command == "deploy" || command == "validate") && !utils::validate_path(opts.config_path)) {
        std::cerr << "ERROR: " << command << " requires -c FILE\n";
        return 1;
    }

    try {
        DeployApp app(opts);
        if (command == "deploy")   return app.deploy();
        if (command == "validate") return app.validate();
        if (command == "cache")    return app.cache(cache_clear, cache_verify);
        if (command == "resume")   return app.resume(purge_days);
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
}
