#pragma once

// ============================================================
// tui.hpp -- ANSI progress display for a multi-target run
// ============================================================

#include "../common/platform.hpp"
#include <string>
#include <atomic>
#include <thread>
#include <mutex>
#include <vector>
#include <chrono>
#include <set>

// Counters shared between scheduler workers and the display
struct TransferStats {
    std::atomic<u64> bytes_sent{0};      // acknowledged, all targets
    std::atomic<u64> bytes_total{0};
    std::atomic<u32> targets_done{0};    // succeeded
    std::atomic<u32> targets_failed{0};
    std::atomic<u32> targets_total{0};

    void add_active(const std::string& label) {
        std::lock_guard<std::mutex> lk(active_mutex_);
        active_.insert(label);
    }
    void remove_active(const std::string& label) {
        std::lock_guard<std::mutex> lk(active_mutex_);
        active_.erase(label);
    }
    std::vector<std::string> active() const {
        std::lock_guard<std::mutex> lk(active_mutex_);
        return std::vector<std::string>(active_.begin(), active_.end());
    }

private:
    mutable std::mutex    active_mutex_;
    std::set<std::string> active_;
};

class Tui {
public:
    explicit Tui(TransferStats& stats);
    ~Tui();

    // Start background refresh thread (100ms interval)
    void start();

    // Stop and print final line
    void stop();

    // Render one frame to stdout
    void render();

    static bool is_tty();

private:
    TransferStats& stats_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    bool stopped_{false};

    // For speed calculation
    u64 last_bytes_{0};
    std::chrono::steady_clock::time_point last_time_;
    double smooth_speed_{0.0};

    // Non-TTY output is throttled to one summary line per interval
    std::chrono::steady_clock::time_point last_plain_;

    // Track number of lines printed for cursor-up overwrite
    int lines_printed_{0};

    void clear_lines(int n);
    std::string build_progress_bar(double pct, int width) const;
};
