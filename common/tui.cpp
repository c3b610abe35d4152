// ============================================================
// tui.cpp -- ANSI progress display implementation
// ============================================================

#include "tui.hpp"
#include "../common/utils.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <cstdio>

#include <unistd.h>

static const int kPlainIntervalS = 5;

bool Tui::is_tty() {
    return isatty(fileno(stdout)) != 0;
}

Tui::Tui(TransferStats& stats)
    : stats_(stats)
    , last_time_(std::chrono::steady_clock::now())
    , last_plain_(std::chrono::steady_clock::now())
{}

Tui::~Tui() {
    stop();
}

void Tui::start() {
    if (running_.exchange(true)) return;
    stopped_ = false;
    thread_ = std::thread([this] {
        while (running_.load()) {
            render();
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });
}

void Tui::stop() {
    if (stopped_ || !running_.exchange(false)) return;
    if (thread_.joinable()) {
        thread_.join();
    }
    stopped_ = true;
    // Final frame, always printed
    last_plain_ = std::chrono::steady_clock::time_point{};
    render();
    std::cout.flush();
}

void Tui::clear_lines(int n) {
    for (int i = 0; i < n; ++i) {
        // Move cursor up one line, then clear line
        std::cout << "\x1b[A\x1b[2K";
    }
    if (n > 0) {
        std::cout << "\r";
        std::cout.flush();
    }
    lines_printed_ = 0;
}

std::string Tui::build_progress_bar(double pct, int width) const {
    if (width < 4) return "";
    int fill = (int)(pct / 100.0 * width);
    fill = utils::clamp(fill, 0, width);

    std::string bar = "[";
    for (int i = 0; i < width; ++i) {
        if (i < fill)          bar += '=';
        else if (i == fill)    bar += '>';
        else                   bar += ' ';
    }
    bar += "]";
    return bar;
}

void Tui::render() {
    auto now = std::chrono::steady_clock::now();
    double elapsed_s = std::chrono::duration<double>(now - last_time_).count();

    u64 bytes_sent  = stats_.bytes_sent.load();
    u64 bytes_total = stats_.bytes_total.load();
    u32 done        = stats_.targets_done.load();
    u32 failed      = stats_.targets_failed.load();
    u32 total       = stats_.targets_total.load();

    // Compute speed (EWMA)
    if (elapsed_s >= 0.05 && bytes_sent >= last_bytes_) {
        double instant_speed = (double)(bytes_sent - last_bytes_) / elapsed_s;
        if (last_bytes_ == 0) {
            smooth_speed_ = instant_speed;
        } else {
            smooth_speed_ = 0.7 * smooth_speed_ + 0.3 * instant_speed;
        }
        last_bytes_ = bytes_sent;
        last_time_  = now;
    }

    double pct = bytes_total > 0 ? (double)bytes_sent / bytes_total * 100.0 : 0.0;
    pct = utils::clamp(pct, 0.0, 100.0);

    std::string eta_str;
    if (smooth_speed_ > 0 && bytes_sent < bytes_total) {
        u64 remaining = bytes_total - bytes_sent;
        eta_str = "ETA " + utils::format_duration_s((u64)(remaining / smooth_speed_));
    }

    std::ostringstream ss;
    ss << std::fixed;

    // Line 1: Progress bar
    ss << build_progress_bar(pct, 40) << " " << std::setw(5) << std::setprecision(1) << pct << "%";
    std::string line1 = ss.str();
    ss.str("");

    // Line 2: Stats
    ss << "  Targets: " << done << " ok";
    if (failed) ss << ", " << failed << " failed";
    ss << " / " << total
       << "  Sent: " << utils::format_bytes(bytes_sent)
       << "/" << utils::format_bytes(bytes_total)
       << "  Speed: " << utils::format_speed(smooth_speed_);
    if (!eta_str.empty()) ss << "  " << eta_str;
    std::string line2 = ss.str();
    ss.str("");

    // Line 3: Targets in flight
    std::string current;
    for (const auto& a : stats_.active()) {
        if (!current.empty()) current += ", ";
        current += a;
    }
    if (current.size() > 70) {
        current = current.substr(0, 67) + "...";
    }
    std::string line3 = "  > " + current;

    if (!is_tty()) {
        if (now - last_plain_ < std::chrono::seconds(kPlainIntervalS)) return;
        last_plain_ = now;
        std::cout << line2 << "\n";
        std::cout.flush();
        return;
    }

    clear_lines(lines_printed_);
    std::cout << line1 << "\n" << line2 << "\n" << line3 << "\n";
    std::cout.flush();
    lines_printed_ = 3;
}
