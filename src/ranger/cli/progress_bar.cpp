// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ranger/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace ranger::cli {

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::uint64_t total, std::string_view label)
    : total_(total)
    , label_(label)
    , start_(std::chrono::steady_clock::now()) {}

void ProgressBar::update(std::uint64_t current) noexcept {
    if (total_ == 0) return;

    current_ = std::min(current, total_);
    double percent = static_cast<double>(current_) * 100.0 / static_cast<double>(total_);
    percent = std::clamp(percent, 0.0, 100.0);

    // Only redraw on whole-percent steps
    int pct_int = static_cast<int>(percent);
    if (pct_int <= last_percent_ && !finished_) return;
    last_percent_ = pct_int;

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_).count();
    std::uint64_t speed_bps = elapsed > 0
        ? static_cast<std::uint64_t>(static_cast<double>(current_) * 1000.0 / static_cast<double>(elapsed))
        : 0;

    std::string line = "\r";
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    line += render_bar(percent);

    line += " ";
    if (pct_int < 10) line += " ";
    if (pct_int < 100) line += " ";
    line += std::to_string(pct_int) + "%";

    line += " (";
    line += format_bytes(current_);
    line += "/";
    line += format_bytes(total_);
    line += ")";

    if (speed_bps > 0) {
        line += " @ ";
        line += format_speed(speed_bps);
    }

    std::uint64_t remaining = total_ - current_;
    if (speed_bps > 0 && remaining > 0) {
        line += " ETA: ";
        line += format_time(remaining / speed_bps);
    }

    // Clear rest of line
    line += std::string(10, ' ');

    std::cerr << line << std::flush;
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    finished_ = true;
    update(total_);
    std::cerr << std::endl;
}

void ProgressBar::clear() noexcept {
    std::cerr << "\r" << std::string(80, ' ') << "\r" << std::flush;
}

std::string ProgressBar::render_bar(double percent) const noexcept {
    constexpr int bar_width = 30;
    const int filled = static_cast<int>(std::round(bar_width * percent / 100.0));
    const int empty = bar_width - filled;

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    bar += '>';
    bar.append(static_cast<std::size_t>(std::max(empty, 0)), ' ');
    bar += "]";
    return bar;
}

std::string ProgressBar::format_speed(std::uint64_t bps) noexcept {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1);
    if (bps >= GB) {
        ss << (static_cast<double>(bps) / GB) << " GB/s";
    } else if (bps >= MB) {
        ss << (static_cast<double>(bps) / MB) << " MB/s";
    } else if (bps >= KB) {
        ss << (static_cast<double>(bps) / KB) << " KB/s";
    } else {
        return std::to_string(bps) + " B/s";
    }
    return ss.str();
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) noexcept {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;
    constexpr std::uint64_t TB = 1024 * GB;

    std::ostringstream ss;
    if (bytes >= TB) {
        ss << std::fixed << std::setprecision(2) << (static_cast<double>(bytes) / TB) << " TB";
    } else if (bytes >= GB) {
        ss << std::fixed << std::setprecision(2) << (static_cast<double>(bytes) / GB) << " GB";
    } else if (bytes >= MB) {
        ss << std::fixed << std::setprecision(1) << (static_cast<double>(bytes) / MB) << " MB";
    } else if (bytes >= KB) {
        ss << std::fixed << std::setprecision(0) << (static_cast<double>(bytes) / KB) << " KB";
    } else {
        return std::to_string(bytes) + " B";
    }
    return ss.str();
}

std::string ProgressBar::format_time(std::uint64_t seconds) noexcept {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    if (hours > 0) {
        std::ostringstream ss;
        ss << hours << "h " << std::setfill('0') << std::setw(2) << minutes << "m "
           << std::setw(2) << secs << "s";
        return ss.str();
    } else if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

} // namespace ranger::cli
