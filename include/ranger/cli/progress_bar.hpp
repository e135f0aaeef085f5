// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace ranger::cli {

// Minimal progress bar for the CLI, drawn on stderr
class ProgressBar {
public:
    ProgressBar(std::uint64_t total, std::string_view label = {});

    // Update progress; speed is derived from elapsed time
    void update(std::uint64_t current) noexcept;

    // Finish the progress bar
    void finish() noexcept;

    // Clear the progress bar line
    void clear() noexcept;

    [[nodiscard]] static std::string format_speed(std::uint64_t bps) noexcept;
    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes) noexcept;
    [[nodiscard]] static std::string format_time(std::uint64_t seconds) noexcept;

private:
    [[nodiscard]] std::string render_bar(double percent) const noexcept;

    std::uint64_t total_{0};
    std::uint64_t current_{0};
    int last_percent_{-1};
    std::string label_;
    bool finished_{false};
    std::chrono::steady_clock::time_point start_;
};

} // namespace ranger::cli
