// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string_view>

namespace ranger::core {

// Shared "ranger" logger (stderr), created on first use
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

// trace, debug, info, warn, error, off. Returns false for an unknown name.
bool set_log_level(std::string_view level) noexcept;

} // namespace ranger::core
