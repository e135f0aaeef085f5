// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ranger/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <string>

namespace ranger::core {

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;

    std::call_once(once, [] {
        instance = spdlog::get("ranger");
        if (!instance) {
            instance = spdlog::stderr_color_mt("ranger");
            instance->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] [t%t] %v");
            instance->set_level(spdlog::level::warn);
        }
    });
    return instance;
}

bool set_log_level(std::string_view level) noexcept {
    auto parsed = spdlog::level::from_str(std::string(level));
    // from_str maps unknown names to off; only accept that for "off" itself
    if (parsed == spdlog::level::off && level != "off") {
        return false;
    }
    logger()->set_level(parsed);
    return true;
}

} // namespace ranger::core
