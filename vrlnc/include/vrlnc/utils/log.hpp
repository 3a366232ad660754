#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/null_sink.h>

namespace vrlnc {

inline constexpr const char* LOGGER_NAME = "vrlnc";

// the host may register its own "vrlnc" logger first; otherwise events go nowhere
inline std::shared_ptr<spdlog::logger> logger() {
    auto lg = spdlog::get(LOGGER_NAME);
    if (lg) return lg;
    try {
        return spdlog::null_logger_mt(LOGGER_NAME);
    } catch (const spdlog::spdlog_ex&) {
        // lost a registration race with another thread
        return spdlog::get(LOGGER_NAME);
    }
}

// SPDLOG_LEVEL=vrlnc=debug style overrides for already registered loggers
inline void load_log_levels_from_env() {
    spdlog::cfg::load_env_levels();
}

}
