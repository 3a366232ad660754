#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"

#include "vrlnc/utils/log.hpp"

namespace spd = spdlog;

GTEST_API_ int main(int argc, char** argv) {
    // console logger with color, picked up by vrlnc::logger()
    auto console = spd::stdout_color_mt(vrlnc::LOGGER_NAME);
    console->set_level(spd::level::warn);

    // SPDLOG_LEVEL=vrlnc=debug to watch rank changes
    vrlnc::load_log_levels_from_env();

    testing::InitGoogleMock(&argc, argv);

    //::testing::GTEST_FLAG(filter) = "NODES.*";
    return RUN_ALL_TESTS();
}
