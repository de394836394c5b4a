#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include "fedrelay/logging.hpp"

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Keep retry and fail-open warnings out of test output
    fedrelay::Logger::getInstance().set_level(fedrelay::LogLevel::CRITICAL);

    return RUN_ALL_TESTS();
}
