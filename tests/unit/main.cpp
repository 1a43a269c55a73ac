#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "logging/logger.hpp"

int main(int argc, char **argv) {
    // Initialize GoogleTest before anything else so --gtest_list_tests works
    // during CTest discovery.
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::InitGoogleMock(&argc, argv);

    // Expected failure paths log at WARN; keep test output readable
    skysync::logging::Logger::set_level(skysync::logging::Level::LVL_ERROR);
    return RUN_ALL_TESTS();
}
