#include <gtest/gtest.h>
#include <eyemap/log.hpp>
#include <iostream>

namespace {

// Keep expected per-pair warnings out of the test output
void quiet_log(eyemap::log::Level level, const char* message) {
    if (level == eyemap::log::Level::Error) {
        std::cerr << message << std::endl;
    }
}

} // namespace

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    std::cout << "=== Eyemap Test Suite ===" << std::endl;
    std::cout << "Running bottom-up component tests..." << std::endl;

    eyemap::log::set_log_callback(quiet_log);
    return RUN_ALL_TESTS();
}
