#include <gtest/gtest.h>
#include <iostream>

#include "crypto/util/encrypt.hpp"
#include "log/Registry.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        sm::crypto::util::ensure_sodium_init();

        sm::config::LoggingConfig quiet;
        quiet.console_log_level = spdlog::level::err;
        sm::log::Registry::init(quiet);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize secrets-manager test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
