#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

#include <gtest/gtest.h>
#include <iostream>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        // defaults only; a developer's ~/.config/lnk/config.yaml must not leak in
        lnk::config::ConfigRegistry::init(lnk::config::Config{});
        lnk::log::Registry::init();
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize lnk test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
