#include <gtest/gtest.h>
#include "logging.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Keep test output readable unless a level was asked for
    if (!pagecurl::logging::level_from_environment()) {
        pagecurl::logging::get_logger()->set_level(spdlog::level::warn);
    }

    return RUN_ALL_TESTS();
}
