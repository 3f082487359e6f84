#include <gtest/gtest.h>
#include "config/registry_config.hpp"
#include <cstdlib>

using namespace docreg::config;

class RegistryConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv(STORE_DIR_ENV);
        unsetenv(LOG_LEVEL_ENV);
    }

    void TearDown() override {
        unsetenv(STORE_DIR_ENV);
        unsetenv(LOG_LEVEL_ENV);
    }
};

TEST_F(RegistryConfigTest, Defaults) {
    RegistryConfig config = default_config();
    EXPECT_EQ(config.store_root, "./output");
    EXPECT_EQ(config.log_file, "docreg.log");
    EXPECT_EQ(config.log_level, docreg::logging::severity::info);
    EXPECT_FALSE(config.console_log);
    EXPECT_EQ(config.verifier_threads, 2u);
}

TEST_F(RegistryConfigTest, EnvironmentOverrides) {
    setenv(STORE_DIR_ENV, "/tmp/docreg-store", 1);
    setenv(LOG_LEVEL_ENV, "debug", 1);

    RegistryConfig config = default_config();
    EXPECT_EQ(config.store_root, "/tmp/docreg-store");
    EXPECT_EQ(config.log_level, docreg::logging::severity::debug);
}

// Empty values leave the defaults in place
TEST_F(RegistryConfigTest, EmptyEnvironmentIgnored) {
    setenv(STORE_DIR_ENV, "", 1);

    EXPECT_EQ(default_config().store_root, "./output");
}
