#include "config/Settings.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

using namespace money::config;

namespace {

void clear_money_env() {
    unsetenv("MONEY_ENV");
    unsetenv("MONEY_OUTPUT_FORMAT");
    unsetenv("MONEY_VERBOSE");
}

} // namespace

TEST(Settings, DefaultsAreReasonable) {
    Settings s;
    EXPECT_EQ(s.output.format, "text");
    EXPECT_FALSE(s.logging.verbose);
}

TEST(Settings, FromEnvironmentDefaultsToDevelopment) {
    clear_money_env();

    auto s = Settings::from_environment();
    auto dev = Settings::development();
    EXPECT_EQ(s.output.format, dev.output.format);
    EXPECT_EQ(s.logging.verbose, dev.logging.verbose);
}

TEST(Settings, FromEnvironmentSelectsProductionPreset) {
    clear_money_env();
    setenv("MONEY_ENV", "production", 1);

    auto s = Settings::from_environment();
    EXPECT_EQ(s.output.format, "json");
    EXPECT_FALSE(s.logging.verbose);

    clear_money_env();
}

TEST(Settings, FromEnvironmentReadsEnvVars) {
    clear_money_env();
    setenv("MONEY_OUTPUT_FORMAT", "inspect", 1);
    setenv("MONEY_VERBOSE", "false", 1);

    auto s = Settings::from_environment();
    EXPECT_EQ(s.output.format, "inspect");
    EXPECT_FALSE(s.logging.verbose);

    clear_money_env();
}

TEST(Settings, FromEnvironmentAcceptsNumericBooleans) {
    clear_money_env();
    setenv("MONEY_ENV", "production", 1);
    setenv("MONEY_VERBOSE", "1", 1);

    auto s = Settings::from_environment();
    EXPECT_TRUE(s.logging.verbose);

    clear_money_env();
}

TEST(Settings, FromEnvironmentHandlesInvalidValues) {
    clear_money_env();
    setenv("MONEY_OUTPUT_FORMAT", "xml", 1);
    setenv("MONEY_VERBOSE", "maybe", 1);

    auto s = Settings::from_environment();
    EXPECT_EQ(s.output.format, "text");  // Falls back to dev preset default
    EXPECT_TRUE(s.logging.verbose);

    clear_money_env();
}

TEST(Settings, DevelopmentPreset) {
    auto s = Settings::development();
    EXPECT_EQ(s.output.format, "text");
    EXPECT_TRUE(s.logging.verbose);
}

TEST(Settings, ProductionPreset) {
    auto s = Settings::production();
    EXPECT_EQ(s.output.format, "json");
    EXPECT_FALSE(s.logging.verbose);
}

TEST(Settings, KnownOutputFormats) {
    EXPECT_TRUE(is_known_output_format("text"));
    EXPECT_TRUE(is_known_output_format("json"));
    EXPECT_TRUE(is_known_output_format("inspect"));
    EXPECT_FALSE(is_known_output_format("JSON"));
    EXPECT_FALSE(is_known_output_format(""));
}
