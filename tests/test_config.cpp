#include <cstdlib>
#include <stdexcept>

#include "weft/config.h"
#include "weft/tensor/tensor_data.h"
#include <gtest/gtest.h>

using namespace weft;

class ConfigTest : public ::testing::Test {
  protected:
    void SetUp() override { clearEnvironment(); }

    void TearDown() override {
        clearEnvironment();
        Logger::setMinLogLevel(LogLevel::INFO);
        Logger::setLogOutput(LogOutput::CONSOLE);
    }

    static void clearEnvironment() {
        unsetenv("WEFT_LOG_LEVEL");
        unsetenv("WEFT_LOG_OUTPUT");
        unsetenv("WEFT_LOG_FILE");
        unsetenv("WEFT_SEED");
    }
};

// ============================================================================
// Defaults
// ============================================================================

TEST_F(ConfigTest, DefaultsWithEmptyEnvironment) {
    Config config = Config::fromEnvironment();
    EXPECT_EQ(config.logLevel, LogLevel::INFO);
    EXPECT_EQ(config.logOutput, LogOutput::CONSOLE);
    EXPECT_FALSE(config.logFile.has_value());
    EXPECT_EQ(config.seed, 42u);
}

TEST_F(ConfigTest, EmptyVariableCountsAsUnset) {
    setenv("WEFT_LOG_LEVEL", "", 1);
    EXPECT_EQ(Config::fromEnvironment().logLevel, LogLevel::INFO);
}

// ============================================================================
// Parsing
// ============================================================================

TEST_F(ConfigTest, ReadsLogLevelCaseInsensitive) {
    setenv("WEFT_LOG_LEVEL", "Debug", 1);
    EXPECT_EQ(Config::fromEnvironment().logLevel, LogLevel::DEBUG);
}

TEST_F(ConfigTest, ReadsLogOutput) {
    setenv("WEFT_LOG_OUTPUT", "file", 1);
    EXPECT_EQ(Config::fromEnvironment().logOutput, LogOutput::FILE);
}

TEST_F(ConfigTest, LogFileImpliesBoth) {
    setenv("WEFT_LOG_OUTPUT", "console", 1);
    setenv("WEFT_LOG_FILE", "/tmp/weft.log", 1);

    Config config = Config::fromEnvironment();
    ASSERT_TRUE(config.logFile.has_value());
    EXPECT_EQ(*config.logFile, "/tmp/weft.log");
    EXPECT_EQ(config.logOutput, LogOutput::BOTH);
}

TEST_F(ConfigTest, ReadsSeed) {
    setenv("WEFT_SEED", "1234", 1);
    EXPECT_EQ(Config::fromEnvironment().seed, 1234u);
}

TEST_F(ConfigTest, RejectsUnknownLogLevel) {
    setenv("WEFT_LOG_LEVEL", "verbose", 1);
    EXPECT_THROW((void)Config::fromEnvironment(), std::invalid_argument);
}

TEST_F(ConfigTest, RejectsUnknownLogOutput) {
    EXPECT_THROW((void)parseLogOutput("syslog"), std::invalid_argument);
}

TEST_F(ConfigTest, RejectsMalformedSeed) {
    setenv("WEFT_SEED", "12abc", 1);
    EXPECT_THROW((void)Config::fromEnvironment(), std::invalid_argument);

    setenv("WEFT_SEED", "seed", 1);
    EXPECT_THROW((void)Config::fromEnvironment(), std::invalid_argument);
}

// ============================================================================
// Apply
// ============================================================================

TEST_F(ConfigTest, ApplySetsLoggerLevel) {
    Config config;
    config.logLevel = LogLevel::WARNING;
    config.apply();
    EXPECT_EQ(Logger::minLogLevel(), LogLevel::WARNING);
}

TEST_F(ConfigTest, SameSeedSamplesSameIndex) {
    Config config;
    config.seed = 7;
    TensorData t(std::vector<double>(60, 0.0), {3, 4, 5});

    auto first = config.makeRandomEngine();
    auto second = config.makeRandomEngine();
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(t.sample(first), t.sample(second));
    }
}
