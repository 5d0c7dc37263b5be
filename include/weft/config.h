#pragma once
#include <cstdint>
#include <optional>
#include <random>
#include <string>

#include "weft/logger.h"

namespace weft {

/**
 * @brief Process-level settings read from the environment
 *
 * Recognised variables:
 *   WEFT_LOG_LEVEL   trace | debug | info | warning | error | fatal
 *   WEFT_LOG_OUTPUT  console | file | both
 *   WEFT_LOG_FILE    path of the log file (implies output "both")
 *   WEFT_SEED        unsigned seed for makeRandomEngine()
 *
 * Unrecognised values throw std::invalid_argument naming the variable.
 */
struct Config {
    LogLevel logLevel = LogLevel::INFO;
    LogOutput logOutput = LogOutput::CONSOLE;
    std::optional<std::string> logFile;
    uint64_t seed = 42;

    [[nodiscard]] static Config fromEnvironment();

    /// Push the logging settings into Logger
    void apply() const;

    /// Random source for TensorData::sample()
    [[nodiscard]] std::mt19937 makeRandomEngine() const;
};

[[nodiscard]] LogLevel parseLogLevel(const std::string& value);
[[nodiscard]] LogOutput parseLogOutput(const std::string& value);

}  // namespace weft
