#include "weft/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace weft {

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::optional<std::string> readVariable(const char* variable) {
    const char* raw = std::getenv(variable);
    if (raw == nullptr || *raw == '\0') {
        return std::nullopt;
    }
    return std::string(raw);
}

}  // namespace

LogLevel parseLogLevel(const std::string& value) {
    const std::string v = lowercase(value);
    if (v == "trace") return LogLevel::TRACE;
    if (v == "debug") return LogLevel::DEBUG;
    if (v == "info") return LogLevel::INFO;
    if (v == "warning") return LogLevel::WARNING;
    if (v == "error") return LogLevel::ERROR;
    if (v == "fatal") return LogLevel::FATAL;
    throw std::invalid_argument("WEFT_LOG_LEVEL: unknown log level '" + value + "'");
}

LogOutput parseLogOutput(const std::string& value) {
    const std::string v = lowercase(value);
    if (v == "console") return LogOutput::CONSOLE;
    if (v == "file") return LogOutput::FILE;
    if (v == "both") return LogOutput::BOTH;
    throw std::invalid_argument("WEFT_LOG_OUTPUT: unknown log output '" + value + "'");
}

Config Config::fromEnvironment() {
    Config config;

    if (auto level = readVariable("WEFT_LOG_LEVEL")) {
        config.logLevel = parseLogLevel(*level);
    }
    if (auto output = readVariable("WEFT_LOG_OUTPUT")) {
        config.logOutput = parseLogOutput(*output);
    }
    if (auto file = readVariable("WEFT_LOG_FILE")) {
        config.logFile = *file;
        config.logOutput = LogOutput::BOTH;
    }
    if (auto seed = readVariable("WEFT_SEED")) {
        try {
            size_t consumed = 0;
            config.seed = std::stoull(*seed, &consumed);
            if (consumed != seed->size()) {
                throw std::invalid_argument("trailing characters");
            }
        } catch (const std::logic_error&) {
            throw std::invalid_argument("WEFT_SEED: expected an unsigned integer, got '" + *seed +
                                        "'");
        }
    }

    return config;
}

void Config::apply() const {
    Logger::setMinLogLevel(logLevel);
    if (logFile) {
        Logger::setLogFile(*logFile);
    }
    Logger::setLogOutput(logOutput);

    Logger::getInstance("Config")
        .debug("log level {}, seed {}{}", name(logLevel), seed,
               logFile ? ", log file " + *logFile : std::string());
}

std::mt19937 Config::makeRandomEngine() const {
    return std::mt19937(static_cast<std::mt19937::result_type>(seed));
}

}  // namespace weft
