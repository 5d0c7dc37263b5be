#include "weft/logger.h"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unistd.h>  // isatty()
#include <vector>

namespace weft {

// ============================================================================
// Formatting Helpers
// ============================================================================

namespace {

namespace colors {
constexpr const char* RESET = "\033[0m";
constexpr const char* BOLD = "\033[1m";
constexpr const char* DIM = "\033[2m";
constexpr const char* CYAN = "\033[36m";
constexpr const char* BRIGHT_RED = "\033[91m";
constexpr const char* BRIGHT_GREEN = "\033[92m";
constexpr const char* BRIGHT_YELLOW = "\033[93m";
}  // namespace colors

bool isTerminalColorSupported() {
#ifndef _WIN32
    return isatty(fileno(stdout));
#else
    return false;
#endif
}

const char* levelColor(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:
            return colors::DIM;
        case LogLevel::DEBUG:
            return colors::CYAN;
        case LogLevel::INFO:
            return colors::BRIGHT_GREEN;
        case LogLevel::WARNING:
            return colors::BRIGHT_YELLOW;
        case LogLevel::ERROR:
        case LogLevel::FATAL:
            return colors::BRIGHT_RED;
    }
    return colors::RESET;
}

std::string currentTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t now_time = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&now_time, &local);

    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

std::string formatPlain(const LogEntry& entry) {
    return std::format("{} [{}] [{}] {}\n", entry.timestamp, name(entry.level), entry.scope,
                       entry.message);
}

std::string formatColored(const LogEntry& entry) {
    std::ostringstream ss;
    ss << colors::DIM << entry.timestamp << colors::RESET << " ";
    if (entry.level == LogLevel::FATAL) {
        ss << colors::BOLD;
    }
    ss << levelColor(entry.level) << "[" << name(entry.level) << "]" << colors::RESET << " ";
    ss << colors::CYAN << "[" << entry.scope << "]" << colors::RESET << " ";
    ss << entry.message << "\n";
    return ss.str();
}

}  // namespace

const char* name(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARNING:
            return "WARNING";
        case LogLevel::ERROR:
            return "ERROR";
        case LogLevel::FATAL:
            return "FATAL";
    }
    return "UNKNOWN";
}

// ============================================================================
// Static Member Initialization
// ============================================================================

// NOLINTBEGIN(cppcoreguidelines-avoid-non-const-global-variables)
std::unordered_map<std::string, std::unique_ptr<Logger>> Logger::sLoggers = {};
std::mutex Logger::sRegistryMutex;

std::atomic<LogLevel> Logger::sMinLogLevel = LogLevel::INFO;
std::atomic<LogOutput> Logger::sLogOutput = LogOutput::CONSOLE;

std::mutex Logger::sFileMutex;
std::string Logger::sLogFile;
std::ofstream Logger::sFileStream;

std::mutex Logger::sQueueMutex;
std::condition_variable Logger::sQueueCondition;
std::queue<LogEntry> Logger::sQueue = {};
size_t Logger::sInFlight = 0;

std::mutex Logger::sWriterMutex;
std::thread Logger::sWriter;
bool Logger::sStopRequested = false;
// NOLINTEND(cppcoreguidelines-avoid-non-const-global-variables)

namespace {
// Joins the writer before the statics above are destroyed
struct WriterShutdownGuard {
    ~WriterShutdownGuard() { Logger::shutdown(); }
};
const WriterShutdownGuard kWriterShutdownGuard;
}  // namespace

// ============================================================================
// Construction & Registry
// ============================================================================

Logger::Logger(std::string scope) : mScope(std::move(scope)) {}

Logger& Logger::getInstance(const std::string& scope) {
    ensureWriterRunning();

    std::lock_guard<std::mutex> lock(sRegistryMutex);
    auto it = sLoggers.find(scope);
    if (it == sLoggers.end()) {
        it = sLoggers.emplace(scope, std::unique_ptr<Logger>(new Logger(scope))).first;
    }
    return *it->second;
}

// ============================================================================
// Global Configuration
// ============================================================================

bool Logger::isEnabled(LogLevel level) {
    return level >= sMinLogLevel.load();
}

LogLevel Logger::minLogLevel() {
    return sMinLogLevel.load();
}

void Logger::setMinLogLevel(LogLevel level) {
    sMinLogLevel = level;
}

void Logger::setLogOutput(LogOutput output) {
    sLogOutput = output;
    if (output == LogOutput::CONSOLE) {
        return;
    }

    std::lock_guard<std::mutex> lock(sFileMutex);
    if (!sFileStream.is_open() && !sLogFile.empty()) {
        openLogFileLocked();
    }
}

void Logger::setLogFile(const std::string& file) {
    std::lock_guard<std::mutex> lock(sFileMutex);
    if (sFileStream.is_open()) {
        sFileStream.close();
    }

    sLogFile = file;
    openLogFileLocked();

    if (sFileStream.is_open()) {
        sLogOutput = LogOutput::BOTH;
    }
}

// PRECONDITION: sFileMutex is held by the caller
void Logger::openLogFileLocked() {
    sFileStream.open(sLogFile, std::ios::app);
    if (!sFileStream.is_open()) {
        std::cerr << "Error: Failed to open log file: " << sLogFile << std::endl;
    }
}

// ============================================================================
// Writing
// ============================================================================

void Logger::write(LogLevel level, const std::string& message) const {
    if (!isEnabled(level)) {
        return;
    }

    LogEntry entry{currentTimestamp(), level, mScope, message};

    ensureWriterRunning();
    {
        std::lock_guard<std::mutex> lock(sQueueMutex);
        sQueue.push(std::move(entry));
    }
    sQueueCondition.notify_all();
}

void Logger::ensureWriterRunning() {
    std::lock_guard<std::mutex> writer_lock(sWriterMutex);
    if (sWriter.joinable()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(sQueueMutex);
        sStopRequested = false;
    }
    sWriter = std::thread(runWriter);
}

void Logger::runWriter() {
    static const bool use_color = isTerminalColorSupported();

    while (true) {
        std::vector<LogEntry> entries;
        {
            std::unique_lock<std::mutex> lock(sQueueMutex);
            sQueueCondition.wait(lock, [] { return !sQueue.empty() || sStopRequested; });
            if (sQueue.empty() && sStopRequested) {
                break;
            }
            while (!sQueue.empty()) {
                entries.emplace_back(std::move(sQueue.front()));
                sQueue.pop();
            }
            sInFlight = entries.size();
        }

        const LogOutput output = sLogOutput.load();
        if (output == LogOutput::CONSOLE || output == LogOutput::BOTH) {
            for (const auto& entry : entries) {
                std::cout << (use_color ? formatColored(entry) : formatPlain(entry));
            }
            std::cout.flush();
        }

        if (output == LogOutput::FILE || output == LogOutput::BOTH) {
            std::lock_guard<std::mutex> file_lock(sFileMutex);
            if (sFileStream.is_open()) {
                for (const auto& entry : entries) {
                    sFileStream << formatPlain(entry);
                }
                sFileStream.flush();
            }
        }

        {
            std::lock_guard<std::mutex> lock(sQueueMutex);
            sInFlight = 0;
        }
        sQueueCondition.notify_all();
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> writer_lock(sWriterMutex);
    if (!sWriter.joinable()) {
        return;
    }

    std::unique_lock<std::mutex> lock(sQueueMutex);
    sQueueCondition.wait(lock, [] { return sQueue.empty() && sInFlight == 0; });
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> writer_lock(sWriterMutex);
    {
        std::lock_guard<std::mutex> lock(sQueueMutex);
        sStopRequested = true;
    }
    sQueueCondition.notify_all();

    if (sWriter.joinable()) {
        sWriter.join();
    }

    std::lock_guard<std::mutex> file_lock(sFileMutex);
    if (sFileStream.is_open()) {
        sFileStream.close();
    }
}

}  // namespace weft
