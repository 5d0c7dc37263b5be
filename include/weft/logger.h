#pragma once

#include <atomic>
#include <condition_variable>
#include <format>
#include <fstream>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>

namespace weft {

// ============================================================================
// Log Level / Output
// ============================================================================

enum class LogLevel { TRACE, DEBUG, INFO, WARNING, ERROR, FATAL };
enum class LogOutput { CONSOLE, FILE, BOTH };

[[nodiscard]] const char* name(LogLevel level);

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    std::string timestamp;
    LogLevel level;
    std::string scope;
    std::string message;
};

// ============================================================================
// Logger
// ============================================================================

/**
 * @brief Scoped, asynchronous logger
 * @details One Logger exists per scope ("Autograd", "TensorData", ...). Messages
 *          are queued by the calling thread and written by a single background
 *          thread, so logging never blocks the graph or indexing code on I/O.
 *          The writer thread is started lazily by getInstance() and stopped by
 *          shutdown(); a later getInstance() restarts it.
 */
class Logger {
  public:
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    void trace(const std::string& message) const { write(LogLevel::TRACE, message); }
    void debug(const std::string& message) const { write(LogLevel::DEBUG, message); }
    void info(const std::string& message) const { write(LogLevel::INFO, message); }
    void warning(const std::string& message) const { write(LogLevel::WARNING, message); }
    void error(const std::string& message) const { write(LogLevel::ERROR, message); }
    void fatal(const std::string& message) const { write(LogLevel::FATAL, message); }

    /// Formatted variants. Formatting is skipped entirely below the minimum level.
    template <typename... Args>
    void trace(std::format_string<Args...> fmt, Args&&... args) const {
        if (isEnabled(LogLevel::TRACE)) {
            trace(std::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void debug(std::format_string<Args...> fmt, Args&&... args) const {
        if (isEnabled(LogLevel::DEBUG)) {
            debug(std::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void info(std::format_string<Args...> fmt, Args&&... args) const {
        if (isEnabled(LogLevel::INFO)) {
            info(std::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void warning(std::format_string<Args...> fmt, Args&&... args) const {
        if (isEnabled(LogLevel::WARNING)) {
            warning(std::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void error(std::format_string<Args...> fmt, Args&&... args) const {
        if (isEnabled(LogLevel::ERROR)) {
            error(std::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void fatal(std::format_string<Args...> fmt, Args&&... args) const {
        fatal(std::format(fmt, std::forward<Args>(args)...));
    }

    [[nodiscard]] const std::string& scope() const { return mScope; }

    // ------------------------------------------------------------------------
    // Global configuration
    // ------------------------------------------------------------------------

    /// Get or create the logger for a scope
    static Logger& getInstance(const std::string& scope);

    [[nodiscard]] static bool isEnabled(LogLevel level);
    [[nodiscard]] static LogLevel minLogLevel();
    static void setMinLogLevel(LogLevel level);

    /// Open (append) a log file and route output to both console and file
    static void setLogFile(const std::string& file);
    static void setLogOutput(LogOutput output);

    /// Block until every queued entry has been written
    static void flush();

    /// Drain the queue, stop the writer thread and close the log file
    static void shutdown();

  private:
    explicit Logger(std::string scope);

    void write(LogLevel level, const std::string& message) const;

    static void ensureWriterRunning();
    static void runWriter();
    static void openLogFileLocked();

    // NOLINTBEGIN(cppcoreguidelines-avoid-non-const-global-variables)
    static std::unordered_map<std::string, std::unique_ptr<Logger>> sLoggers;
    static std::mutex sRegistryMutex;

    static std::atomic<LogLevel> sMinLogLevel;
    static std::atomic<LogOutput> sLogOutput;

    static std::mutex sFileMutex;  ///< Guards sLogFile / sFileStream
    static std::string sLogFile;
    static std::ofstream sFileStream;

    static std::mutex sQueueMutex;
    static std::condition_variable sQueueCondition;
    static std::queue<LogEntry> sQueue;
    static size_t sInFlight;  ///< Entries popped but not yet written

    static std::mutex sWriterMutex;  ///< Guards writer start/stop
    static std::thread sWriter;
    static bool sStopRequested;
    // NOLINTEND(cppcoreguidelines-avoid-non-const-global-variables)

    std::string mScope;
};

}  // namespace weft
