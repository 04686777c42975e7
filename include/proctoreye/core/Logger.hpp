#pragma once

#include <cstdint>
#include <fstream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

/**
 * @file Logger.hpp
 * @brief Process-wide logger with component and frame tags
 *
 * Lines look like
 *   [2025-03-01 10:15:02.114] [ERROR] [FrameProcessor] [frame 812] fault in stage 'pupil': ... (FrameProcessor.cpp:214)
 * so a line can be matched to the FrameResult with the same frame_index.
 */

namespace proctoreye {
namespace core {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5
};

/**
 * @brief One log line before formatting
 */
struct LogRecord {
    LogLevel level = LogLevel::INFO;
    std::string component;                ///< Empty for untagged lines
    std::optional<std::uint64_t> frame;   ///< Engine frame index, when the line belongs to one
    std::string message;
    const char* file = nullptr;
    int line = 0;
};

/**
 * @brief Thread-safe singleton writing to the console and an optional file
 *
 * WARNING and above go to stderr, the rest to stdout.
 */
class Logger {
public:
    static Logger& getInstance();

    void setLevel(LogLevel level) { minLevel_ = level; }
    LogLevel getLevel() const { return minLevel_; }
    bool isEnabled(LogLevel level) const { return level >= minLevel_; }

    void setConsoleOutput(bool enable);

    /**
     * @brief Append to the given file, replacing any file already open
     */
    bool setLogFile(const std::string& filename);

    void closeLogFile();

    /**
     * @brief Start a session log file <dir>/log_proctoreye_<date>_<time>.txt
     *
     * Missing directories are created. The file opens with a short header
     * naming the start time and level.
     *
     * @return false if the directory or file cannot be created; console
     *         output continues either way
     */
    bool initializeWithTimestamp(const std::string& logDirectory,
                                 LogLevel level = LogLevel::INFO);

    /// Empty when not logging to a file
    std::string getCurrentLogFile() const;

    void flush();

    void write(const LogRecord& record);

    void log(LogLevel level, const std::string& message,
             const char* file = nullptr, int line = 0);

    static std::string levelToString(LogLevel level);

    /**
     * @brief Render a record as one line, without a trailing newline
     */
    static std::string format(const LogRecord& record, const std::string& timestamp);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool openLocked(const std::string& path);

    LogLevel minLevel_ = LogLevel::INFO;
    bool consoleOutput_ = true;
    std::string currentLogFile_;

    mutable std::mutex mutex_;
    std::ofstream logFile_;
};

/**
 * @brief Builds one record with operator<< and writes it on destruction
 *
 *   PROCTOREYE_LOG_ERROR("FrameProcessor").frame(index) << "fault: " << what;
 *
 * Nothing is formatted when the level is filtered out.
 */
class LogStream {
public:
    LogStream(LogLevel level, std::string component,
              const char* file = nullptr, int line = 0);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    LogStream& frame(std::uint64_t index) {
        record_.frame = index;
        return *this;
    }

    template<typename T>
    LogStream& operator<<(const T& value) {
        if (enabled_) {
            stream_ << value;
        }
        return *this;
    }

private:
    LogRecord record_;
    bool enabled_;
    std::ostringstream stream_;
};

#define LOG_TRACE(msg) \
    proctoreye::core::Logger::getInstance().log(proctoreye::core::LogLevel::TRACE, msg, __FILE__, __LINE__)
#define LOG_DEBUG(msg) \
    proctoreye::core::Logger::getInstance().log(proctoreye::core::LogLevel::DEBUG, msg, __FILE__, __LINE__)
#define LOG_INFO(msg) \
    proctoreye::core::Logger::getInstance().log(proctoreye::core::LogLevel::INFO, msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) \
    proctoreye::core::Logger::getInstance().log(proctoreye::core::LogLevel::WARNING, msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) \
    proctoreye::core::Logger::getInstance().log(proctoreye::core::LogLevel::ERROR, msg, __FILE__, __LINE__)

#define PROCTOREYE_LOG(level, component) \
    proctoreye::core::LogStream(proctoreye::core::LogLevel::level, component, __FILE__, __LINE__)

#define PROCTOREYE_LOG_TRACE(component) PROCTOREYE_LOG(TRACE, component)
#define PROCTOREYE_LOG_DEBUG(component) PROCTOREYE_LOG(DEBUG, component)
#define PROCTOREYE_LOG_INFO(component) PROCTOREYE_LOG(INFO, component)
#define PROCTOREYE_LOG_WARNING(component) PROCTOREYE_LOG(WARNING, component)
#define PROCTOREYE_LOG_ERROR(component) PROCTOREYE_LOG(ERROR, component)

} // namespace core
} // namespace proctoreye
