#include "proctoreye/core/Logger.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sys/stat.h>
#include <sys/types.h>
#include <utility>

namespace proctoreye {
namespace core {

namespace {

std::string localTime(const char* pattern, bool with_millis) {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    std::tm parts{};
    localtime_r(&seconds, &parts);

    std::ostringstream oss;
    oss << std::put_time(&parts, pattern);
    if (with_millis) {
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;
        oss << '.' << std::setfill('0') << std::setw(3) << millis;
    }
    return oss.str();
}

// mkdir -p: creates each missing component of the path in turn
bool ensureDirectory(const std::string& path) {
    if (path.empty()) {
        return false;
    }

    std::size_t pos = 0;
    do {
        pos = path.find('/', pos + 1);
        const std::string prefix = path.substr(0, pos);

        struct stat st;
        if (stat(prefix.c_str(), &st) == 0) {
            if (!S_ISDIR(st.st_mode)) {
                std::cerr << "[Logger] " << prefix << " is not a directory" << std::endl;
                return false;
            }
            continue;
        }
        if (mkdir(prefix.c_str(), 0755) != 0 && errno != EEXIST) {
            std::cerr << "[Logger] Cannot create " << prefix << ": " << std::strerror(errno) << std::endl;
            return false;
        }
    } while (pos != std::string::npos);

    return true;
}

} // namespace

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    closeLogFile();
}

void Logger::setConsoleOutput(bool enable) {
    std::lock_guard<std::mutex> lock(mutex_);
    consoleOutput_ = enable;
}

bool Logger::openLocked(const std::string& path) {
    if (logFile_.is_open()) {
        logFile_.close();
    }
    logFile_.open(path, std::ios::out | std::ios::app);
    if (!logFile_.is_open()) {
        currentLogFile_.clear();
        return false;
    }
    currentLogFile_ = path;
    return true;
}

bool Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    return openLocked(filename);
}

void Logger::closeLogFile() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logFile_.is_open()) {
        logFile_.close();
    }
    currentLogFile_.clear();
}

bool Logger::initializeWithTimestamp(const std::string& logDirectory, LogLevel level) {
    minLevel_ = level;

    if (!ensureDirectory(logDirectory)) {
        std::cerr << "[Logger] File logging disabled" << std::endl;
        return false;
    }

    std::string path = logDirectory;
    if (path.back() != '/') {
        path += '/';
    }
    path += "log_proctoreye_" + localTime("%Y-%m-%d_%H-%M-%S", false) + ".txt";

    std::lock_guard<std::mutex> lock(mutex_);
    if (!openLocked(path)) {
        std::cerr << "[Logger] Cannot open " << path << ": " << std::strerror(errno) << std::endl;
        return false;
    }

    logFile_ << "# ProctorEye attention engine log\n"
             << "# started " << localTime("%Y-%m-%d %H:%M:%S", true)
             << ", level " << levelToString(level) << '\n';
    logFile_.flush();
    return true;
}

std::string Logger::getCurrentLogFile() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentLogFile_;
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout.flush();
    std::cerr.flush();
    if (logFile_.is_open()) {
        logFile_.flush();
    }
}

void Logger::log(LogLevel level, const std::string& message, const char* file, int line) {
    if (!isEnabled(level)) {
        return;
    }
    LogRecord record;
    record.level = level;
    record.message = message;
    record.file = file;
    record.line = line;
    write(record);
}

void Logger::write(const LogRecord& record) {
    if (!isEnabled(record.level)) {
        return;
    }

    const std::string text = format(record, localTime("%Y-%m-%d %H:%M:%S", true));

    std::lock_guard<std::mutex> lock(mutex_);
    if (consoleOutput_) {
        std::ostream& console = record.level >= LogLevel::WARNING ? std::cerr : std::cout;
        console << text << std::endl;
    }
    if (logFile_.is_open()) {
        logFile_ << text << '\n';
        if (record.level >= LogLevel::ERROR) {
            logFile_.flush();
        }
    }
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:    return "TRACE";
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::INFO:     return "INFO";
        case LogLevel::WARNING:  return "WARNING";
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

std::string Logger::format(const LogRecord& record, const std::string& timestamp) {
    std::ostringstream oss;
    oss << '[' << timestamp << "] [" << levelToString(record.level) << "] ";
    if (!record.component.empty()) {
        oss << '[' << record.component << "] ";
    }
    if (record.frame) {
        oss << "[frame " << *record.frame << "] ";
    }
    oss << record.message;

    if (record.file != nullptr && record.line > 0) {
        const char* base = std::strrchr(record.file, '/');
        oss << " (" << (base != nullptr ? base + 1 : record.file) << ':' << record.line << ')';
    }
    return oss.str();
}

LogStream::LogStream(LogLevel level, std::string component, const char* file, int line)
    : enabled_(Logger::getInstance().isEnabled(level)) {
    record_.level = level;
    record_.component = std::move(component);
    record_.file = file;
    record_.line = line;
}

LogStream::~LogStream() {
    if (enabled_) {
        record_.message = stream_.str();
        Logger::getInstance().write(record_);
    }
}

} // namespace core
} // namespace proctoreye
