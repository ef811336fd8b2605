// XMLWITNESS - Logging System
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License
//
// Provides a small logging system with:
// - Log levels (TRACE, DEBUG, INFO, WARN, ERROR, FATAL)
// - Per-stage categories for filtering
// - Console (stderr) and file output
// - Printf-style and stream-style interfaces
//
// Console output goes to stderr so stdout stays reserved for the witness
// JSON written by the command-line tool.

#ifndef XMLWITNESS_UTIL_LOGGING_H
#define XMLWITNESS_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

namespace xmlwitness {
namespace util {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

/// Convert log level to string
const char* LogLevelToString(LogLevel level);

/// Parse log level from string (case-insensitive)
/// @throws std::invalid_argument on an unknown level name
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* WITNESS = "witness";
    constexpr const char* XML = "xml";
    constexpr const char* CRYPTO = "crypto";
    constexpr const char* CLI = "cli";
}

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::string file;
    int line{0};
    std::chrono::system_clock::time_point timestamp;
};

/// Which parts of an entry a sink prints
struct LogFormat {
    bool showTimestamp{true};
    bool showLevel{true};
    bool showCategory{true};
    bool showLocation{false};
};

/// Render an entry on a single line
std::string FormatLogEntry(const LogEntry& entry, const LogFormat& format);

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

protected:
    explicit ILogSink(LogLevel level) : level_(level) {}

    bool Accepts(const LogEntry& entry) const { return entry.level >= level_.load(); }

private:
    std::atomic<LogLevel> level_;
};

/// Writes to stderr, colored when attached to a terminal
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(LogLevel level = LogLevel::Info, bool useColors = true);

    void Write(const LogEntry& entry) override;
    void Flush() override;

    LogFormat& Format() { return format_; }

private:
    LogFormat format_;
    bool useColors_;
    std::mutex mutex_;
};

/// Appends to a file
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path, LogLevel level = LogLevel::Debug);
    ~FileSink() override;

    bool IsOpen() const { return file_.is_open(); }

    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    LogFormat format_;
    std::ofstream file_;
    std::mutex mutex_;
};

/// Forwards entries to a function (used by tests to capture output)
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Trace);

    void Write(const LogEntry& entry) override;
    void Flush() override {}

private:
    Callback callback_;
};

// ============================================================================
// Logger
// ============================================================================

/// Process-wide logger. Starts with no sinks, so library code is silent
/// until the host adds one.
class Logger {
public:
    static Logger& Instance();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to the given category (may be called repeatedly)
    void EnableCategory(const std::string& category);

    /// Lift any category restriction
    void EnableAllCategories();

    bool IsCategoryEnabled(const std::string& category) const;

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0);

    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* format, ...);

    /// Check if a message would be logged
    bool WillLog(LogLevel level, const std::string& category) const;

    void Flush();

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> enabledCategories_;
    mutable std::mutex categoriesMutex_;
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message with operator<< and emits it on destruction
class LogStream {
public:
    LogStream(LogLevel level, const std::string& category,
              const char* file, int line);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    std::string category_;
    const char* file_;
    int line_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define XMLWITNESS_LOGGER ::xmlwitness::util::Logger::Instance()

#define XMLWITNESS_LOG_ENABLED(level, category) \
    XMLWITNESS_LOGGER.WillLog(::xmlwitness::util::LogLevel::level, category)

#define XMLWITNESS_LOG(level, category) \
    if (XMLWITNESS_LOG_ENABLED(level, category)) \
        ::xmlwitness::util::LogStream(::xmlwitness::util::LogLevel::level, category, \
                                      __FILE__, __LINE__)

#define LOG_TRACE(category)   XMLWITNESS_LOG(Trace, category)
#define LOG_DEBUG(category)   XMLWITNESS_LOG(Debug, category)
#define LOG_INFO(category)    XMLWITNESS_LOG(Info, category)
#define LOG_WARN(category)    XMLWITNESS_LOG(Warn, category)
#define LOG_ERROR(category)   XMLWITNESS_LOG(Error, category)

#define XMLWITNESS_LOGF(level, category, ...) \
    do { \
        if (XMLWITNESS_LOG_ENABLED(level, category)) { \
            XMLWITNESS_LOGGER.LogF(::xmlwitness::util::LogLevel::level, category, \
                                   __FILE__, __LINE__, __VA_ARGS__); \
        } \
    } while(0)

#define LogDebugF(category, ...)  XMLWITNESS_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   XMLWITNESS_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   XMLWITNESS_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  XMLWITNESS_LOGF(Error, category, __VA_ARGS__)

// ============================================================================
// Scoped Log Timer
// ============================================================================

/// Logs the wall time of a scope at Debug level
class ScopedLogTimer {
public:
    ScopedLogTimer(const std::string& category, const std::string& operation);
    ~ScopedLogTimer();

private:
    std::string category_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace util
} // namespace xmlwitness

#endif // XMLWITNESS_UTIL_LOGGING_H
