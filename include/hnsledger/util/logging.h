// HNSLEDGER - Logging System
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License
//
// Leveled, categorized logging with pluggable sinks:
// - console (optionally colored), file (size-capped rotation), callback
// - stream-style and printf-style macros
// - scoped timers for device round trips

#ifndef HNSLEDGER_UTIL_LOGGING_H
#define HNSLEDGER_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstddef>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace hnsledger {
namespace util {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,   // Raw frames and APDUs
    Debug = 1,   // Operation boundaries
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

const char* LogLevelToString(LogLevel level);

/// Unknown names map to Info
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* DEVICE = "device";    // transports, frames
    constexpr const char* APDU = "apdu";        // command/response codec
    constexpr const char* LEDGER = "ledger";    // protocol engine, signer
    constexpr const char* CONFIG = "config";
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
    std::string function;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;
};

/// Which fields a sink prints
struct LogFormat {
    bool timestamp{true};
    bool level{true};
    bool category{true};
    bool thread{false};
    bool location{false};
};

/// Render an entry as one line
std::string FormatLogEntry(const LogEntry& entry, const LogFormat& format);

// ============================================================================
// Sinks
// ============================================================================

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

/// Writes to stdout, or stderr for errors when useStderr is set
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(LogLevel level = LogLevel::Info, bool useColors = true,
                         bool useStderr = false);

    void Write(const LogEntry& entry) override;
    void Flush() override;

    LogFormat& Format() { return format_; }

private:
    LogFormat format_;
    bool useColors_;
    bool useStderr_;
    std::mutex mutex_;
};

/// Appends to a file; when maxSize is exceeded the file is rotated to
/// <path>.1 ... <path>.<maxFiles>
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool autoFlush{false};
        size_t maxSize{10 * 1024 * 1024};
        size_t maxFiles{3};
        LogLevel level{LogLevel::Debug};
    };

    explicit FileSink(const Config& config);
    ~FileSink() override;

    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    Config config_;
    LogFormat format_;
    std::ofstream file_;
    size_t currentSize_{0};
    mutable std::mutex mutex_;

    void OpenLocked(std::ios::openmode mode);
    void RotateLocked();
};

/// Forwards entries to a callback (used by tests and embedding hosts)
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

class Logger {
public:
    static Logger& Instance();

    /// Attach a console sink if no sink is attached yet
    void Initialize();

    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to the enabled categories
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    void EnableAllCategories();
    bool IsCategoryEnabled(const std::string& category) const;

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0,
             const char* function = nullptr);

    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* function,
              const char* format, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 7, 8)))
#endif
        ;

    bool WillLog(LogLevel level, const std::string& category) const;

    void Flush();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};

    std::unordered_set<std::string> enabledCategories_;
    std::atomic<bool> allCategories_{true};
    mutable std::mutex categoriesMutex_;
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message with operator<< and logs it on destruction
class LogStream {
public:
    LogStream(LogLevel level, const std::string& category,
              const char* file, int line, const char* function);
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
    const char* function_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define HNSLEDGER_LOGGER ::hnsledger::util::Logger::Instance()

#define HNSLEDGER_LOG_ENABLED(level, category) \
    HNSLEDGER_LOGGER.WillLog(::hnsledger::util::LogLevel::level, category)

#define HNSLEDGER_LOG(level, category) \
    if (!HNSLEDGER_LOG_ENABLED(level, category)) {} else \
        ::hnsledger::util::LogStream(::hnsledger::util::LogLevel::level, category, \
                                     __FILE__, __LINE__, __func__)

#define LOG_TRACE(category)   HNSLEDGER_LOG(Trace, category)
#define LOG_DEBUG(category)   HNSLEDGER_LOG(Debug, category)
#define LOG_INFO(category)    HNSLEDGER_LOG(Info, category)
#define LOG_WARN(category)    HNSLEDGER_LOG(Warn, category)
#define LOG_ERROR(category)   HNSLEDGER_LOG(Error, category)

#define LogInfo()   LOG_INFO(::hnsledger::util::LogCategory::DEFAULT)
#define LogWarn()   LOG_WARN(::hnsledger::util::LogCategory::DEFAULT)
#define LogError()  LOG_ERROR(::hnsledger::util::LogCategory::DEFAULT)

#define HNSLEDGER_LOGF(level, category, ...) \
    do { \
        if (HNSLEDGER_LOG_ENABLED(level, category)) { \
            HNSLEDGER_LOGGER.LogF(::hnsledger::util::LogLevel::level, category, \
                                  __FILE__, __LINE__, __func__, __VA_ARGS__); \
        } \
    } while (0)

#define LogTraceF(category, ...)  HNSLEDGER_LOGF(Trace, category, __VA_ARGS__)
#define LogDebugF(category, ...)  HNSLEDGER_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   HNSLEDGER_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   HNSLEDGER_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  HNSLEDGER_LOGF(Error, category, __VA_ARGS__)

// ============================================================================
// Scoped Log Timer
// ============================================================================

/// Logs "Starting"/"Completed ... in Nms" at Debug around a scope
class ScopedLogTimer {
public:
    ScopedLogTimer(const std::string& category, const std::string& operation);
    ~ScopedLogTimer();

    ScopedLogTimer(const ScopedLogTimer&) = delete;
    ScopedLogTimer& operator=(const ScopedLogTimer&) = delete;

    /// Milliseconds since construction
    int64_t ElapsedMs() const;

private:
    std::string category_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
};

#define HNSLEDGER_CONCAT_INNER(a, b) a##b
#define HNSLEDGER_CONCAT(a, b) HNSLEDGER_CONCAT_INNER(a, b)

#define HNSLEDGER_LOG_TIMER(category, operation) \
    ::hnsledger::util::ScopedLogTimer HNSLEDGER_CONCAT(_hnsledger_timer_, __LINE__)(category, operation)

// ============================================================================
// Utility Functions
// ============================================================================

std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

std::string GetBasename(const std::string& path);

} // namespace util
} // namespace hnsledger

#endif // HNSLEDGER_UTIL_LOGGING_H
