// HNSLEDGER - Logging Implementation
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#include "hnsledger/util/logging.h"

#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <utility>

#include <unistd.h>

namespace hnsledger {
namespace util {

// ============================================================================
// Levels and Formatting
// ============================================================================

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

LogLevel LogLevelFromString(const std::string& str) {
    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);

    static const std::pair<const char*, LogLevel> kNames[] = {
        {"TRACE", LogLevel::Trace}, {"DEBUG", LogLevel::Debug},
        {"INFO", LogLevel::Info},   {"WARN", LogLevel::Warn},
        {"WARNING", LogLevel::Warn}, {"ERROR", LogLevel::Error},
        {"FATAL", LogLevel::Fatal}, {"OFF", LogLevel::Off},
    };
    for (const auto& entry : kNames) {
        if (upper == entry.first) return entry.second;
    }
    return LogLevel::Info;
}

std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&time, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string GetBasename(const std::string& path) {
    size_t pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

std::string FormatLogEntry(const LogEntry& entry, const LogFormat& format) {
    std::ostringstream oss;

    if (format.timestamp) {
        oss << FormatLogTimestamp(entry.timestamp) << ' ';
    }
    if (format.level) {
        oss << '[' << std::left << std::setw(5) << LogLevelToString(entry.level) << "] ";
    }
    if (format.category && !entry.category.empty() &&
        entry.category != LogCategory::DEFAULT) {
        oss << '[' << entry.category << "] ";
    }
    if (format.thread) {
        oss << '[' << entry.threadId << "] ";
    }
    if (format.location && !entry.file.empty()) {
        oss << GetBasename(entry.file) << ':' << entry.line << ' ';
    }

    oss << entry.message;
    return oss.str();
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(LogLevel level, bool useColors, bool useStderr)
    : ILogSink(level), useColors_(useColors), useStderr_(useStderr) {}

void ConsoleSink::Write(const LogEntry& entry) {
    if (!Accepts(entry)) {
        return;
    }

    std::string line = FormatLogEntry(entry, format_);
    FILE* stream = (useStderr_ && entry.level >= LogLevel::Error) ? stderr : stdout;

    std::lock_guard<std::mutex> lock(mutex_);
    if (useColors_ && isatty(fileno(stream))) {
        const char* color = "\033[0m";
        switch (entry.level) {
            case LogLevel::Trace: color = "\033[90m"; break;
            case LogLevel::Debug: color = "\033[36m"; break;
            case LogLevel::Warn:  color = "\033[33m"; break;
            case LogLevel::Error: color = "\033[31m"; break;
            case LogLevel::Fatal: color = "\033[35;1m"; break;
            default: break;
        }
        std::fprintf(stream, "%s%s\033[0m\n", color, line.c_str());
    } else {
        std::fprintf(stream, "%s\n", line.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stdout);
    std::fflush(stderr);
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const Config& config)
    : ILogSink(config.level), config_(config) {
    format_.thread = true;
    format_.location = true;
    std::lock_guard<std::mutex> lock(mutex_);
    OpenLocked(std::ios::out | std::ios::app);
}

FileSink::~FileSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
}

void FileSink::OpenLocked(std::ios::openmode mode) {
    file_.open(config_.path, mode);
    currentSize_ = 0;
    if (file_.is_open()) {
        file_.seekp(0, std::ios::end);
        currentSize_ = static_cast<size_t>(file_.tellp());
    }
}

bool FileSink::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

void FileSink::Write(const LogEntry& entry) {
    if (!Accepts(entry)) {
        return;
    }

    std::string line = FormatLogEntry(entry, format_) + "\n";

    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) {
        return;
    }
    if (config_.maxSize > 0 && currentSize_ + line.size() > config_.maxSize) {
        RotateLocked();
    }

    file_ << line;
    currentSize_ += line.size();
    if (config_.autoFlush) {
        file_.flush();
    }
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

void FileSink::RotateLocked() {
    file_.close();

    if (config_.maxFiles == 0) {
        OpenLocked(std::ios::out | std::ios::trunc);
        return;
    }

    std::string oldest = config_.path + "." + std::to_string(config_.maxFiles);
    std::remove(oldest.c_str());
    for (size_t i = config_.maxFiles; i > 1; --i) {
        std::string from = config_.path + "." + std::to_string(i - 1);
        std::string to = config_.path + "." + std::to_string(i);
        std::rename(from.c_str(), to.c_str());
    }
    std::string first = config_.path + ".1";
    std::rename(config_.path.c_str(), first.c_str());

    OpenLocked(std::ios::out | std::ios::trunc);
}

// ============================================================================
// CallbackSink
// ============================================================================

CallbackSink::CallbackSink(Callback callback, LogLevel level)
    : ILogSink(level), callback_(std::move(callback)) {}

void CallbackSink::Write(const LogEntry& entry) {
    if (Accepts(entry) && callback_) {
        callback_(entry);
    }
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    Flush();
}

void Logger::Initialize() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    if (sinks_.empty()) {
        sinks_.push_back(std::make_shared<ConsoleSink>(LogLevel::Trace));
    }
}

void Logger::Shutdown() {
    Flush();
    ClearSinks();
}

void Logger::AddSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::RemoveSink(const std::shared_ptr<ILogSink>& sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.clear();
}

size_t Logger::SinkCount() const {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    return sinks_.size();
}

void Logger::EnableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    enabledCategories_.insert(category);
    allCategories_.store(false);
}

void Logger::DisableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    enabledCategories_.erase(category);
}

void Logger::EnableAllCategories() {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    enabledCategories_.clear();
    allCategories_.store(true);
}

bool Logger::IsCategoryEnabled(const std::string& category) const {
    if (allCategories_.load()) {
        return true;
    }
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    return enabledCategories_.count(category) != 0;
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    return level != LogLevel::Off && level >= level_.load() &&
           IsCategoryEnabled(category);
}

void Logger::Log(LogLevel level, const std::string& category,
                 const std::string& message,
                 const char* file, int line, const char* function) {
    if (!WillLog(level, category)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = message;
    entry.file = file ? file : "";
    entry.line = line;
    entry.function = function ? function : "";
    entry.timestamp = std::chrono::system_clock::now();
    entry.threadId = std::this_thread::get_id();

    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Write(entry);
    }
}

void Logger::LogF(LogLevel level, const std::string& category,
                  const char* file, int line, const char* function,
                  const char* format, ...) {
    if (!WillLog(level, category)) {
        return;
    }

    char buffer[2048];
    va_list args;
    va_start(args, format);
    std::vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    Log(level, category, buffer, file, line, function);
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

// ============================================================================
// LogStream
// ============================================================================

LogStream::LogStream(LogLevel level, const std::string& category,
                     const char* file, int line, const char* function)
    : level_(level), category_(category), file_(file), line_(line),
      function_(function) {}

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, stream_.str(), file_, line_, function_);
}

// ============================================================================
// ScopedLogTimer
// ============================================================================

ScopedLogTimer::ScopedLogTimer(const std::string& category,
                               const std::string& operation)
    : category_(category), operation_(operation),
      start_(std::chrono::steady_clock::now()) {
    Logger::Instance().Log(LogLevel::Debug, category_, "Starting: " + operation_);
}

ScopedLogTimer::~ScopedLogTimer() {
    Logger& logger = Logger::Instance();
    if (logger.WillLog(LogLevel::Debug, category_)) {
        logger.Log(LogLevel::Debug, category_,
                   "Completed: " + operation_ + " in " +
                   std::to_string(ElapsedMs()) + "ms");
    }
}

int64_t ScopedLogTimer::ElapsedMs() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_).count();
}

} // namespace util
} // namespace hnsledger
