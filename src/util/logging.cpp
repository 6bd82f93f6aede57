// TIERPOOL - Logging Implementation
// Copyright (c) 2024 TIERPOOL Developers
// MIT License

#include "tierpool/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdarg>
#include <ctime>
#include <iomanip>

namespace tierpool {
namespace util {

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
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const std::map<std::string, LogLevel> names = {
        {"trace", LogLevel::Trace}, {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},   {"warn", LogLevel::Warn},
        {"warning", LogLevel::Warn}, {"error", LogLevel::Error},
        {"fatal", LogLevel::Fatal}, {"off", LogLevel::Off},
    };
    auto it = names.find(lower);
    return it == names.end() ? LogLevel::Info : it->second;
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

namespace {

/// "[LEVEL] [category] message", category omitted for the default one
std::string FormatBody(const LogEntry& entry) {
    std::ostringstream oss;
    oss << '[' << std::left << std::setw(5) << LogLevelToString(entry.level) << "] ";
    if (!entry.category.empty() && entry.category != LogCategory::DEFAULT) {
        oss << '[' << entry.category << "] ";
    }
    oss << entry.message;
    return oss.str();
}

} // anonymous namespace

// ============================================================================
// Sinks
// ============================================================================

ConsoleSink::ConsoleSink(const Config& config)
    : ILogSink(config.level)
    , stream_(config.useStderr ? stderr : stdout)
    , showTimestamp_(config.showTimestamp) {}

void ConsoleSink::Write(const LogEntry& entry) {
    if (!Accepts(entry)) {
        return;
    }

    std::string body = FormatBody(entry);
    std::lock_guard<std::mutex> lock(mutex_);
    if (showTimestamp_) {
        std::fprintf(stream_, "%s %s\n", FormatLogTimestamp(entry.timestamp).c_str(),
                     body.c_str());
    } else {
        std::fprintf(stream_, "%s\n", body.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stream_);
}

FileSink::FileSink(const std::string& path, LogLevel level)
    : ILogSink(level), path_(path), file_(path, std::ios::out | std::ios::app) {}

void FileSink::Write(const LogEntry& entry) {
    if (!Accepts(entry)) {
        return;
    }

    std::ostringstream line;
    line << FormatLogTimestamp(entry.timestamp) << ' ' << FormatBody(entry);
    if (!entry.file.empty()) {
        line << " (" << GetBasename(entry.file) << ':' << entry.line << ')';
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_ << line.str() << '\n';
    }
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

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
    Shutdown();
}

void Logger::AddSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.clear();
}

void Logger::Shutdown() {
    Flush();
    ClearSinks();
}

void Logger::SetCategoryLevel(const std::string& category, LogLevel level) {
    std::lock_guard<std::mutex> lock(categoryMutex_);
    categoryLevels_[category] = level;
}

void Logger::ResetCategoryLevels() {
    std::lock_guard<std::mutex> lock(categoryMutex_);
    categoryLevels_.clear();
}

LogLevel Logger::GetEffectiveLevel(const std::string& category) const {
    std::lock_guard<std::mutex> lock(categoryMutex_);
    auto it = categoryLevels_.find(category);
    return it == categoryLevels_.end() ? level_.load() : it->second;
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    return level != LogLevel::Off && level >= GetEffectiveLevel(category);
}

void Logger::Log(LogLevel level, const std::string& category,
                 const std::string& message, const char* file, int line) {
    if (!WillLog(level, category)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = message;
    entry.file = file ? file : "";
    entry.line = line;
    entry.timestamp = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Write(entry);
    }
}

void Logger::LogF(LogLevel level, const std::string& category,
                  const char* file, int line, const char* format, ...) {
    char buffer[1024];
    va_list args;
    va_start(args, format);
    std::vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    Log(level, category, buffer, file, line);
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, stream_.str(), file_, line_);
}

} // namespace util
} // namespace tierpool
