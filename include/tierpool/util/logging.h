// TIERPOOL - Logging System
// Copyright (c) 2024 TIERPOOL Developers
// MIT License
//
// Leveled logging with a threshold per engine subsystem and pluggable sinks.
// Messages below the threshold of their category are never formatted.

#ifndef TIERPOOL_UTIL_LOGGING_H
#define TIERPOOL_UTIL_LOGGING_H

#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace tierpool {
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

const char* LogLevelToString(LogLevel level);

/// Case-insensitive; unknown names map to Info
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* POOL = "pool";
    constexpr const char* EPOCH = "epoch";
    constexpr const char* REWARD = "reward";
    constexpr const char* AUTH = "auth";
    constexpr const char* CONFIG = "config";
    constexpr const char* SIM = "sim";

    /// Categories that accept a level override from the [log] section
    constexpr std::array<const char*, 6> CONFIGURABLE{{
        POOL, EPOCH, REWARD, AUTH, CONFIG, SIM
    }};
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

/// One line per entry on stderr (or stdout), without source location
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useStderr{true};
        bool showTimestamp{true};
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink() : ConsoleSink(Config()) {}
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    FILE* stream_;
    bool showTimestamp_;
    std::mutex mutex_;
};

/// Appends timestamped lines with source location to a file
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path, LogLevel level = LogLevel::Debug);

    bool IsOpen() const { return file_.is_open(); }
    const std::string& GetPath() const { return path_; }

    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    std::string path_;
    std::ofstream file_;
    std::mutex mutex_;
};

class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info)
        : ILogSink(level), callback_(std::move(callback)) {}

    void Write(const LogEntry& entry) override;
    void Flush() override {}

private:
    Callback callback_;
};

// ============================================================================
// Logger
// ============================================================================

/**
 * Process-wide logger. Starts with no sinks, so the engine is silent until an
 * executable or test adds one.
 *
 * Each category is filtered by its own threshold if one was set with
 * SetCategoryLevel(), otherwise by the global level.
 */
class Logger {
public:
    static Logger& Instance();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void ClearSinks();

    /// Flush and drop all sinks
    void Shutdown();

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    void SetCategoryLevel(const std::string& category, LogLevel level);
    void ResetCategoryLevels();
    LogLevel GetEffectiveLevel(const std::string& category) const;

    bool WillLog(LogLevel level, const std::string& category) const;

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0);

    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* format, ...)
        __attribute__((format(printf, 6, 7)));

    void Flush();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::map<std::string, LogLevel> categoryLevels_;
    mutable std::mutex categoryMutex_;
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message with operator<< and emits it on destruction
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line)
        : level_(level), category_(category), file_(file), line_(line) {}
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
    const char* category_;
    const char* file_;
    int line_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define TIERPOOL_LOGGER ::tierpool::util::Logger::Instance()

#define TIERPOOL_LOG_ENABLED(level, category) \
    TIERPOOL_LOGGER.WillLog(::tierpool::util::LogLevel::level, category)

#define TIERPOOL_LOG(level, category) \
    if (TIERPOOL_LOG_ENABLED(level, category)) \
        ::tierpool::util::LogStream(::tierpool::util::LogLevel::level, category, \
                                    __FILE__, __LINE__)

#define LOG_DEBUG(category)   TIERPOOL_LOG(Debug, category)
#define LOG_INFO(category)    TIERPOOL_LOG(Info, category)
#define LOG_WARN(category)    TIERPOOL_LOG(Warn, category)
#define LOG_ERROR(category)   TIERPOOL_LOG(Error, category)

#define TIERPOOL_LOGF(level, category, ...) \
    do { \
        if (TIERPOOL_LOG_ENABLED(level, category)) { \
            TIERPOOL_LOGGER.LogF(::tierpool::util::LogLevel::level, category, \
                                 __FILE__, __LINE__, __VA_ARGS__); \
        } \
    } while (0)

#define LogDebugF(category, ...)  TIERPOOL_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   TIERPOOL_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   TIERPOOL_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  TIERPOOL_LOGF(Error, category, __VA_ARGS__)

// ============================================================================
// Utility Functions
// ============================================================================

/// "YYYY-MM-DD HH:MM:SS.mmm" in local time
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

std::string GetBasename(const std::string& path);

} // namespace util
} // namespace tierpool

#endif // TIERPOOL_UTIL_LOGGING_H
