// BALLOT - Logging System
// Copyright (c) 2024 BALLOT Developers
// MIT License
//
// Leveled, categorized logging with pluggable sinks:
// console (stderr by default, so command output on stdout stays clean),
// rotating log file, and callback sinks for tests.

#ifndef BALLOT_UTIL_LOGGING_H
#define BALLOT_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace ballot {
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

/// Parse a level name (case-insensitive, "warning" accepted), nullopt if unknown
std::optional<LogLevel> LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* BALLOT = "ballot";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* DELEGATION = "delegation";
    constexpr const char* TALLY = "tally";
    constexpr const char* ACCESS = "access";
    constexpr const char* DB = "db";
    constexpr const char* CONFIG = "config";
}

/// All known category names
const std::vector<std::string>& AllLogCategories();

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

/// Which fields a sink prints in front of the message
struct LogFormat {
    bool showTimestamp{true};
    bool showLevel{true};
    bool showCategory{true};
    bool showThread{false};
    bool showLocation{false};
};

/// Render an entry as a single line (no trailing newline)
std::string FormatLogEntry(const LogEntry& entry, const LogFormat& format);

// ============================================================================
// Log Sink Interface
// ============================================================================

class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;
    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

// ============================================================================
// Console Sink
// ============================================================================

class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};           // ANSI colours when the stream is a tty
        bool useStdout{false};          // stdout instead of stderr
        LogFormat format;
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    std::mutex mutex_;

    static const char* ColorCode(LogLevel level);
};

// ============================================================================
// File Sink
// ============================================================================

/// Appends to a log file, rotating it to path.1 ... path.N when it grows too large
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool append{true};
        bool autoFlush{true};
        size_t maxSize{10 * 1024 * 1024};
        size_t maxFiles{3};
        bool rotate{true};
        LogFormat format{true, true, true, false, true};
        LogLevel level{LogLevel::Debug};
    };

    explicit FileSink(const Config& config);
    ~FileSink() override;

    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

    size_t GetCurrentSize() const;

private:
    Config config_;
    std::ofstream file_;
    mutable std::mutex mutex_;
    size_t currentSize_{0};

    void OpenLocked(std::ios::openmode mode);
    void Rotate();
};

// ============================================================================
// Callback Sink
// ============================================================================

class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Trace);

    void Write(const LogEntry& entry) override;
    void Flush() override {}
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    Callback callback_;
    LogLevel level_;
};

// ============================================================================
// Logger
// ============================================================================

/// Settings applied in one go by Logger::Configure
struct LogOptions {
    LogLevel level{LogLevel::Info};
    std::vector<std::string> categories;  // empty or "all" means every category
    bool printToConsole{true};
    bool consoleColors{true};
    std::string logFile;                  // empty disables the file sink
};

class Logger {
public:
    static Logger& Instance();

    /// Replace the current sinks, level and category filter
    void Configure(const LogOptions& options);

    /// Flush and drop every sink
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0,
             const char* function = nullptr);

    /// printf-style variant, messages longer than 4 KiB are cut
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
    mutable std::mutex categoriesMutex_;
    std::atomic<bool> allCategoriesEnabled_{true};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message with operator<< and hands it to the logger on destruction
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

#define BALLOT_LOGGER ::ballot::util::Logger::Instance()

#define BALLOT_LOG_ENABLED(level, category) \
    BALLOT_LOGGER.WillLog(::ballot::util::LogLevel::level, category)

#define BALLOT_LOG(level, category) \
    if (!BALLOT_LOG_ENABLED(level, category)) {} else \
        ::ballot::util::LogStream(::ballot::util::LogLevel::level, category, \
                                  __FILE__, __LINE__, __func__)

#define LOG_TRACE(category)   BALLOT_LOG(Trace, category)
#define LOG_DEBUG(category)   BALLOT_LOG(Debug, category)
#define LOG_INFO(category)    BALLOT_LOG(Info, category)
#define LOG_WARN(category)    BALLOT_LOG(Warn, category)
#define LOG_ERROR(category)   BALLOT_LOG(Error, category)

#define BALLOT_LOGF(level, category, ...) \
    do { \
        if (BALLOT_LOG_ENABLED(level, category)) { \
            BALLOT_LOGGER.LogF(::ballot::util::LogLevel::level, category, \
                               __FILE__, __LINE__, __func__, __VA_ARGS__); \
        } \
    } while (0)

#define LogWarnF(category, ...)   BALLOT_LOGF(Warn, category, __VA_ARGS__)

// ============================================================================
// Utility Functions
// ============================================================================

/// "YYYY-MM-DD HH:MM:SS.mmm" in local time
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

std::string GetBasename(const std::string& path);

} // namespace util
} // namespace ballot

#endif // BALLOT_UTIL_LOGGING_H
