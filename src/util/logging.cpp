// BALLOT - Logging Implementation
// Copyright (c) 2024 BALLOT Developers
// MIT License

#include "ballot/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>

#include <unistd.h>

namespace ballot {
namespace util {

// ============================================================================
// Log Level Functions
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
        default:              return "UNKNOWN";
    }
}

std::optional<LogLevel> LogLevelFromString(const std::string& str) {
    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") return LogLevel::Trace;
    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "INFO")  return LogLevel::Info;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::Warn;
    if (upper == "ERROR") return LogLevel::Error;
    if (upper == "FATAL") return LogLevel::Fatal;
    if (upper == "OFF" || upper == "NONE") return LogLevel::Off;
    return std::nullopt;
}

const std::vector<std::string>& AllLogCategories() {
    static const std::vector<std::string> categories = {
        LogCategory::DEFAULT, LogCategory::BALLOT, LogCategory::LEDGER,
        LogCategory::DELEGATION, LogCategory::TALLY, LogCategory::ACCESS,
        LogCategory::DB, LogCategory::CONFIG,
    };
    return categories;
}

// ============================================================================
// Formatting
// ============================================================================

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
    size_t pos = path.find_last_of("/\\");
    if (pos != std::string::npos) {
        return path.substr(pos + 1);
    }
    return path;
}

std::string FormatLogEntry(const LogEntry& entry, const LogFormat& format) {
    std::ostringstream oss;

    if (format.showTimestamp) {
        oss << FormatLogTimestamp(entry.timestamp) << " ";
    }
    if (format.showLevel) {
        oss << "[" << std::left << std::setw(5) << LogLevelToString(entry.level) << "] ";
    }
    if (format.showCategory && !entry.category.empty() &&
        entry.category != LogCategory::DEFAULT) {
        oss << "[" << entry.category << "] ";
    }
    if (format.showThread) {
        oss << "[" << entry.threadId << "] ";
    }
    if (format.showLocation && !entry.file.empty()) {
        oss << GetBasename(entry.file) << ":" << entry.line << " ";
    }

    oss << entry.message;
    return oss.str();
}

// ============================================================================
// ConsoleSink Implementation
// ============================================================================

ConsoleSink::ConsoleSink() = default;

ConsoleSink::ConsoleSink(const Config& config) : config_(config) {}

void ConsoleSink::Write(const LogEntry& entry) {
    if (entry.level < config_.level) {
        return;
    }

    std::string line = FormatLogEntry(entry, config_.format);

    std::lock_guard<std::mutex> lock(mutex_);
    FILE* stream = config_.useStdout ? stdout : stderr;

    if (config_.useColors && isatty(fileno(stream))) {
        std::fprintf(stream, "%s%s\033[0m\n", ColorCode(entry.level), line.c_str());
    } else {
        std::fprintf(stream, "%s\n", line.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(config_.useStdout ? stdout : stderr);
}

const char* ConsoleSink::ColorCode(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[32m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Fatal: return "\033[35;1m";
        default:              return "\033[0m";
    }
}

// ============================================================================
// FileSink Implementation
// ============================================================================

FileSink::FileSink(const Config& config) : config_(config) {
    std::lock_guard<std::mutex> lock(mutex_);
    OpenLocked(config_.append ? (std::ios::out | std::ios::app) : std::ios::out);
}

FileSink::~FileSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
}

void FileSink::OpenLocked(std::ios::openmode mode) {
    currentSize_ = 0;
    if (config_.path.empty()) {
        return;
    }
    file_.open(config_.path, mode);
    if (file_.is_open()) {
        file_.seekp(0, std::ios::end);
        currentSize_ = static_cast<size_t>(file_.tellp());
    }
}

bool FileSink::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

size_t FileSink::GetCurrentSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentSize_;
}

void FileSink::Write(const LogEntry& entry) {
    if (entry.level < config_.level) {
        return;
    }

    std::string line = FormatLogEntry(entry, config_.format);
    line += '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) {
        return;
    }

    if (config_.rotate && currentSize_ >= config_.maxSize) {
        Rotate();
        if (!file_.is_open()) {
            return;
        }
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

// Called with mutex_ held
void FileSink::Rotate() {
    file_.close();

    // path.N is dropped, path.(i) moves to path.(i+1), path becomes path.1
    std::string oldest = config_.path + "." + std::to_string(config_.maxFiles);
    std::remove(oldest.c_str());
    for (size_t i = config_.maxFiles; i > 1; --i) {
        std::string from = config_.path + "." + std::to_string(i - 1);
        std::string to = config_.path + "." + std::to_string(i);
        std::rename(from.c_str(), to.c_str());
    }
    if (config_.maxFiles > 0) {
        std::string first = config_.path + ".1";
        std::rename(config_.path.c_str(), first.c_str());
    }

    OpenLocked(std::ios::out | std::ios::trunc);
}

// ============================================================================
// CallbackSink Implementation
// ============================================================================

CallbackSink::CallbackSink(Callback callback, LogLevel level)
    : callback_(std::move(callback)), level_(level) {}

void CallbackSink::Write(const LogEntry& entry) {
    if (entry.level < level_ || !callback_) {
        return;
    }
    callback_(entry);
}

// ============================================================================
// Logger Implementation
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    Shutdown();
}

void Logger::Configure(const LogOptions& options) {
    Flush();
    ClearSinks();

    SetLevel(options.level);

    bool all = options.categories.empty() ||
               std::find(options.categories.begin(), options.categories.end(), "all") !=
                   options.categories.end() ||
               std::find(options.categories.begin(), options.categories.end(), "1") !=
                   options.categories.end();
    {
        std::lock_guard<std::mutex> lock(categoriesMutex_);
        enabledCategories_.clear();
        if (!all) {
            enabledCategories_.insert(options.categories.begin(), options.categories.end());
            // Untagged messages are always shown
            enabledCategories_.insert(LogCategory::DEFAULT);
        }
        allCategoriesEnabled_.store(all);
    }

    if (options.printToConsole) {
        ConsoleSink::Config cfg;
        cfg.useColors = options.consoleColors;
        cfg.level = LogLevel::Trace;
        AddSink(std::make_shared<ConsoleSink>(cfg));
    }

    if (!options.logFile.empty()) {
        FileSink::Config cfg;
        cfg.path = options.logFile;
        cfg.level = LogLevel::Trace;
        auto sink = std::make_shared<FileSink>(cfg);
        if (sink->IsOpen()) {
            AddSink(sink);
        } else {
            Log(LogLevel::Warn, LogCategory::DEFAULT,
                "Could not open log file " + options.logFile);
        }
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
    allCategoriesEnabled_.store(false);
}

void Logger::DisableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    if (allCategoriesEnabled_.load()) {
        // Switch to an explicit list holding everything but this one
        enabledCategories_.clear();
        for (const auto& name : AllLogCategories()) {
            enabledCategories_.insert(name);
        }
        allCategoriesEnabled_.store(false);
    }
    enabledCategories_.erase(category);
}

bool Logger::IsCategoryEnabled(const std::string& category) const {
    if (allCategoriesEnabled_.load()) {
        return true;
    }
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    return enabledCategories_.count(category) > 0;
}

void Logger::EnableAllCategories() {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    enabledCategories_.clear();
    allCategoriesEnabled_.store(true);
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

    char buffer[4096];
    va_list args;
    va_start(args, format);
    std::vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    Log(level, category, buffer, file, line, function);
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    if (level == LogLevel::Off || level < level_.load()) {
        return false;
    }
    // Category selection only gates diagnostic output
    return level >= LogLevel::Info || IsCategoryEnabled(category);
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

// ============================================================================
// LogStream Implementation
// ============================================================================

LogStream::LogStream(LogLevel level, const std::string& category,
                     const char* file, int line, const char* function)
    : level_(level)
    , category_(category)
    , file_(file)
    , line_(line)
    , function_(function) {}

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, stream_.str(), file_, line_, function_);
}

} // namespace util
} // namespace ballot
