#pragma once
#include <iostream>
#include <vector>
#include <string>
#include <memory>
#include <mutex>
#include <sstream>
#include <algorithm>
#include <climits>
#include <cctype>

// Fix Windows macro conflicts
#ifdef min
#undef min
#endif
#ifdef max
#undef max
#endif

// Usage:
//   g++ -DLOGGER_ENABLE_TRACE ...
//   logger.trace("init", "Starting system");
// Traces are emitted regardless of per-sink log level thresholds.

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Critical
#ifdef LOGGER_ENABLE_TRACE
    , Trace  // Highest so it survives retrieval filters
#endif
};

inline std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
#ifdef LOGGER_ENABLE_TRACE
        case LogLevel::Trace:    return "TRACE";
#endif
        default:                 return "UNKNOWN";
    }
}

/** \brief Parse a level name as used in config files ("debug", "info", ...). Falls back to Info. */
inline LogLevel log_level_from_string(const std::string& name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) lower.push_back(static_cast<char>(::tolower(static_cast<unsigned char>(c))));
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    return LogLevel::Info;
}

class LogSink {
public:
    virtual ~LogSink() = default;
    // `channel` is the name of the emitting logger (may be empty).
    virtual void log(LogLevel level, const std::string& channel, const std::string& message) = 0;
    void set_level(LogLevel level) { min_level_ = level; }
    LogLevel level() const { return min_level_; }

#ifdef LOGGER_ENABLE_TRACE
    // Trace bypasses level filtering; default no-op if not overridden.
    virtual void trace(const std::string& id, const std::string& message) {
        (void)id; (void)message;
    }
#endif
protected:
    static std::string format_line(LogLevel level, const std::string& channel, const std::string& message) {
        std::ostringstream oss;
        oss << "[" << to_string(level) << "]";
        if (!channel.empty()) oss << "[" << channel << "]";
        oss << " " << message;
        return oss.str();
    }

    LogLevel min_level_ = LogLevel::Info; // Default level set to INFO
};

class StdoutSink : public LogSink {
public:
    void log(LogLevel level, const std::string& channel, const std::string& message) override {
        if (level < min_level_) return;
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << format_line(level, channel, message) << std::endl;
    }
#ifdef LOGGER_ENABLE_TRACE
    void trace(const std::string& id, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "[TRACE][" << id << "] " << message << std::endl;
    }
#endif
private:
    std::mutex mutex_;
};

class VectorSink : public LogSink {
public:
    void log(LogLevel level, const std::string& channel, const std::string& message) override {
        if (level < min_level_) return;
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.push_back(format_line(level, channel, message));
        levels_.push_back(level);
    }
#ifdef LOGGER_ENABLE_TRACE
    void trace(const std::string& id, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostringstream oss;
        oss << "[TRACE][" << id << "] " << message;
        lines_.push_back(oss.str());
        levels_.push_back(LogLevel::Trace);
    }
#endif
    std::vector<std::string> get_lines(size_t start = 0, size_t count = SIZE_MAX, LogLevel min_level = LogLevel::Debug) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> filtered;
        for (size_t i = 0; i < lines_.size(); ++i) {
            if (levels_[i] >= min_level) {
                filtered.push_back(lines_[i]);
            }
        }
        if (start >= filtered.size()) return {};
        // Use (std::min) with parentheses to avoid macro conflicts
        size_t end = (std::min)(start + count, filtered.size());
        return std::vector<std::string>(filtered.begin() + start, filtered.begin() + end);
    }
    // Number of captured lines containing `needle`
    size_t count_containing(const std::string& needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count_if(lines_.begin(), lines_.end(), [&](const std::string& line) {
            return line.find(needle) != std::string::npos;
        }));
    }
    // Get the number of log lines
    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_.size();
    }
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.clear();
        levels_.clear();
    }
private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
    std::vector<LogLevel> levels_;
};

class Logger {
public:
    // Default constructor with empty name
    Logger() : name_("Default") {}

    // Constructor with logger name
    Logger(const std::string& name) : name_(name) {}

    void add_sink(std::shared_ptr<LogSink> sink) {
        sinks_.push_back(std::move(sink));
    }

    /** \brief Create a logger named `name` that writes to the same sinks as this one. */
    std::shared_ptr<Logger> child(const std::string& name) const {
        auto logger = std::make_shared<Logger>(name);
        logger->sinks_ = sinks_;
        return logger;
    }

    void log(LogLevel level, const std::string& message) {
        for (const auto& sink : sinks_) {
            sink->log(level, name_, message);
        }
    }

#ifdef LOGGER_ENABLE_TRACE
    void trace(const std::string& id, const std::string& message) {
        for (const auto& sink : sinks_) {
            sink->trace(id, message); // Bypass level filtering
        }
    }
#endif

    void debug(const std::string& message)    { log(LogLevel::Debug, message); }
    void info(const std::string& message)     { log(LogLevel::Info, message); }
    void warning(const std::string& message)  { log(LogLevel::Warning, message); }
    void error(const std::string& message)    { log(LogLevel::Error, message); }
    void critical(const std::string& message) { log(LogLevel::Critical, message); }

    // Get the logger name
    const std::string& name() const { return name_; }

    // Set the logger name
    void set_name(const std::string& name) { name_ = name; }

    std::vector<std::string> get_lines(int start = 0, int count = INT_MAX, LogLevel min_level = LogLevel::Debug) const {
        for (const auto& sink : sinks_) {
            auto vector_sink = std::dynamic_pointer_cast<VectorSink>(sink);
            if (vector_sink) {
                return vector_sink->get_lines(static_cast<size_t>(start), static_cast<size_t>(count), min_level);
            }
        }
        return {};
    }

    int get_number_of_lines() const {
        for (const auto& sink : sinks_) {
            auto vector_sink = std::dynamic_pointer_cast<VectorSink>(sink);
            if (vector_sink) {
                return static_cast<int>(vector_sink->size());
            }
        }
        return 0;
    }

private:
    std::string name_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
};
