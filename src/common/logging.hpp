/**
 * Codeveil - Source Code Veiling Codecs
 *
 * logging.hpp - Leveled logging shared by the codecs and the driver
 *
 * Features:
 *   - Verbosity levels (TRACE, DEBUG, INFO, WARN, ERROR, SILENT)
 *   - Output to a stream, a file, or a callback sink
 *   - Colored level tags on terminals
 *   - {} placeholder formatting
 */

#ifndef CODEVEIL_LOGGING_HPP
#define CODEVEIL_LOGGING_HPP

#include <string>
#include <sstream>
#include <iostream>
#include <fstream>
#include <functional>
#include <mutex>
#include <memory>
#include <chrono>
#include <cctype>
#include <ctime>
#include <iomanip>

namespace codeveil {

/**
 * Log levels in order of severity
 */
enum class LogLevel {
    Trace = 0,    // per-fragment / per-token detail
    Debug = 1,    // codec decisions: chunk size, names assigned, table sizes
    Info = 2,     // driver progress
    Warn = 3,     // recoverable oddities in input
    Error = 4,    // failed encode/decode, bad config
    Silent = 5
};

inline const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Silent: return "SILENT";
        default: return "UNKNOWN";
    }
}

/**
 * Parse "trace".."silent" (either case). Returns false on unknown names.
 */
inline bool parseLogLevel(const std::string& name, LogLevel& out) {
    std::string lower;
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "trace") out = LogLevel::Trace;
    else if (lower == "debug") out = LogLevel::Debug;
    else if (lower == "info") out = LogLevel::Info;
    else if (lower == "warn" || lower == "warning") out = LogLevel::Warn;
    else if (lower == "error") out = LogLevel::Error;
    else if (lower == "silent") out = LogLevel::Silent;
    else return false;
    return true;
}

namespace colors {
    constexpr const char* Reset  = "\033[0m";
    constexpr const char* Red    = "\033[31m";
    constexpr const char* Green  = "\033[32m";
    constexpr const char* Yellow = "\033[33m";
    constexpr const char* Cyan   = "\033[36m";
    constexpr const char* Bold   = "\033[1m";
    constexpr const char* Dim    = "\033[2m";
}

inline const char* logLevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return colors::Dim;
        case LogLevel::Debug: return colors::Cyan;
        case LogLevel::Info:  return colors::Green;
        case LogLevel::Warn:  return colors::Yellow;
        case LogLevel::Error: return colors::Red;
        default: return colors::Reset;
    }
}

using LogSink = std::function<void(LogLevel, const std::string&, const std::string&)>;

/**
 * Process-wide logging configuration
 */
class LogConfig {
public:
    static LogConfig& get() {
        static LogConfig instance;
        return instance;
    }

    LogLevel minLevel = LogLevel::Warn;
    bool useColors = true;
    bool showTimestamp = false;
    bool showSource = true;
    std::ostream* output = &std::cerr;
    std::unique_ptr<std::ofstream> fileOutput;
    LogSink callback;

    void setLevel(LogLevel level) {
        minLevel = level;
    }

    /**
     * Driver verbosity: 0=silent, 1=warnings, 2=info, 3=debug, 4+=trace
     */
    void setVerbosity(int verbosity) {
        if (verbosity <= 0) minLevel = LogLevel::Silent;
        else if (verbosity == 1) minLevel = LogLevel::Warn;
        else if (verbosity == 2) minLevel = LogLevel::Info;
        else if (verbosity == 3) minLevel = LogLevel::Debug;
        else minLevel = LogLevel::Trace;
    }

    bool setOutputFile(const std::string& path) {
        fileOutput = std::make_unique<std::ofstream>(path, std::ios::app);
        if (fileOutput->is_open()) {
            output = fileOutput.get();
            useColors = false;
            return true;
        }
        fileOutput.reset();
        return false;
    }

    void resetOutput() {
        output = &std::cerr;
        fileOutput.reset();
    }

    bool enabled(LogLevel level) const {
        return level >= minLevel && minLevel != LogLevel::Silent;
    }

private:
    LogConfig() = default;
};

/**
 * Logger - one per codec / component, tagged with a source name
 */
class Logger {
public:
    explicit Logger(const std::string& source = "codeveil")
        : source_(source) {}

    template<typename... Args>
    void log(LogLevel level, const std::string& format, Args&&... args) const {
        if (!LogConfig::get().enabled(level)) return;
        write(level, formatString(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void trace(const std::string& format, Args&&... args) const {
        log(LogLevel::Trace, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(const std::string& format, Args&&... args) const {
        log(LogLevel::Debug, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(const std::string& format, Args&&... args) const {
        log(LogLevel::Info, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(const std::string& format, Args&&... args) const {
        log(LogLevel::Warn, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(const std::string& format, Args&&... args) const {
        log(LogLevel::Error, format, std::forward<Args>(args)...);
    }

    const std::string& source() const { return source_; }

    /**
     * Substitute {} placeholders left to right. Extra arguments are dropped,
     * unmatched placeholders are left as-is.
     */
    static std::string formatString(const std::string& format) {
        return format;
    }

    template<typename T, typename... Rest>
    static std::string formatString(const std::string& format, T&& value, Rest&&... rest) {
        size_t placeholder = format.find("{}");
        if (placeholder == std::string::npos) {
            return format;
        }
        std::ostringstream oss;
        oss << format.substr(0, placeholder) << value;
        return oss.str() + formatString(format.substr(placeholder + 2),
                                        std::forward<Rest>(rest)...);
    }

private:
    std::string source_;
    inline static std::mutex mutex_;

    void write(LogLevel level, const std::string& message) const {
        auto& config = LogConfig::get();
        std::ostringstream line;

        if (config.showTimestamp) {
            auto now = std::chrono::system_clock::now();
            std::time_t t = std::chrono::system_clock::to_time_t(now);
            std::tm tm_buf{};
            localtime_r(&t, &tm_buf);
            line << std::put_time(&tm_buf, "%H:%M:%S") << " ";
        }

        if (config.useColors) line << logLevelColor(level);
        line << "[" << std::setw(5) << logLevelToString(level) << "]";
        if (config.useColors) line << colors::Reset;
        line << " ";

        if (config.showSource && !source_.empty()) {
            if (config.useColors) line << colors::Bold;
            line << "[" << source_ << "]";
            if (config.useColors) line << colors::Reset;
            line << " ";
        }

        line << message;

        std::lock_guard<std::mutex> lock(mutex_);
        if (config.output) {
            *config.output << line.str() << std::endl;
        }
        if (config.callback) {
            config.callback(level, source_, message);
        }
    }
};

#define CODEVEIL_LOG(logger, level, ...) (logger).log(level, __VA_ARGS__)
#define CODEVEIL_TRACE(logger, ...) (logger).trace(__VA_ARGS__)
#define CODEVEIL_DEBUG(logger, ...) (logger).debug(__VA_ARGS__)
#define CODEVEIL_INFO(logger, ...)  (logger).info(__VA_ARGS__)
#define CODEVEIL_WARN(logger, ...)  (logger).warn(__VA_ARGS__)
#define CODEVEIL_ERROR(logger, ...) (logger).error(__VA_ARGS__)

inline Logger& globalLogger() {
    static Logger instance("codeveil");
    return instance;
}

#define LOG_TRACE(...) codeveil::globalLogger().trace(__VA_ARGS__)
#define LOG_DEBUG(...) codeveil::globalLogger().debug(__VA_ARGS__)
#define LOG_INFO(...)  codeveil::globalLogger().info(__VA_ARGS__)
#define LOG_WARN(...)  codeveil::globalLogger().warn(__VA_ARGS__)
#define LOG_ERROR(...) codeveil::globalLogger().error(__VA_ARGS__)

} // namespace codeveil

#endif // CODEVEIL_LOGGING_HPP
