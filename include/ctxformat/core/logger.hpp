/*
 * ctxformat C++ - Logger
 *
 * Process-wide leveled logger with printf-style macros. Output goes to
 * stderr by default; tests and tools may redirect it to any FILE*.
 *
 * Components prefix their messages with "[Component]". Messages must
 * never carry raw detected secrets, only masked previews and fingerprints.
 */
#ifndef ctxformat_CORE_LOGGER_HPP
#define ctxformat_CORE_LOGGER_HPP

#include <string>
#include <cstdio>
#include <cstdarg>

namespace ctxformat {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Parse "debug", "info", "warn" or "error" (case-insensitive).
// Unknown names leave `out` untouched and return false.
bool parse_log_level(const std::string& name, LogLevel& out);

const char* to_string(LogLevel level);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level) { level_ = level; }
    LogLevel level() const { return level_; }
    bool enabled(LogLevel level) const { return level >= level_; }

    // Disable ANSI colors (e.g. when output is not a terminal)
    void set_color(bool enabled) { color_ = enabled; }
    bool color() const { return color_; }

    // Redirect output. nullptr restores stderr.
    void set_output(FILE* out) { out_ = out ? out : stderr; }

    void log(LogLevel level, const char* file, int line, const char* func, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 6, 7)))
#endif
        ;
    void vlog(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args);

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    LogLevel level_;
    bool color_;
    FILE* out_;
};

#define CTXFORMAT_LOG_AT(lvl, ...)                                                          \
    do {                                                                                    \
        ctxformat::Logger& ctxformat_logger_ = ctxformat::Logger::instance();               \
        if (ctxformat_logger_.enabled(lvl)) {                                               \
            ctxformat_logger_.log(lvl, __FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__); \
        }                                                                                   \
    } while (0)

#define LOG_DEBUG(...) CTXFORMAT_LOG_AT(ctxformat::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INFO(...)  CTXFORMAT_LOG_AT(ctxformat::LogLevel::INFO, __VA_ARGS__)
#define LOG_WARN(...)  CTXFORMAT_LOG_AT(ctxformat::LogLevel::WARN, __VA_ARGS__)
#define LOG_ERROR(...) CTXFORMAT_LOG_AT(ctxformat::LogLevel::ERROR, __VA_ARGS__)

} // namespace ctxformat

#endif // ctxformat_CORE_LOGGER_HPP
