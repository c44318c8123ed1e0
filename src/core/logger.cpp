#include <ctxformat/core/logger.hpp>
#include <ctxformat/core/utils.hpp>

#include <cstring>
#include <ctime>

namespace ctxformat {

namespace {

struct LevelStyle {
    const char* name;
    const char* color;
};

const LevelStyle kLevelStyles[] = {
    { "DEBUG", "\033[34m" },    // blue
    { "INFO",  "\033[32m" },    // green
    { "WARN",  "\033[33m" },    // yellow
    { "ERROR", "\033[31m" },    // red
};

const char* const kReset = "\033[0m";
const char* const kCallSiteColor = "\033[36m";

const LevelStyle& style_of(LogLevel level) {
    size_t i = static_cast<size_t>(level);
    return kLevelStyles[i < 4 ? i : 3];
}

const char* base_name(const char* path) {
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

// "bool ctxformat::SecureWriter::screen(const std::string&, ...)"
//   -> "SecureWriter::screen"
std::string call_site(const char* pretty_function) {
    std::string sig = pretty_function;
    size_t paren = sig.find('(');
    if (paren != std::string::npos) {
        sig.erase(paren);
    }

    // Drop the return type; template arguments may contain spaces
    int depth = 0;
    size_t name_start = 0;
    for (size_t i = 0; i < sig.size(); ++i) {
        if (sig[i] == '<') ++depth;
        else if (sig[i] == '>') --depth;
        else if (sig[i] == ' ' && depth == 0) name_start = i + 1;
    }
    sig.erase(0, name_start);

    if (starts_with(sig, "ctxformat::")) {
        sig.erase(0, 11);
    }
    if (starts_with(sig, "{anonymous}::")) {
        sig.erase(0, 13);
    }
    return sig;
}

} // namespace

const char* to_string(LogLevel level) {
    return style_of(level).name;
}

bool parse_log_level(const std::string& name, LogLevel& out) {
    std::string n = to_lower(trim(name));
    if (n == "debug") { out = LogLevel::DEBUG; return true; }
    if (n == "info")  { out = LogLevel::INFO;  return true; }
    if (n == "warn" || n == "warning") { out = LogLevel::WARN; return true; }
    if (n == "error") { out = LogLevel::ERROR; return true; }
    return false;
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : level_(LogLevel::INFO), color_(true), out_(stderr) {}

void Logger::log(LogLevel level, const char* file, int line, const char* func, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(level, file, line, func, fmt, args);
    va_end(args);
}

void Logger::vlog(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args) {
    if (!enabled(level)) return;

    char when[32];
    time_t now = time(NULL);
    struct tm local;
    localtime_r(&now, &local);
    strftime(when, sizeof(when), "%Y-%m-%d %H:%M:%S", &local);

    const LevelStyle& style = style_of(level);
    const char* on = color_ ? style.color : "";
    const char* off = color_ ? kReset : "";

    fprintf(out_, "[%s] %s[%s]%s ", when, on, style.name, off);

    // Call sites only at debug verbosity
    if (level_ == LogLevel::DEBUG) {
        fprintf(out_, "%s(%s)%s %s:%d ",
                color_ ? kCallSiteColor : "", call_site(func).c_str(), off,
                base_name(file), line);
    }

    vfprintf(out_, fmt, args);
    fputc('\n', out_);
    fflush(out_);
}

} // namespace ctxformat
