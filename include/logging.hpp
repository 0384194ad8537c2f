#pragma once
#include <cstdio>
#include <cstdarg>
#include <mutex>

namespace sendstream {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR, OFF };

// Parses "trace", "debug", "info", "warn", "error" or "off".
bool parse_log_level(const char* s, LogLevel& out);

class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl);
    LogLevel level() const { return level_; }
    bool enabled(LogLevel lvl) const { return lvl >= level_ && lvl != LogLevel::OFF; }
    // Defaults to stderr; the stream is not owned.
    void set_output(std::FILE* out);
    void log(LogLevel lvl, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;
private:
    Logger() = default;
    std::mutex mtx_;
    LogLevel level_ = LogLevel::INFO;
    std::FILE* out_ = nullptr;
    const char* level_str(LogLevel lvl);
};

} // namespace sendstream
