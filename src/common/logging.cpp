#include "logging.hpp"
#include <chrono>
#include <ctime>
#include <strings.h>

namespace sendstream {

bool parse_log_level(const char *s, LogLevel &out) {
  static const struct {
    const char *name;
    LogLevel lvl;
  } kLevels[] = {{"trace", LogLevel::TRACE}, {"debug", LogLevel::DEBUG},
                 {"info", LogLevel::INFO},   {"warn", LogLevel::WARN},
                 {"error", LogLevel::ERROR}, {"off", LogLevel::OFF}};
  if (!s)
    return false;
  for (const auto &l : kLevels) {
    if (strcasecmp(s, l.name) == 0) {
      out = l.lvl;
      return true;
    }
  }
  return false;
}

Logger &Logger::instance() {
  static Logger inst;
  return inst;
}
void Logger::set_level(LogLevel lvl) { level_ = lvl; }
void Logger::set_output(std::FILE *out) {
  std::lock_guard<std::mutex> lk(mtx_);
  out_ = out;
}
const char *Logger::level_str(LogLevel lvl) {
  switch (lvl) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  default:
    return "ERROR";
  }
}

void Logger::log(LogLevel lvl, const char *fmt, ...) {
  if (!enabled(lvl))
    return;
  std::lock_guard<std::mutex> lk(mtx_);
  std::FILE *out = out_ ? out_ : stderr;
  using namespace std::chrono;
  auto now = system_clock::now();
  auto t = system_clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&t, &tm);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm);
  std::fprintf(out, "%s [%s] ", ts, level_str(lvl));
  va_list ap;
  va_start(ap, fmt);
  std::vfprintf(out, fmt, ap);
  va_end(ap);
  std::fprintf(out, "\n");
}

} // namespace sendstream
