#include "log.hpp"
#include "posix_fd.hpp"
#include "config.hpp"
#include <ctime>

namespace {

struct LogState {
  UniqueFd fd;
  LogLevel min_level = static_cast<LogLevel>(MT_LOG_LEVEL);
};

LogState& state() {
  static LogState s;
  return s;
}

const char* level_name(LogLevel l) {
  switch (l) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warning: return "WARN";
    case LogLevel::Error: return "ERROR";
  }
  return "UNKNOWN";
}

}

bool log_open(const std::string& path) {
  state().fd = UniqueFd::open_append(path);
  return state().fd.valid();
}

void log_close() { state().fd.reset(); }

void log_set_level(LogLevel lvl) { state().min_level = lvl; }

bool log_enabled(LogLevel lvl) {
  return state().fd.valid() && lvl >= state().min_level;
}

void log_write(LogLevel lvl, std::string_view msg) {
  if (!log_enabled(lvl)) return;
  char ts[20];
  std::time_t now = std::time(nullptr);
  std::tm tm{};
  localtime_r(&now, &tm);
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm);
  std::string line = fmt::format("[{}] {}: {}\n", ts, level_name(lvl), msg);
  // a failing log sink is dropped rather than taking the UI down with it
  if (!state().fd.write_all(line)) state().fd.reset();
}
