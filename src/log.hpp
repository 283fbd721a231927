#pragma once
/*
 * Log
 *
 * Purpose: leveled, timestamped log lines appended to a file.
 * Note: the terminal owns stdout/stderr while the UI runs, so logs never go there.
 * Usage: log_open(path) once in main; LOG_INFO("loaded {} foods", n).
 */
#include <string>
#include <string_view>
#include <utility>
#include <fmt/core.h>

enum class LogLevel { Debug, Info, Warning, Error };

// false when the file cannot be opened; logging is then disabled
bool log_open(const std::string& path);
void log_close();
void log_set_level(LogLevel lvl);
bool log_enabled(LogLevel lvl);
void log_write(LogLevel lvl, std::string_view msg);

template <typename... Args>
void log_fmt(LogLevel lvl, fmt::format_string<Args...> f, Args&&... args) {
  if (!log_enabled(lvl)) return;
  log_write(lvl, fmt::format(f, std::forward<Args>(args)...));
}

#define LOG_DEBUG(...) ::log_fmt(::LogLevel::Debug, __VA_ARGS__)
#define LOG_INFO(...)  ::log_fmt(::LogLevel::Info, __VA_ARGS__)
#define LOG_WARN(...)  ::log_fmt(::LogLevel::Warning, __VA_ARGS__)
#define LOG_ERROR(...) ::log_fmt(::LogLevel::Error, __VA_ARGS__)
