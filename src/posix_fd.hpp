#pragma once
/*
 * UniqueFd
 *
 * Purpose: own a POSIX file descriptor; closes on destruction, move-only.
 * Usage: UniqueFd::open_append(path) for log sinks; write_all handles short writes.
 */
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <string>
#include <string_view>

class UniqueFd {
public:
  UniqueFd() : fd_(-1) {}
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) { close_if_needed(); fd_ = other.fd_; other.fd_ = -1; }
    return *this;
  }
  ~UniqueFd() { close_if_needed(); }

  static UniqueFd open_append(const std::string& path) {
    return UniqueFd(::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644));
  }

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  void reset(int fd = -1) { close_if_needed(); fd_ = fd; }

  bool write_all(std::string_view data) const {
    while (!data.empty()) {
      ssize_t n = ::write(fd_, data.data(), data.size());
      if (n < 0) { if (errno == EINTR) continue; return false; }
      data.remove_prefix(static_cast<size_t>(n));
    }
    return true;
  }
private:
  void close_if_needed() { if (fd_ >= 0) { ::close(fd_); fd_ = -1; } }
  int fd_;
};
