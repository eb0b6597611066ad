#pragma once
/*
 * UniqueFd
 *
 * Purpose: owning wrapper for a POSIX file descriptor; closes on scope exit.
 * Note: close() reports the result so writers can detect delayed I/O errors.
 */
#include <cerrno>
#include <cstddef>
#include <unistd.h>

class UniqueFd {
public:
  UniqueFd() : fd_(-1) {}
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) { close(); fd_ = other.fd_; other.fd_ = -1; }
    return *this;
  }
  ~UniqueFd() { close(); }
  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  bool close() {
    if (fd_ < 0) return true;
    int rc = ::close(fd_);
    fd_ = -1;
    return rc == 0;
  }
private:
  int fd_;
};

// Writes n bytes in chunks of at most chunk; short writes and EINTR are retried.
inline bool write_all(int fd, const char* p, size_t n, size_t chunk) {
  while (n > 0) {
    size_t len = n < chunk ? n : chunk;
    ssize_t w = ::write(fd, p, len);
    if (w < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    p += w;
    n -= static_cast<size_t>(w);
  }
  return true;
}
