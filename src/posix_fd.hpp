#pragma once
#include <fcntl.h>
#include <unistd.h>

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
  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  void reset(int fd = -1) { close_if_needed(); fd_ = fd; }
private:
  void close_if_needed() { if (fd_ >= 0) { ::close(fd_); fd_ = -1; } }
  int fd_;
};

// Close-on-exec pipe, so children forked by other threads never inherit it.
inline bool make_pipe(UniqueFd& read_end, UniqueFd& write_end) {
  int fds[2];
#if defined(__linux__)
  if (::pipe2(fds, O_CLOEXEC) != 0) return false;
#else
  if (::pipe(fds) != 0) return false;
  ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
  ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
#endif
  read_end.reset(fds[0]);
  write_end.reset(fds[1]);
  return true;
}

// Writes all bytes, retrying short writes. Returns false on error.
inline bool write_all(int fd, const char* p, size_t len) {
  while (len > 0) {
    ssize_t w = ::write(fd, p, len);
    if (w < 0) return false;
    p += w;
    len -= static_cast<size_t>(w);
  }
  return true;
}
