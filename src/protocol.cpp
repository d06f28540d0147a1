#include "protocol.hpp"

#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>

void ScopedFd::reset(int fd) {
  if (fd_ >= 0) ::close(fd_);
  fd_ = fd;
}

LineReader::LineReader(size_t max_line) : max_line_(max_line) {}

ReadResult LineReader::read_line(int fd) {
  while (true) {
    auto pos = buffer_.find('\n');
    if (pos != std::string::npos) {
      std::string line = buffer_.substr(0, pos);
      buffer_.erase(0, pos + 1);
      if (!line.empty() && line.back() == '\r') line.pop_back();
      if (line.size() > max_line_) {
        line.resize(max_line_);
        return {ReadStatus::TooLong, std::move(line)};
      }
      return {ReadStatus::Line, std::move(line)};
    }

    // A client that never sends '\n' must not grow the buffer without bound.
    if (buffer_.size() > max_line_) {
      std::string line = buffer_.substr(0, max_line_);
      buffer_.clear();
      return {ReadStatus::TooLong, std::move(line)};
    }

    char tmp[4096];
    ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
    if (n < 0) {
      if (errno == EINTR) continue;
      return {ReadStatus::Error, std::string(), errno};
    }
    if (n == 0) {
      if (buffer_.empty()) return {ReadStatus::Closed, std::string()};
      std::string line;
      line.swap(buffer_);
      if (line.back() == '\r') line.pop_back();
      return {ReadStatus::Partial, std::move(line)};
    }
    buffer_.append(tmp, tmp + n);
  }
}

bool send_all(int fd, const char* data, size_t len) {
  size_t sent = 0;
  while (sent < len) {
    ssize_t n = ::send(fd, data + sent, len - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    if (n == 0) return false;
    sent += static_cast<size_t>(n);
  }
  return true;
}

bool send_str(int fd, const std::string& s) {
  return send_all(fd, s.data(), s.size());
}

bool set_io_timeout(int fd, unsigned timeout_ms) {
  if (timeout_ms == 0) return true;

  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout_ms / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout_ms % 1000) * 1000);

  if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) return false;
  if (setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) return false;
  return true;
}
