#pragma once

#include <cstddef>
#include <string>

// Owns a file descriptor and closes it on destruction.
class ScopedFd {
 public:
  explicit ScopedFd(int fd = -1) : fd_(fd) {}
  ~ScopedFd() { reset(); }

  ScopedFd(ScopedFd&& other) noexcept : fd_(other.release()) {}
  ScopedFd& operator=(ScopedFd&& other) noexcept {
    if (this != &other) {
      reset();
      fd_ = other.release();
    }
    return *this;
  }

  ScopedFd(const ScopedFd&) = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  int release() {
    int fd = fd_;
    fd_ = -1;
    return fd;
  }
  void reset(int fd = -1);

 private:
  int fd_;
};

enum class ReadStatus {
  Line,       // full line, terminator stripped
  Partial,    // peer closed mid-line; what arrived is returned
  TooLong,    // line exceeded max_line; truncated prefix returned
  Closed,     // peer closed before sending anything
  Error,      // recv failed (errno preserved in err)
};

struct ReadResult {
  ReadStatus status;
  std::string line;
  int err = 0;
};

class LineReader {
 public:
  explicit LineReader(size_t max_line = 8192);

  // Reads up to the next '\n' and strips an optional trailing '\r'.
  ReadResult read_line(int fd);

 private:
  size_t max_line_;
  std::string buffer_;
};

// Writes the whole buffer, retrying on EINTR and short writes. Uses
// MSG_NOSIGNAL so a vanished peer is reported as false instead of SIGPIPE.
bool send_all(int fd, const char* data, size_t len);
bool send_str(int fd, const std::string& s);

// Applies SO_RCVTIMEO and SO_SNDTIMEO. timeout_ms == 0 leaves the socket
// fully blocking. Returns false if setsockopt fails.
bool set_io_timeout(int fd, unsigned timeout_ms);
