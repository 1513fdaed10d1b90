#include "signals/stop_pipe.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace camlight::signals {

StopPipe::~StopPipe() {
  Close();
}

bool StopPipe::Open(std::string& error) {
  if (read_fd_ >= 0) {
    return true;
  }

  int fds[2] = {-1, -1};
  if (::pipe(fds) != 0) {
    error = std::string("failed to create stop pipe: ") + std::strerror(errno);
    return false;
  }
  for (const int fd : fds) {
    const int flags = ::fcntl(fd, F_GETFL);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != 0 ||
        ::fcntl(fd, F_SETFD, FD_CLOEXEC) != 0) {
      error = std::string("failed to configure stop pipe: ") + std::strerror(errno);
      ::close(fds[0]);
      ::close(fds[1]);
      return false;
    }
  }

  read_fd_ = fds[0];
  write_fd_ = fds[1];
  return true;
}

void StopPipe::Notify() const {
  if (write_fd_ < 0) {
    return;
  }
  const char byte = 1;
  // A full pipe already guarantees a pending wake-up.
  [[maybe_unused]] const ssize_t written = ::write(write_fd_, &byte, 1);
}

bool StopPipe::Pending() const {
  if (read_fd_ < 0) {
    return false;
  }
  pollfd pfd{};
  pfd.fd = read_fd_;
  pfd.events = POLLIN;
  return ::poll(&pfd, 1, 0) > 0 && (pfd.revents & POLLIN) != 0;
}

void StopPipe::Close() {
  if (read_fd_ >= 0) {
    ::close(read_fd_);
    read_fd_ = -1;
  }
  if (write_fd_ >= 0) {
    ::close(write_fd_);
    write_fd_ = -1;
  }
}

} // namespace camlight::signals
