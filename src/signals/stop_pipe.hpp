#pragma once

#include <string>

namespace camlight::signals {

// Self-pipe used to wake a blocking `poll` loop from another thread or from
// a signal handler. `Notify` only calls `write(2)` and is async-signal-safe.
class StopPipe {
public:
  StopPipe() = default;
  ~StopPipe();

  StopPipe(const StopPipe&) = delete;
  StopPipe& operator=(const StopPipe&) = delete;

  // Creates the pipe. Idempotent per instance.
  bool Open(std::string& error);

  void Notify() const;

  // True once `Notify` has been called and its byte is readable.
  bool Pending() const;

  int read_fd() const {
    return read_fd_;
  }

private:
  void Close();

  int read_fd_ = -1;
  int write_fd_ = -1;
};

} // namespace camlight::signals
