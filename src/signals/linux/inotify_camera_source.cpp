#include "signals/linux/inotify_camera_source.hpp"

#include <array>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <string>
#include <utility>

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace camlight::signals {

namespace {

constexpr std::uint32_t kWatchMask = IN_OPEN | IN_CLOSE_WRITE | IN_CLOSE_NOWRITE;

// Owns the inotify descriptor for one `Run` call.
class ScopedFd {
public:
  explicit ScopedFd(int fd) : fd_(fd) {}
  ~ScopedFd() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  ScopedFd(const ScopedFd&) = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;

  int get() const {
    return fd_;
  }

private:
  int fd_ = -1;
};

bool StartsWith(std::string_view text, std::string_view prefix) {
  return text.size() >= prefix.size() && text.substr(0, prefix.size()) == prefix;
}

} // namespace

InotifyWatchTarget ResolveWatchTarget(const std::optional<std::string>& video_device) {
  InotifyWatchTarget target;
  if (!video_device.has_value() || video_device->empty()) {
    return target;
  }

  const fs::path device_path(video_device.value());
  if (device_path.has_parent_path()) {
    target.watch_dir = device_path.parent_path();
  }
  target.exact_name = device_path.filename().string();
  return target;
}

bool MatchesWatchTarget(const InotifyWatchTarget& target, std::string_view name) {
  if (target.exact_name.has_value()) {
    return name == target.exact_name.value();
  }
  return StartsWith(name, target.name_prefix);
}

InotifyCameraSource::InotifyCameraSource(InotifyWatchTarget target, core::logging::Logger& logger)
    : target_(std::move(target)), logger_(logger) {
  // A failed pipe is reported by the first `Run`.
  if (!stop_pipe_.Open(init_error_) && init_error_.empty()) {
    init_error_ = "failed to create stop pipe";
  }
}

std::string InotifyCameraSource::Describe() const {
  std::string text = "inotify:" + target_.watch_dir.string();
  if (target_.exact_name.has_value()) {
    text += "/" + target_.exact_name.value();
  }
  return text;
}

void InotifyCameraSource::Stop() {
  stop_requested_.store(true);
  stop_pipe_.Notify();
}

bool InotifyCameraSource::Run(const EdgeSink& sink, std::string& error) {
  error.clear();
  if (!init_error_.empty()) {
    error = init_error_;
    return false;
  }

  ScopedFd inotify_fd(::inotify_init1(IN_NONBLOCK | IN_CLOEXEC));
  if (inotify_fd.get() < 0) {
    error = std::string("failed to initialize inotify: ") + std::strerror(errno);
    return false;
  }

  const std::string watch_dir = target_.watch_dir.string();
  if (::inotify_add_watch(inotify_fd.get(), watch_dir.c_str(), kWatchMask) < 0) {
    error = "failed to watch " + watch_dir + ": " + std::strerror(errno);
    return false;
  }
  logger_.Info("Watching for video device events", {{"path", Describe()}});

  while (!stop_requested_.load()) {
    std::array<pollfd, 2> fds{};
    fds[0].fd = inotify_fd.get();
    fds[0].events = POLLIN;
    fds[1].fd = stop_pipe_.read_fd();
    fds[1].events = POLLIN;

    const int ready = ::poll(fds.data(), fds.size(), -1);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      error = std::string("poll failed on inotify descriptor: ") + std::strerror(errno);
      return false;
    }
    if ((fds[1].revents & POLLIN) != 0) {
      break;
    }
    if ((fds[0].revents & (POLLERR | POLLHUP | POLLNVAL)) != 0) {
      error = "inotify descriptor reported an error condition";
      return false;
    }
    if ((fds[0].revents & POLLIN) != 0 && !DrainEvents(inotify_fd.get(), sink, error)) {
      return false;
    }
  }
  return true;
}

bool InotifyCameraSource::DrainEvents(const int inotify_fd, const EdgeSink& sink,
                                      std::string& error) {
  alignas(inotify_event) std::array<char, 4096> buffer{};

  while (true) {
    const ssize_t length = ::read(inotify_fd, buffer.data(), buffer.size());
    if (length < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        break;
      }
      if (errno == EINTR) {
        continue;
      }
      error = std::string("failed to read inotify events: ") + std::strerror(errno);
      return false;
    }
    if (length == 0) {
      break;
    }

    for (ssize_t offset = 0; offset < length;) {
      const auto* event = reinterpret_cast<const inotify_event*>(buffer.data() + offset);
      offset += static_cast<ssize_t>(sizeof(inotify_event) + event->len);

      if ((event->mask & IN_Q_OVERFLOW) != 0U) {
        logger_.Warn("inotify queue overflowed; open count may drift");
        continue;
      }
      if ((event->mask & IN_IGNORED) != 0U) {
        error = "watch on " + target_.watch_dir.string() + " was removed";
        return false;
      }
      if (event->len == 0U) {
        continue;
      }

      const std::string_view name(event->name);
      if (!MatchesWatchTarget(target_, name)) {
        continue;
      }

      if ((event->mask & IN_OPEN) != 0U) {
        logger_.Info("Video device opened", {{"device", name}});
        tracker_.OnOpen();
      } else if ((event->mask & (IN_CLOSE_WRITE | IN_CLOSE_NOWRITE)) != 0U) {
        logger_.Info("Video device closed", {{"device", name}});
        tracker_.OnClose();
      }
    }
  }

  const std::optional<bool> edge = tracker_.TakeEdge();
  if (!edge.has_value()) {
    return true;
  }

  logger_.Info(edge.value() ? "Detected that a video device has been turned on"
                            : "Detected that a video device has been turned off",
               {{"open_count", std::to_string(tracker_.open_count())}});
  sink(edge.value());
  return true;
}

} // namespace camlight::signals
