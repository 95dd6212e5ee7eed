#include <textscrub/shutdown.hpp>

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#include <utility>

namespace textscrub {

namespace {

// Write end of the owning handler's pipe, -1 while nobody owns the signals
std::atomic<int> g_wake_fd{-1};

// Written by RestoreSignalHandlers to stop the watcher
constexpr unsigned char kStopByte = 0;

void ClosePipe(int fds[2]) {
  for (int i = 0; i < 2; ++i) {
    if (fds[i] >= 0) {
      close(fds[i]);
      fds[i] = -1;
    }
  }
}

}  // namespace

ShutdownHandler::~ShutdownHandler() {
  RestoreSignalHandlers();
  Shutdown();
}

void ShutdownHandler::SignalHandler(int signum) {
  const int saved_errno = errno;
  const int fd = g_wake_fd.load();
  if (fd >= 0) {
    const unsigned char byte = static_cast<unsigned char>(signum);
    if (write(fd, &byte, 1) < 0) {
      // Pipe full: a wakeup is already pending
    }
  }
  errno = saved_errno;
}

bool ShutdownHandler::InstallSignalHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (handlers_installed_) {
    return true;
  }

  if (pipe2(wake_pipe_, O_CLOEXEC) != 0) {
    return false;
  }

  int expected = -1;
  if (!g_wake_fd.compare_exchange_strong(expected, wake_pipe_[1])) {
    ClosePipe(wake_pipe_);
    return false;
  }

  struct sigaction sa;
  sa.sa_handler = SignalHandler;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = SA_RESTART;

  const bool ok = sigaction(SIGTERM, &sa, &old_sigterm_) == 0;
  const bool ok_int = ok && sigaction(SIGINT, &sa, &old_sigint_) == 0;
  const bool ok_hup = ok_int && sigaction(SIGHUP, &sa, &old_sighup_) == 0;
  if (!ok_hup) {
    if (ok_int) sigaction(SIGINT, &old_sigint_, nullptr);
    if (ok) sigaction(SIGTERM, &old_sigterm_, nullptr);
    g_wake_fd.store(-1);
    ClosePipe(wake_pipe_);
    return false;
  }

  watcher_ = std::thread(&ShutdownHandler::WatchSignals, this);
  handlers_installed_ = true;
  return true;
}

void ShutdownHandler::RestoreSignalHandlers() {
  std::thread watcher;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handlers_installed_) {
      return;
    }

    sigaction(SIGTERM, &old_sigterm_, nullptr);
    sigaction(SIGINT, &old_sigint_, nullptr);
    sigaction(SIGHUP, &old_sighup_, nullptr);
    g_wake_fd.store(-1);

    const unsigned char stop = kStopByte;
    while (write(wake_pipe_[1], &stop, 1) < 0 && errno == EINTR) {
    }
    watcher = std::move(watcher_);
    handlers_installed_ = false;
  }

  // A callback may restore the handlers from the watcher thread itself
  if (watcher.get_id() == std::this_thread::get_id()) {
    watcher.detach();
  } else if (watcher.joinable()) {
    watcher.join();
  }
}

void ShutdownHandler::WatchSignals() {
  const int fd = wake_pipe_[0];
  for (;;) {
    unsigned char byte = kStopByte;
    const ssize_t n = read(fd, &byte, 1);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0 || byte == kStopByte) {
      break;
    }
    int none = 0;
    signal_received_.compare_exchange_strong(none, static_cast<int>(byte));
    Shutdown();
  }
  close(wake_pipe_[0]);
  close(wake_pipe_[1]);
  wake_pipe_[0] = wake_pipe_[1] = -1;
}

bool ShutdownHandler::Shutdown() {
  bool expected = false;
  if (!shutdown_requested_.compare_exchange_strong(expected, true)) {
    WaitForShutdown();
    return false;
  }

  std::vector<std::function<void()>> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks.swap(callbacks_);
  }

  for (const auto& callback : callbacks) {
    if (callback) {
      callback();
    }
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_complete_ = true;
  }
  done_cv_.notify_all();
  return true;
}

void ShutdownHandler::OnShutdown(std::function<void()> callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (shutdown_requested_.load()) {
    return;
  }
  callbacks_.push_back(std::move(callback));
}

void ShutdownHandler::WaitForShutdown() {
  std::unique_lock<std::mutex> lock(mutex_);
  done_cv_.wait(lock, [this] { return shutdown_complete_; });
}

ShutdownHandler& GlobalShutdownHandler() {
  static ShutdownHandler instance;
  return instance;
}

}  // namespace textscrub
