#pragma once

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace textscrub {

/**
 * ShutdownHandler runs registered callbacks once when the process is asked
 * to stop, either by Shutdown() or by SIGTERM/SIGINT/SIGHUP.
 *
 * The signal handler only writes the signal number to a pipe; a watcher
 * thread reads it and calls Shutdown(), so callbacks never run in signal
 * context and may take locks or log.
 *
 * Usage:
 *   ShutdownHandler handler;
 *   handler.OnShutdown([] { drogon::app().quit(); });
 *   handler.InstallSignalHandlers();
 *
 * Thread-safe: All methods can be called from any thread.
 */
class ShutdownHandler {
 public:
  ShutdownHandler() = default;
  ~ShutdownHandler();

  // Non-copyable, non-movable
  ShutdownHandler(const ShutdownHandler&) = delete;
  ShutdownHandler& operator=(const ShutdownHandler&) = delete;

  /**
   * Install handlers for SIGTERM, SIGINT and SIGHUP and start the watcher
   * thread. Only one handler per process can own the signals; returns false
   * if another one does or a system call fails.
   */
  bool InstallSignalHandlers();

  /**
   * Restore the previous signal handlers and stop the watcher thread.
   */
  void RestoreSignalHandlers();

  /**
   * Run all registered callbacks in registration order.
   * Returns true for the call that ran them; later or concurrent calls wait
   * for completion and return false.
   */
  bool Shutdown();

  bool IsShutdownRequested() const { return shutdown_requested_.load(); }

  /** Signal that triggered the shutdown, 0 if none did. */
  int signal_received() const { return signal_received_.load(); }

  /**
   * Register a callback to run during shutdown. Callbacks registered after
   * shutdown has started never run.
   */
  void OnShutdown(std::function<void()> callback);

  /**
   * Block until the callbacks have finished.
   */
  void WaitForShutdown();

 private:
  static void SignalHandler(int signum);
  void WatchSignals();

  std::mutex mutex_;
  std::condition_variable done_cv_;
  std::vector<std::function<void()>> callbacks_;
  bool shutdown_complete_ = false;  // Guarded by mutex_
  std::atomic<bool> shutdown_requested_{false};
  std::atomic<int> signal_received_{0};

  bool handlers_installed_ = false;  // Guarded by mutex_
  int wake_pipe_[2] = {-1, -1};
  std::thread watcher_;

  // Original signal handlers to restore
  struct sigaction old_sigterm_;
  struct sigaction old_sigint_;
  struct sigaction old_sighup_;
};

/**
 * Process-wide handler used by the server.
 */
ShutdownHandler& GlobalShutdownHandler();

}  // namespace textscrub
