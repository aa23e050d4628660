#pragma once

#include <array>
#include <atomic>
#include <csignal>
#include <functional>
#include <mutex>
#include <vector>

namespace bookland {

/**
 * ShutdownHandler turns SIGTERM/SIGINT/SIGHUP into an orderly stop.
 *
 * Usage:
 *   1. Register work with OnShutdown(), e.g. stopping an event loop
 *   2. Call InstallSignalHandlers()
 *   3. On signal (or an explicit Shutdown()), callbacks run once, in order
 *
 * Callbacks run on the signalled thread and must not block on locks that
 * thread may hold. Release resources such as a UpcCatalog after the event
 * loop has returned, not from a callback.
 *
 * Thread-safe: All methods can be called from any thread.
 */
class ShutdownHandler {
 public:
  ShutdownHandler();
  ~ShutdownHandler();

  // Non-copyable, non-movable
  ShutdownHandler(const ShutdownHandler&) = delete;
  ShutdownHandler& operator=(const ShutdownHandler&) = delete;

  /**
   * Install handlers for SIGTERM, SIGINT and SIGHUP. Returns false (and
   * leaves the previous handlers in place) if any installation fails.
   * Only call once per process.
   */
  bool InstallSignalHandlers();
  void RestoreSignalHandlers();

  /**
   * Run the registered callbacks.
   * Idempotent; returns false if shutdown already happened.
   */
  bool Shutdown();

  bool IsShutdownRequested() const { return shutdown_requested_.load(); }

  /** Callbacks run in registration order. */
  void OnShutdown(std::function<void()> callback);

 private:
  static constexpr std::array<int, 3> kSignals = {SIGTERM, SIGINT, SIGHUP};

  static void SignalHandler(int signum);

  std::mutex mutex_;
  std::vector<std::function<void()>> callbacks_;
  std::atomic<bool> shutdown_requested_{false};
  std::atomic<bool> shutdown_complete_{false};
  bool handlers_installed_ = false;

  // Previous handlers, indexed like kSignals
  std::array<struct sigaction, kSignals.size()> previous_{};
};

/** Process-wide instance used by the server. */
ShutdownHandler& GlobalShutdownHandler();

}  // namespace bookland
