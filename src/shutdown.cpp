#include <bookland/shutdown.hpp>

#include <thread>

namespace bookland {

namespace {
// Instance reachable from the signal handler
std::atomic<ShutdownHandler*> g_handler{nullptr};
}  // namespace

ShutdownHandler::ShutdownHandler() {
  ShutdownHandler* expected = nullptr;
  g_handler.compare_exchange_strong(expected, this);
}

ShutdownHandler::~ShutdownHandler() {
  RestoreSignalHandlers();
  Shutdown();

  ShutdownHandler* expected = this;
  g_handler.compare_exchange_strong(expected, nullptr);
}

void ShutdownHandler::SignalHandler(int signum) {
  (void)signum;
  if (ShutdownHandler* handler = g_handler.load()) {
    handler->Shutdown();
  }
}

bool ShutdownHandler::InstallSignalHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (handlers_installed_) return true;

  struct sigaction sa {};
  sa.sa_handler = SignalHandler;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = SA_RESTART;

  for (size_t i = 0; i < kSignals.size(); ++i) {
    if (sigaction(kSignals[i], &sa, &previous_[i]) != 0) {
      // Roll back the ones already installed
      while (i-- > 0) {
        sigaction(kSignals[i], &previous_[i], nullptr);
      }
      return false;
    }
  }

  handlers_installed_ = true;
  return true;
}

void ShutdownHandler::RestoreSignalHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!handlers_installed_) return;

  for (size_t i = 0; i < kSignals.size(); ++i) {
    sigaction(kSignals[i], &previous_[i], nullptr);
  }
  handlers_installed_ = false;
}

bool ShutdownHandler::Shutdown() {
  bool expected = false;
  if (!shutdown_requested_.compare_exchange_strong(expected, true)) {
    // Someone else is shutting down; wait for them to finish
    while (!shutdown_complete_.load()) {
      std::this_thread::yield();
    }
    return false;
  }

  std::vector<std::function<void()>> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks = callbacks_;
  }

  for (const auto& callback : callbacks) {
    if (callback) callback();
  }

  shutdown_complete_.store(true);
  return true;
}

void ShutdownHandler::OnShutdown(std::function<void()> callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.push_back(std::move(callback));
}

ShutdownHandler& GlobalShutdownHandler() {
  static ShutdownHandler instance;
  return instance;
}

}  // namespace bookland
