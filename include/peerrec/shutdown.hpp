#pragma once

#include <array>
#include <atomic>
#include <csignal>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace peerrec {

class Store;  // Forward declaration

/**
 * ShutdownHandler stops a serving process in two phases:
 *   1. Stop hooks run in registration order (stop accepting requests,
 *      let in-flight ones drain).
 *   2. Registered stores are closed, so no request sees a closed store.
 *
 * SIGTERM, SIGINT and SIGHUP trigger Shutdown() once
 * InstallSignalHandlers() has been called. The signal that triggered it is
 * kept in ReceivedSignal().
 *
 * Thread-safe: All methods can be called from any thread.
 */
class ShutdownHandler {
 public:
  ShutdownHandler();
  ~ShutdownHandler();

  ShutdownHandler(const ShutdownHandler&) = delete;
  ShutdownHandler& operator=(const ShutdownHandler&) = delete;

  /**
   * Close store during phase 2. The pointer must stay valid until
   * UnregisterStore() or shutdown.
   */
  void RegisterStore(Store* store);
  void UnregisterStore(Store* store);

  /**
   * Run hook during phase 1. name is only used to describe the hook in
   * HookNames().
   */
  void OnShutdown(std::string name, std::function<void()> hook);

  /** Names of the registered stop hooks, in run order. */
  std::vector<std::string> HookNames() const;

  /**
   * Install handlers for SIGTERM, SIGINT and SIGHUP. Returns false when
   * sigaction fails (previous handlers are then left in place).
   */
  bool InstallSignalHandlers();
  void RestoreSignalHandlers();

  /**
   * Run both phases. Idempotent: returns false when another caller already
   * ran (or is running) them, after waiting for it to finish.
   */
  bool Shutdown();

  bool IsShutdownRequested() const;

  /** Signal number that triggered shutdown, 0 when none did. */
  int ReceivedSignal() const { return received_signal_.load(); }

  /** Block until Shutdown() has completed. */
  void WaitForShutdown();

 private:
  static void SignalHandler(int signum);

  mutable std::mutex mutex_;
  std::vector<Store*> stores_;
  std::vector<std::pair<std::string, std::function<void()>>> hooks_;
  std::atomic<bool> shutdown_requested_{false};
  std::atomic<bool> shutdown_complete_{false};
  std::atomic<int> received_signal_{0};
  bool handlers_installed_ = false;

  // Previous actions, indexed like kShutdownSignals.
  std::array<struct sigaction, 3> previous_actions_{};
};

/** Signals that trigger shutdown once handlers are installed. */
inline constexpr std::array<int, 3> kShutdownSignals = {SIGTERM, SIGINT, SIGHUP};

/** Process-wide handler used by peerrec_server. */
ShutdownHandler& GlobalShutdownHandler();

}  // namespace peerrec
