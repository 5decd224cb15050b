#include <peerrec/shutdown.hpp>
#include <peerrec/store.hpp>

#include <algorithm>
#include <condition_variable>
#include <thread>

namespace peerrec {

namespace {
// Handler reached from the signal handler
ShutdownHandler* g_handler = nullptr;
std::mutex g_handler_mutex;
std::condition_variable g_shutdown_cv;
}  // namespace

ShutdownHandler::ShutdownHandler() {
  std::lock_guard<std::mutex> lock(g_handler_mutex);
  if (!g_handler) {
    g_handler = this;
  }
}

ShutdownHandler::~ShutdownHandler() {
  RestoreSignalHandlers();
  Shutdown();

  std::lock_guard<std::mutex> lock(g_handler_mutex);
  if (g_handler == this) {
    g_handler = nullptr;
  }
}

void ShutdownHandler::RegisterStore(Store* store) {
  if (!store) return;

  std::lock_guard<std::mutex> lock(mutex_);
  if (std::find(stores_.begin(), stores_.end(), store) == stores_.end()) {
    stores_.push_back(store);
  }
}

void ShutdownHandler::UnregisterStore(Store* store) {
  if (!store) return;

  std::lock_guard<std::mutex> lock(mutex_);
  stores_.erase(std::remove(stores_.begin(), stores_.end(), store), stores_.end());
}

void ShutdownHandler::OnShutdown(std::string name, std::function<void()> hook) {
  std::lock_guard<std::mutex> lock(mutex_);
  hooks_.emplace_back(std::move(name), std::move(hook));
}

std::vector<std::string> ShutdownHandler::HookNames() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  names.reserve(hooks_.size());
  for (const auto& [name, hook] : hooks_) {
    names.push_back(name);
  }
  return names;
}

void ShutdownHandler::SignalHandler(int signum) {
  ShutdownHandler* handler = nullptr;
  {
    std::lock_guard<std::mutex> lock(g_handler_mutex);
    handler = g_handler;
  }

  if (handler) {
    int expected = 0;
    handler->received_signal_.compare_exchange_strong(expected, signum);
    handler->Shutdown();
  }

  g_shutdown_cv.notify_all();
}

bool ShutdownHandler::InstallSignalHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (handlers_installed_) return true;

  struct sigaction action {};
  action.sa_handler = SignalHandler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = SA_RESTART;

  for (size_t i = 0; i < kShutdownSignals.size(); ++i) {
    if (sigaction(kShutdownSignals[i], &action, &previous_actions_[i]) != 0) {
      // Roll back the ones already replaced
      while (i-- > 0) {
        sigaction(kShutdownSignals[i], &previous_actions_[i], nullptr);
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

  for (size_t i = 0; i < kShutdownSignals.size(); ++i) {
    sigaction(kShutdownSignals[i], &previous_actions_[i], nullptr);
  }
  handlers_installed_ = false;
}

bool ShutdownHandler::Shutdown() {
  bool expected = false;
  if (!shutdown_requested_.compare_exchange_strong(expected, true)) {
    while (!shutdown_complete_.load()) {
      std::this_thread::yield();
    }
    return false;
  }

  std::vector<Store*> stores;
  std::vector<std::pair<std::string, std::function<void()>>> hooks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stores.swap(stores_);
    hooks = hooks_;
  }

  // Phase 1: stop request intake
  for (const auto& [name, hook] : hooks) {
    if (hook) {
      hook();
    }
  }

  // Phase 2: release storage
  for (Store* store : stores) {
    store->Close();
  }

  shutdown_complete_.store(true);
  g_shutdown_cv.notify_all();
  return true;
}

bool ShutdownHandler::IsShutdownRequested() const {
  return shutdown_requested_.load();
}

void ShutdownHandler::WaitForShutdown() {
  std::unique_lock<std::mutex> lock(g_handler_mutex);
  g_shutdown_cv.wait(lock, [this] { return shutdown_complete_.load(); });
}

ShutdownHandler& GlobalShutdownHandler() {
  static ShutdownHandler instance;
  return instance;
}

}  // namespace peerrec
