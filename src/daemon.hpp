#pragma once

#include <asio.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "log.hpp"

class CommandDispatcher;
class Server;
class SettingsManager;
class SyncExecutor;
class SyncQueue;

class Daemon {
public:
  struct Options {
    // Defaults to a ScanExecutor when empty.
    std::shared_ptr<SyncExecutor> executor;
    bool handle_signals = true;
    bool configure_logging = true;
  };

  Daemon(std::shared_ptr<SettingsManager> settings, Options options);
  ~Daemon();

  Daemon(const Daemon&) = delete;
  Daemon& operator=(const Daemon&) = delete;

  // Binds the socket. Throws if it cannot.
  void start();
  // Serves on the calling thread plus io_threads - 1 helpers until shutdown.
  // Connections still open shutdown_grace_ms after shutdown are dropped,
  // pending WaitSync replies included.
  void run();
  void start_background();
  void stop();

  // Same effect as a Shutdown request: stop accepting, remove the socket.
  void request_shutdown(const std::string& reason);
  bool wait_stopped(std::chrono::milliseconds timeout);

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

  std::string socket_path() const;
  SyncQueue& queue();

private:
  std::size_t setting_count(const char* key, std::size_t fallback) const;
  void on_server_stopped();
  void finished();
  void join_threads();

  std::shared_ptr<SettingsManager> settings_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
  std::unique_ptr<asio::signal_set> signals_;
  std::unique_ptr<asio::steady_timer> grace_timer_;
  std::unique_ptr<SyncQueue> queue_;
  std::unique_ptr<CommandDispatcher> dispatcher_;
  std::unique_ptr<Server> server_;
  std::vector<std::thread> io_threads_;
  std::chrono::milliseconds shutdown_grace_{250};
  bool started_ = false;

  std::mutex state_mutex_;
  std::condition_variable state_cv_;
  bool finished_ = false;
};
