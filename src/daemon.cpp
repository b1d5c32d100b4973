#include "daemon.hpp"

#include <csignal>
#include <stdexcept>

#include "command_dispatcher.hpp"
#include "protocol.hpp"
#include "scan_executor.hpp"
#include "server.hpp"
#include "settings_manager.hpp"
#include "sync_queue.hpp"
#include "utils.hpp"

Daemon::Daemon(std::shared_ptr<SettingsManager> settings, Options options)
  : settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    options_(std::move(options)),
    logger_(std::make_shared<Logger>("helixd")) {}

Daemon::~Daemon() {
  stop();
}

std::size_t Daemon::setting_count(const char* key, std::size_t fallback) const {
  int value = settings_->get<int>(key);
  if(value <= 0) {
    logger_->warn("{} must be positive (got {}); using {}", key, value, fallback);
    return fallback;
  }
  return static_cast<std::size_t>(value);
}

void Daemon::start() {
  if(started_) return;

  if(options_.configure_logging) {
    LogOptions log_options;
    log_options.verbose = settings_->get<bool>("verbose");
    log_options.log_file = expand_tilde(settings_->get<std::string>("log_file"));
    init_logging(log_options);
  }
  for(const auto& key : settings_->keys()) {
    logger_->debug("setting {} = {}", key, settings_->value_as_string(key));
  }

  const std::size_t workers = setting_count("sync_workers", 4);
  int grace = settings_->get<int>("shutdown_grace_ms");
  shutdown_grace_ = std::chrono::milliseconds(grace > 0 ? grace : 0);

  if(!options_.executor) {
    options_.executor = std::make_shared<ScanExecutor>(logger_);
  }
  queue_ = std::make_unique<SyncQueue>(io_, options_.executor, workers, logger_);
  dispatcher_ = std::make_unique<CommandDispatcher>(
    *queue_,
    [this](const std::string& reason){ request_shutdown(reason); },
    logger_);
  server_ = std::make_unique<Server>(io_, settings_->get<std::string>("socket_path"), *dispatcher_, logger_);
  server_->set_stopped_callback([this](){ on_server_stopped(); });
  grace_timer_ = std::make_unique<asio::steady_timer>(io_);

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    finished_ = false;
  }
  work_guard_.emplace(io_.get_executor());

  try {
    server_->start();
  } catch(const std::exception& e) {
    logger_->error("Unable to listen on {}: {}", server_->socket_path(), e.what());
    work_guard_.reset();
    throw;
  }

  if(options_.handle_signals) {
    signals_ = std::make_unique<asio::signal_set>(io_, SIGINT, SIGTERM);
    signals_->async_wait([this](const std::error_code& ec, int signo){
      if(ec) return;
      request_shutdown("signal " + std::to_string(signo));
    });
  }

  started_ = true;
  logger_->info("helixd {} ready (protocol {}, {} io threads, {} sync workers)",
                kDaemonVersion, PROTOCOL_VERSION, setting_count("io_threads", 2), workers);
}

void Daemon::run() {
  if(!started_) start();
  const std::size_t threads = setting_count("io_threads", 2);
  for(std::size_t i = 1; i < threads; ++i) {
    io_threads_.emplace_back([this](){ io_.run(); });
  }
  io_.run();
  join_threads();
  stop();
}

void Daemon::start_background() {
  if(!started_) start();
  if(!io_threads_.empty()) return;
  const std::size_t threads = setting_count("io_threads", 2);
  for(std::size_t i = 0; i < threads; ++i) {
    io_threads_.emplace_back([this](){ io_.run(); });
  }
}

void Daemon::request_shutdown(const std::string& reason) {
  logger_->info("Shutdown requested: {}", reason.empty() ? "(no reason)" : reason);
  if(server_) server_->shutdown();
}

void Daemon::on_server_stopped() {
  if(!grace_timer_) {
    finished();
    return;
  }
  grace_timer_->expires_after(shutdown_grace_);
  grace_timer_->async_wait([this](const std::error_code&){
    finished();
  });
}

void Daemon::finished() {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    finished_ = true;
  }
  state_cv_.notify_all();
  if(signals_) {
    std::error_code ec;
    signals_->cancel(ec);
  }
  work_guard_.reset();
  io_.stop();
}

bool Daemon::wait_stopped(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(state_mutex_);
  return state_cv_.wait_for(lock, timeout, [this](){ return finished_; });
}

void Daemon::join_threads() {
  for(auto& t : io_threads_) {
    if(t.joinable() && t.get_id() != std::this_thread::get_id()) {
      t.join();
    }
  }
  io_threads_.clear();
}

void Daemon::stop() {
  if(!started_) return;
  started_ = false;

  io_.stop();
  join_threads();

  if(signals_) {
    std::error_code ec;
    signals_->cancel(ec);
  }
  if(server_) server_->close();
  if(queue_) queue_->stop();
  work_guard_.reset();

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    finished_ = true;
  }
  state_cv_.notify_all();
  logger_->info("helixd stopped");
}

std::string Daemon::socket_path() const {
  if(server_) return server_->socket_path();
  return expand_tilde(settings_->get<std::string>("socket_path"));
}

SyncQueue& Daemon::queue() {
  if(!queue_) throw std::logic_error("daemon not started");
  return *queue_;
}
