#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace {
constexpr const char* kStampedPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
constexpr const char* kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";

struct Sinks {
  std::shared_ptr<spdlog::logger> out;       // info, debug
  std::shared_ptr<spdlog::logger> err;       // warn, error
  std::shared_ptr<spdlog::logger> plain_out; // print
  std::shared_ptr<spdlog::logger> plain_err; // print_err
  std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file;
};

std::mutex g_setup_mutex;
Sinks g_sinks;
std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_logger(const char* name, spdlog::sink_ptr sink, const char* pattern) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  spdlog::register_logger(logger);
  return logger;
}

// Caller holds g_setup_mutex.
void create_sinks() {
  if(g_sinks.out) return;
  g_sinks.out = make_logger("helixd.out", std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), kStampedPattern);
  g_sinks.err = make_logger("helixd.err", std::make_shared<spdlog::sinks::stderr_color_sink_mt>(), kStampedPattern);
  g_sinks.plain_out = make_logger("helixd.print", std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), "%v");
  g_sinks.plain_err = make_logger("helixd.print_err", std::make_shared<spdlog::sinks::stderr_color_sink_mt>(), "%v");

  g_sinks.out->flush_on(spdlog::level::warn);
  g_sinks.err->flush_on(spdlog::level::warn);
  g_sinks.plain_out->flush_on(spdlog::level::info);
  g_sinks.plain_err->flush_on(spdlog::level::err);
}

spdlog::logger* sink_for(LogChannel channel) {
  std::lock_guard<std::mutex> lock(g_setup_mutex);
  create_sinks();
  switch(channel) {
    case LogChannel::Print: return g_sinks.plain_out.get();
    case LogChannel::PrintErr: return g_sinks.plain_err.get();
    case LogChannel::Warn:
    case LogChannel::Error: return g_sinks.err.get();
    case LogChannel::Info:
    case LogChannel::Debug: return g_sinks.out.get();
  }
  return g_sinks.out.get();
}

} // namespace

const char* channel_name(LogChannel channel) {
  switch(channel) {
    case LogChannel::Info: return "info";
    case LogChannel::Warn: return "warn";
    case LogChannel::Error: return "error";
    case LogChannel::Debug: return "debug";
    case LogChannel::Print: return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

spdlog::level::level_enum channel_level(LogChannel channel) {
  switch(channel) {
    case LogChannel::Warn: return spdlog::level::warn;
    case LogChannel::Error:
    case LogChannel::PrintErr: return spdlog::level::err;
    case LogChannel::Debug: return spdlog::level::debug;
    case LogChannel::Info:
    case LogChannel::Print: return spdlog::level::info;
  }
  return spdlog::level::info;
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

void init_logging(const LogOptions& options) {
  std::lock_guard<std::mutex> lock(g_setup_mutex);
  create_sinks();

  const auto level = options.verbose ? spdlog::level::debug : spdlog::level::info;
  g_sinks.out->set_level(level);
  g_sinks.err->set_level(spdlog::level::info);
  g_sinks.plain_out->set_level(spdlog::level::info);
  g_sinks.plain_err->set_level(spdlog::level::info);

  // daemon output also lands in the log file, plain CLI output does not
  if(!options.log_file.empty() && !g_sinks.file) {
    try {
      g_sinks.file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.log_file, false);
      g_sinks.file->set_pattern(kFilePattern);
      g_sinks.out->sinks().push_back(g_sinks.file);
      g_sinks.err->sinks().push_back(g_sinks.file);
      g_sinks.out->flush_on(spdlog::level::info);
    } catch(const spdlog::spdlog_ex& e) {
      g_sinks.err->error("Unable to open log file {}: {}", options.log_file, e.what());
    }
  }

  spdlog::set_default_logger(g_sinks.out);
  spdlog::set_level(level);
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::emit(LogChannel channel, const std::string& message) {
  const std::string label = name_.empty()
    ? std::string(channel_name(channel))
    : name_ + ":" + channel_name(channel);
  if(notify_listeners(label, channel_level(channel), message)) return;
  detail::write_to_sinks(channel, label, message);
}

bool Logger::notify_listeners(const std::string& channel,
                              spdlog::level::level_enum level,
                              const std::string& message) {
  std::vector<ListenerBinding> bindings;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    if(listeners_.empty()) return false;
    bindings.reserve(listeners_.size());
    for(const auto& entry : listeners_) bindings.push_back(entry.second);
  }
  bool claimed = false;
  for(auto& binding : bindings) {
    try {
      if(binding.callback(binding.user_data, channel, level, message)) claimed = true;
    } catch(const std::exception& e) {
      detail::write_to_sinks(LogChannel::Error, "log", fmt::format("log listener threw: {}", e.what()));
    }
  }
  return claimed;
}

namespace detail {

void write_to_sinks(LogChannel channel, const std::string& label, const std::string& message) {
  if(!log_passthrough()) return;
  spdlog::logger* sink = sink_for(channel);
  if(!sink) return;
  if(label.empty()) {
    sink->log(channel_level(channel), message);
  } else {
    sink->log(channel_level(channel), fmt::format("[{}] {}", label, message));
  }
}

} // namespace detail
