#pragma once

#include "daemon.hpp"
#include "log.hpp"
#include "sync_queue.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

// Fails the enclosing bool-returning test with the expression text.
#define HELIXD_EXPECT(cond)                                                     \
  do {                                                                          \
    if(!(cond)) {                                                               \
      std::cout << "\n    expectation failed: " #cond " (" << __FILE__ << ":"   \
                << __LINE__ << ")\n";                                           \
      return false;                                                             \
    }                                                                           \
  } while(0)

namespace helixd::test {

inline std::filesystem::path scratch_dir(const std::string& suite, const std::string& name) {
  auto dir = std::filesystem::temp_directory_path() /
             ("helixd_" + suite + "_" + std::to_string(::getpid())) / name;
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  std::filesystem::create_directories(dir, ec);
  return dir;
}

inline void write_file(const std::filesystem::path& path, const std::string& content) {
  std::error_code ec;
  if(path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if(!out) throw std::runtime_error("cannot write " + path.string());
  out << content;
}

inline void write_config_before_start(const std::filesystem::path& path,
                                      const nlohmann::json& content) {
  write_file(path, content.dump(2));
}

// Executor whose jobs block until open() is called. Counts starts and runs.
class GatedExecutor : public SyncExecutor {
public:
  SyncStats execute(const QueueKey& key) override {
    std::unique_lock<std::mutex> lock(mutex_);
    ++started_;
    cv_.notify_all();
    cv_.wait(lock, [this]{ return open_; });
    ++finished_;
    cv_.notify_all();
    if(fail_) throw std::runtime_error("scan of " + key.directory + " failed");
    SyncStats stats;
    stats.files_scanned = 3;
    stats.files_added = 1;
    return stats;
  }

  void open() {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = true;
    cv_.notify_all();
  }

  void set_fail(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_ = fail;
  }

  std::size_t started() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_;
  }

  bool wait_started(std::size_t count, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&]{ return started_ >= count; });
  }

  bool wait_finished(std::size_t count, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&]{ return finished_ >= count; });
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool open_ = false;
  bool fail_ = false;
  std::size_t started_ = 0;
  std::size_t finished_ = 0;
};

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger,
              const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener(make_listener(label), nullptr);
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({logger, handle});
  }

  // Holds the daemon's logger, so detaching after the daemon is gone is safe.
  void attach(Daemon& daemon, const std::string& label = std::string()) {
    attach(daemon.logger(), label);
  }

  void detach_all() {
    std::vector<Attachment> pending;
    {
      std::lock_guard<std::mutex> lock(attachments_mutex_);
      pending.swap(attachments_);
    }
    for(auto& attachment : pending) {
      if(attachment.logger && attachment.handle != 0) {
        attachment.logger->remove_listener(attachment.handle);
      }
    }
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool wait_for_substring(const std::string& needle,
                          std::chrono::milliseconds timeout) {
    auto predicate = [&]{
      return std::any_of(lines_.begin(), lines_.end(),
        [&](const std::string& line){ return line.find(needle) != std::string::npos; });
    };
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while(!predicate()) {
      if(cv_.wait_until(lock, deadline) == std::cv_status::timeout) break;
    }
    return predicate();
  }

private:
  struct Attachment {
    std::shared_ptr<Logger> logger;
    LogListenerHandle handle = 0;
  };

  Logger::Listener make_listener(const std::string& label) {
    return [this, label](void*,
                         const std::string& channel,
                         spdlog::level::level_enum,
                         const std::string& message) {
      std::lock_guard<std::mutex> lock(mutex_);
      lines_.emplace_back((label.empty() ? channel : label) + ": " + message);
      cv_.notify_all();
      return false;
    };
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::string> lines_;
  std::mutex attachments_mutex_;
  std::vector<Attachment> attachments_;
};

inline bool wait_for_condition(std::function<bool()> predicate,
                               std::chrono::milliseconds timeout,
                               std::chrono::milliseconds interval = std::chrono::milliseconds(10)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while(std::chrono::steady_clock::now() < deadline) {
    if(predicate()) return true;
    std::this_thread::sleep_for(interval);
  }
  return predicate();
}

struct TestContext {
  LogCapture& logs;
  bool verbose = false;
};

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

// Shared main body: prints a dot per passing test, dumps captured logs for failures.
inline int run_tests(const char* suite, const std::vector<TestCase>& tests, int argc, char** argv) {
  bool verbose = (std::getenv("HELIXD_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  bool show_logs = (std::getenv("HELIXD_TEST_LOGS") != nullptr) || verbose;
  const bool suppress_logs = !show_logs;
  if(suppress_logs) {
    set_log_passthrough(false);
  }
  LogOptions log_options;
  log_options.verbose = verbose;
  init_logging(log_options);

  LogCapture logs;
  TestContext ctx{logs, verbose};

  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;

  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    logs.detach_all();
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";
  if(suppress_logs) {
    set_log_passthrough(true);
  }
  std::error_code ec;
  std::filesystem::remove_all(std::filesystem::temp_directory_path() /
                              ("helixd_" + std::string(suite) + "_" + std::to_string(::getpid())), ec);
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}

} // namespace helixd::test
