#pragma once
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "sync_types.hpp"

using json = nlohmann::json;

#ifndef HELIXD_VERSION
#define HELIXD_VERSION "1.2.0"
#endif

// protocol.hpp
inline constexpr int64_t PROTOCOL_VERSION = 1;
inline constexpr std::size_t kMaxMessageSize = 1024 * 1024;
inline constexpr const char* kDaemonVersion = HELIXD_VERSION;

enum class ErrorCode { InvalidRequest, IncompatibleVersion, Timeout, InternalError };

const char* to_string(ErrorCode code);
std::optional<ErrorCode> error_code_from_string(const std::string& s);

struct PingCommand {};
struct EnqueueSyncCommand {
  std::string directory;
  bool force = false;
};
struct WaitSyncCommand {
  std::string sync_id;
  uint64_t timeout_ms = 0;
};
struct StatusCommand {};
struct ShutdownCommand {
  std::string reason;
};

using Command = std::variant<PingCommand,
                             EnqueueSyncCommand,
                             WaitSyncCommand,
                             StatusCommand,
                             ShutdownCommand>;

// Wire name of the command ("ping", "enqueue_sync", ...).
const char* command_type(const Command& command);

struct Request {
  std::string id;
  int64_t version = PROTOCOL_VERSION;
  std::string tool;
  std::string repo_root;
  Command command;
};

struct ErrorInfo {
  ErrorCode code = ErrorCode::InternalError;
  std::string message;
};

struct Response {
  std::string id;
  bool ok = false;
  json payload;                   // set when ok
  std::optional<ErrorInfo> error; // set when !ok

  static Response success(std::string id, json payload);
  static Response failure(std::string id, ErrorCode code, std::string message);
};

// Raised while decoding a structurally valid JSON document with bad fields.
class ProtocolError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Exactly one of the two members is set.
struct DecodeResult {
  std::optional<Request> request;
  std::optional<Response> error;
};

// Version is checked before the command body, so a version mismatch is
// reported as IncompatibleVersion whatever the command looks like.
DecodeResult decode_request(const std::string& line);

std::string encode_response(const Response& response);
std::string encode_request(const Request& request);
json request_to_json(const Request& request);

// Client side. Throws json::exception or ProtocolError on a malformed line.
Response decode_response(const std::string& line);

json make_ping_payload(const std::string& daemon_version);
json make_enqueue_payload(const std::string& sync_id, uint64_t queued_at_ms, bool is_new);
json make_wait_payload(const std::string& sync_id, JobState state, const std::optional<SyncStats>& stats);
json make_status_payload(const std::vector<QueueInfo>& queues, uint64_t uptime_ms);
json make_shutdown_payload();

json stats_to_json(const SyncStats& stats);
SyncStats stats_from_json(const json& j);

// Splits a byte stream into lines. A line longer than the limit is dropped
// as it arrives and surfaces as one `oversized` frame once its newline shows up.
class LineFramer {
public:
  struct Frame {
    std::string line;
    bool oversized = false;
  };

  explicit LineFramer(std::size_t max_line = kMaxMessageSize);

  void feed(const char* data, std::size_t size);
  std::optional<Frame> next();
  // Flushes a trailing unterminated line at end of stream.
  std::optional<Frame> finish();

  std::size_t buffered() const { return buffer_.size(); }

private:
  std::size_t max_line_;
  std::string buffer_;
  std::deque<Frame> ready_;
  bool discarding_ = false;
};
