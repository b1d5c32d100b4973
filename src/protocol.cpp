#include "protocol.hpp"

#include <cstring>
#include <utility>

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

const json& require(const json& j, const char* key) {
  auto it = j.find(key);
  if(it == j.end()) throw ProtocolError(std::string("missing field `") + key + "`");
  return *it;
}

std::string require_string(const json& j, const char* key) {
  const auto& v = require(j, key);
  if(!v.is_string()) throw ProtocolError(std::string("field `") + key + "` must be a string");
  return v.get<std::string>();
}

uint64_t require_unsigned(const json& j, const char* key) {
  const auto& v = require(j, key);
  if(!v.is_number_integer()) throw ProtocolError(std::string("field `") + key + "` must be an integer");
  if(!v.is_number_unsigned()) throw ProtocolError(std::string("field `") + key + "` must not be negative");
  return v.get<uint64_t>();
}

Command decode_command(const json& j) {
  if(!j.is_object()) throw ProtocolError("field `command` must be an object");
  const std::string type = require_string(j, "type");

  if(type == "ping") return PingCommand{};
  if(type == "status") return StatusCommand{};
  if(type == "enqueue_sync") {
    EnqueueSyncCommand c;
    c.directory = require_string(j, "directory");
    auto it = j.find("force");
    if(it != j.end() && !it->is_null()) {
      if(!it->is_boolean()) throw ProtocolError("field `force` must be a boolean");
      c.force = it->get<bool>();
    }
    return c;
  }
  if(type == "wait_sync") {
    WaitSyncCommand c;
    c.sync_id = require_string(j, "sync_id");
    c.timeout_ms = require_unsigned(j, "timeout_ms");
    return c;
  }
  if(type == "shutdown") {
    ShutdownCommand c;
    auto it = j.find("reason");
    if(it != j.end() && !it->is_null()) {
      if(!it->is_string()) throw ProtocolError("field `reason` must be a string");
      c.reason = it->get<std::string>();
    }
    return c;
  }
  throw ProtocolError("unknown command type `" + type + "`");
}

json command_to_json(const Command& command) {
  json j;
  j["type"] = command_type(command);
  std::visit(overloaded{
    [](const PingCommand&) {},
    [](const StatusCommand&) {},
    [&](const EnqueueSyncCommand& c) {
      j["directory"] = c.directory;
      j["force"] = c.force;
    },
    [&](const WaitSyncCommand& c) {
      j["sync_id"] = c.sync_id;
      j["timeout_ms"] = c.timeout_ms;
    },
    [&](const ShutdownCommand& c) {
      j["reason"] = c.reason;
    }
  }, command);
  return j;
}

std::string dump_line(const json& j) {
  // parser messages may echo raw input bytes
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace

const char* to_string(JobState s) {
  switch(s) {
    case JobState::Queued: return "queued";
    case JobState::Running: return "running";
    case JobState::Succeeded: return "succeeded";
    case JobState::Failed: return "failed";
  }
  return "unknown";
}

std::optional<JobState> job_state_from_string(const std::string& s) {
  if(s == "queued") return JobState::Queued;
  if(s == "running") return JobState::Running;
  if(s == "succeeded") return JobState::Succeeded;
  if(s == "failed") return JobState::Failed;
  return std::nullopt;
}

const char* to_string(ErrorCode code) {
  switch(code) {
    case ErrorCode::InvalidRequest: return "invalid_request";
    case ErrorCode::IncompatibleVersion: return "incompatible_version";
    case ErrorCode::Timeout: return "timeout";
    case ErrorCode::InternalError: return "internal_error";
  }
  return "internal_error";
}

std::optional<ErrorCode> error_code_from_string(const std::string& s) {
  if(s == "invalid_request") return ErrorCode::InvalidRequest;
  if(s == "incompatible_version") return ErrorCode::IncompatibleVersion;
  if(s == "timeout") return ErrorCode::Timeout;
  if(s == "internal_error") return ErrorCode::InternalError;
  return std::nullopt;
}

const char* command_type(const Command& command) {
  return std::visit(overloaded{
    [](const PingCommand&) { return "ping"; },
    [](const EnqueueSyncCommand&) { return "enqueue_sync"; },
    [](const WaitSyncCommand&) { return "wait_sync"; },
    [](const StatusCommand&) { return "status"; },
    [](const ShutdownCommand&) { return "shutdown"; }
  }, command);
}

Response Response::success(std::string id, json payload) {
  Response r;
  r.id = std::move(id);
  r.ok = true;
  r.payload = std::move(payload);
  return r;
}

Response Response::failure(std::string id, ErrorCode code, std::string message) {
  Response r;
  r.id = std::move(id);
  r.ok = false;
  r.error = ErrorInfo{code, std::move(message)};
  return r;
}

DecodeResult decode_request(const std::string& line) {
  DecodeResult result;
  json j;
  try {
    j = json::parse(line);
  } catch(const json::parse_error& e) {
    result.error = Response::failure("", ErrorCode::InvalidRequest, e.what());
    return result;
  }
  if(!j.is_object()) {
    result.error = Response::failure("", ErrorCode::InvalidRequest, "request must be a JSON object");
    return result;
  }

  std::string id;
  auto id_it = j.find("id");
  if(id_it != j.end() && id_it->is_string()) id = id_it->get<std::string>();

  try {
    const auto& version = require(j, "version");
    if(!version.is_number_integer()) throw ProtocolError("field `version` must be an integer");
    // compared without narrowing so values past INT64_MAX are echoed as sent
    const bool matches = version.is_number_unsigned()
      ? version.get<uint64_t>() == static_cast<uint64_t>(PROTOCOL_VERSION)
      : version.get<int64_t>() == PROTOCOL_VERSION;
    if(!matches) {
      result.error = Response::failure(id, ErrorCode::IncompatibleVersion,
        "Protocol version mismatch: expected " + std::to_string(PROTOCOL_VERSION) +
        ", got " + version.dump());
      return result;
    }

    Request req;
    req.id = require_string(j, "id");
    req.version = PROTOCOL_VERSION;
    req.tool = require_string(j, "tool");
    req.repo_root = require_string(j, "repo_root");
    req.command = decode_command(require(j, "command"));
    result.request = std::move(req);
  } catch(const std::exception& e) {
    result.error = Response::failure(id, ErrorCode::InvalidRequest, e.what());
  }
  return result;
}

json request_to_json(const Request& request) {
  json j;
  j["id"] = request.id;
  j["version"] = request.version;
  j["tool"] = request.tool;
  j["repo_root"] = request.repo_root;
  j["command"] = command_to_json(request.command);
  return j;
}

std::string encode_request(const Request& request) {
  return dump_line(request_to_json(request));
}

std::string encode_response(const Response& response) {
  json j;
  j["id"] = response.id;
  j["ok"] = response.ok;
  if(response.ok) {
    j["payload"] = response.payload;
  } else {
    const auto err = response.error.value_or(ErrorInfo{});
    j["error"] = {{"code", to_string(err.code)}, {"message", err.message}};
  }
  return dump_line(j);
}

Response decode_response(const std::string& line) {
  auto j = json::parse(line);
  if(!j.is_object()) throw ProtocolError("response must be a JSON object");
  Response r;
  r.id = require_string(j, "id");
  const auto& ok = require(j, "ok");
  if(!ok.is_boolean()) throw ProtocolError("field `ok` must be a boolean");
  r.ok = ok.get<bool>();
  if(r.ok) {
    r.payload = j.value("payload", json::object());
  } else {
    const auto& err = require(j, "error");
    auto code = error_code_from_string(require_string(err, "code"));
    if(!code) throw ProtocolError("unknown error code");
    r.error = ErrorInfo{*code, err.value("message", "")};
  }
  return r;
}

json stats_to_json(const SyncStats& stats) {
  json j;
  j["files_scanned"] = stats.files_scanned;
  j["files_added"] = stats.files_added;
  j["files_modified"] = stats.files_modified;
  j["files_removed"] = stats.files_removed;
  j["duration_ms"] = stats.duration_ms;
  if(stats.error) j["error"] = *stats.error;
  return j;
}

SyncStats stats_from_json(const json& j) {
  SyncStats s;
  s.files_scanned = j.value("files_scanned", uint64_t{0});
  s.files_added = j.value("files_added", uint64_t{0});
  s.files_modified = j.value("files_modified", uint64_t{0});
  s.files_removed = j.value("files_removed", uint64_t{0});
  s.duration_ms = j.value("duration_ms", uint64_t{0});
  if(j.contains("error") && j["error"].is_string()) s.error = j["error"].get<std::string>();
  return s;
}

json make_ping_payload(const std::string& daemon_version) {
  json j;
  j["type"] = "ping";
  j["daemon_version"] = daemon_version;
  return j;
}

json make_enqueue_payload(const std::string& sync_id, uint64_t queued_at_ms, bool is_new) {
  json j;
  j["type"] = "enqueue_sync";
  j["sync_id"] = sync_id;
  j["queued_at_ms"] = queued_at_ms;
  j["is_new"] = is_new;
  return j;
}

json make_wait_payload(const std::string& sync_id, JobState state, const std::optional<SyncStats>& stats) {
  json j;
  j["type"] = "wait_sync";
  j["sync_id"] = sync_id;
  j["state"] = to_string(state);
  if(stats) j["stats"] = stats_to_json(*stats);
  return j;
}

json make_status_payload(const std::vector<QueueInfo>& queues, uint64_t uptime_ms) {
  json arr = json::array();
  for(const auto& q : queues) {
    json item;
    item["repo_root"] = q.key.repo_root;
    item["tool"] = q.key.tool;
    item["directory"] = q.key.directory;
    item["sync_id"] = q.sync_id;
    item["state"] = to_string(q.state);
    item["age_ms"] = q.age_ms;
    arr.push_back(std::move(item));
  }
  json j;
  j["type"] = "status";
  j["queues"] = std::move(arr);
  j["uptime_ms"] = uptime_ms;
  return j;
}

json make_shutdown_payload() {
  json j;
  j["type"] = "shutdown";
  return j;
}

LineFramer::LineFramer(std::size_t max_line) : max_line_(max_line) {}

void LineFramer::feed(const char* data, std::size_t size) {
  std::size_t pos = 0;
  while(pos < size) {
    const void* hit = std::memchr(data + pos, '\n', size - pos);
    const std::size_t end = hit ? static_cast<std::size_t>(static_cast<const char*>(hit) - data) : size;
    const std::size_t len = end - pos;

    if(!discarding_) {
      if(buffer_.size() + len > max_line_) {
        discarding_ = true;
        std::string().swap(buffer_);
      } else {
        buffer_.append(data + pos, len);
      }
    }

    if(!hit) break;
    if(discarding_) {
      ready_.push_back(Frame{std::string(), true});
      discarding_ = false;
    } else {
      ready_.push_back(Frame{std::move(buffer_), false});
      buffer_.clear();
    }
    pos = end + 1;
  }
}

std::optional<LineFramer::Frame> LineFramer::next() {
  if(ready_.empty()) return std::nullopt;
  Frame f = std::move(ready_.front());
  ready_.pop_front();
  return f;
}

std::optional<LineFramer::Frame> LineFramer::finish() {
  if(auto f = next()) return f;
  if(discarding_) {
    discarding_ = false;
    return Frame{std::string(), true};
  }
  if(buffer_.empty()) return std::nullopt;
  Frame f{std::move(buffer_), false};
  buffer_.clear();
  return f;
}
