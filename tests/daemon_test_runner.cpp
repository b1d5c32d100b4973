#include "client.hpp"
#include "daemon.hpp"
#include "protocol.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"

#include <asio.hpp>

#include <future>
#include <istream>
#include <limits>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace helixd::test {
namespace {

using namespace std::chrono_literals;

// A daemon on a private socket with signals and global logging left alone.
// With `gated` the sync work blocks until executor->open().
struct DaemonFixture {
  explicit DaemonFixture(const std::string& name, bool gated = true)
    : root(scratch_dir("daemon", name)),
      settings(std::make_shared<SettingsManager>()) {
    std::string error;
    settings->set_from_string("socket_path", socket_path(), error);
    settings->set_from_json("io_threads", 2, error);
    settings->set_from_json("sync_workers", 2, error);
    settings->set_from_json("shutdown_grace_ms", 100, error);

    Daemon::Options options;
    if(gated) {
      executor = std::make_shared<GatedExecutor>();
      options.executor = executor;
    }
    options.handle_signals = false;
    options.configure_logging = false;
    daemon = std::make_unique<Daemon>(settings, options);
  }

  ~DaemonFixture() {
    if(executor) executor->open();
    daemon.reset();
  }

  void start() {
    daemon->start();
    daemon->start_background();
  }

  std::string socket_path() const {
    return (root / "run" / "helixd.sock").string();
  }

  std::filesystem::path root;
  std::shared_ptr<SettingsManager> settings;
  std::shared_ptr<GatedExecutor> executor;
  std::unique_ptr<Daemon> daemon;
};

bool test_ping(TestContext& ctx) {
  DaemonFixture f("ping");
  ctx.logs.attach(*f.daemon);
  f.start();
  HELIXD_EXPECT(std::filesystem::exists(f.socket_path()));
  HELIXD_EXPECT(ctx.logs.wait_for_substring("listening on", 1s));

  DaemonClient client(f.socket_path(), "helixctl", "/repo");
  auto r = client.ping();
  HELIXD_EXPECT(r.ok);
  HELIXD_EXPECT(r.id == "1");
  HELIXD_EXPECT(r.payload["type"] == "ping");
  HELIXD_EXPECT(r.payload["daemon_version"] == kDaemonVersion);

  auto again = client.ping();
  HELIXD_EXPECT(again.ok && again.id == "2");
  return true;
}

bool test_enqueue_dedup_and_wait(TestContext&) {
  DaemonFixture f("enqueue_wait");
  f.start();
  DaemonClient first(f.socket_path(), "editor", "/repo");
  DaemonClient second(f.socket_path(), "editor", "/repo");

  auto a = first.enqueue_sync("src");
  auto b = second.enqueue_sync("src");
  HELIXD_EXPECT(a.ok && b.ok);
  HELIXD_EXPECT(a.payload["type"] == "enqueue_sync");
  HELIXD_EXPECT(a.payload["is_new"] == true);
  HELIXD_EXPECT(b.payload["is_new"] == false);
  const std::string sync_id = a.payload["sync_id"].get<std::string>();
  HELIXD_EXPECT(b.payload["sync_id"] == sync_id);
  HELIXD_EXPECT(a.payload["queued_at_ms"].get<uint64_t>() > 0);

  auto forced = second.enqueue_sync("src", true);
  HELIXD_EXPECT(forced.ok && forced.payload["is_new"] == true);
  HELIXD_EXPECT(forced.payload["sync_id"] != sync_id);
  const std::string forced_id = forced.payload["sync_id"].get<std::string>();

  f.executor->open();
  auto done = first.wait_sync(forced_id, 5000);
  HELIXD_EXPECT(done.ok);
  HELIXD_EXPECT(done.payload["type"] == "wait_sync");
  HELIXD_EXPECT(done.payload["sync_id"] == forced_id);
  HELIXD_EXPECT(done.payload["state"] == "succeeded");
  HELIXD_EXPECT(done.payload["stats"]["files_scanned"] == 3);
  return true;
}

bool test_wait_errors(TestContext&) {
  DaemonFixture f("wait_errors");
  f.start();
  DaemonClient client(f.socket_path(), "editor", "/repo");

  auto unknown = client.wait_sync("nope", 5000);
  HELIXD_EXPECT(!unknown.ok);
  HELIXD_EXPECT(unknown.error->code == ErrorCode::Timeout);
  HELIXD_EXPECT(unknown.error->message == "Timeout waiting for sync nope");

  auto job = client.enqueue_sync("src");
  const std::string sync_id = job.payload["sync_id"].get<std::string>();
  const auto started = std::chrono::steady_clock::now();
  auto slow = client.wait_sync(sync_id, 100);
  HELIXD_EXPECT(std::chrono::steady_clock::now() - started >= 80ms);
  HELIXD_EXPECT(!slow.ok);
  HELIXD_EXPECT(slow.error->code == ErrorCode::Timeout);

  // the connection is still usable and the job still tracked
  auto status = client.status();
  HELIXD_EXPECT(status.ok);
  HELIXD_EXPECT(status.payload["queues"].size() == 1);
  HELIXD_EXPECT(status.payload["queues"][0]["sync_id"] == sync_id);
  return true;
}

bool test_failed_sync_reported(TestContext&) {
  DaemonFixture f("failed_sync");
  f.executor->set_fail(true);
  f.executor->open();
  f.start();
  DaemonClient client(f.socket_path(), "editor", "/repo");
  auto job = client.enqueue_sync("broken");
  HELIXD_EXPECT(job.ok);
  auto done = client.wait_sync(job.payload["sync_id"].get<std::string>(), 5000);
  HELIXD_EXPECT(done.ok);
  HELIXD_EXPECT(done.payload["state"] == "failed");
  HELIXD_EXPECT(done.payload["stats"]["error"].get<std::string>().find("broken") != std::string::npos);
  return true;
}

bool test_version_mismatch_rejected(TestContext&) {
  DaemonFixture f("version");
  f.start();
  DaemonClient client(f.socket_path(), "editor", "/repo");
  client.set_version(2);
  auto r = client.enqueue_sync("src");
  HELIXD_EXPECT(!r.ok);
  HELIXD_EXPECT(r.id == "1");
  HELIXD_EXPECT(r.error->code == ErrorCode::IncompatibleVersion);
  HELIXD_EXPECT(r.error->message == "Protocol version mismatch: expected 1, got 2");

  client.set_version(PROTOCOL_VERSION);
  auto status = client.status();
  HELIXD_EXPECT(status.ok);
  HELIXD_EXPECT(status.payload["queues"].empty());
  return true;
}

bool test_bad_lines_keep_connection(TestContext&) {
  DaemonFixture f("bad_lines");
  f.start();
  DaemonClient client(f.socket_path(), "editor", "/repo");

  auto big = decode_response(client.send_line(std::string(kMaxMessageSize + 1, 'x')));
  HELIXD_EXPECT(!big.ok);
  HELIXD_EXPECT(big.id.empty());
  HELIXD_EXPECT(big.error->code == ErrorCode::InvalidRequest);
  HELIXD_EXPECT(big.error->message == "Message too large");

  auto garbage = decode_response(client.send_line("{oops"));
  HELIXD_EXPECT(!garbage.ok);
  HELIXD_EXPECT(garbage.id.empty());
  HELIXD_EXPECT(garbage.error->code == ErrorCode::InvalidRequest);

  auto empty = decode_response(client.send_line(""));
  HELIXD_EXPECT(!empty.ok);
  HELIXD_EXPECT(empty.error->code == ErrorCode::InvalidRequest);

  auto missing = decode_response(client.send_line(
    R"({"id":"m1","version":1,"repo_root":"/repo","command":{"type":"ping"}})"));
  HELIXD_EXPECT(!missing.ok);
  HELIXD_EXPECT(missing.id == "m1");

  auto ping = client.ping();
  HELIXD_EXPECT(ping.ok);
  return true;
}

bool test_pipelined_requests_answer_in_order(TestContext&) {
  DaemonFixture f("pipelined");
  f.start();

  asio::io_context io;
  asio::local::stream_protocol::socket socket(io);
  socket.connect(asio::local::stream_protocol::endpoint(f.socket_path()));

  auto line = [](const std::string& id, const std::string& type){
    return R"({"id":")" + id + R"(","version":1,"tool":"t","repo_root":"/r","command":{"type":")" + type + "\"}}\n";
  };
  std::string batch = line("a", "ping") + "not json\n" + line("b", "status") + line("c", "ping");
  asio::write(socket, asio::buffer(batch));

  asio::streambuf buf;
  std::istream in(&buf);
  std::vector<std::string> ids;
  for(int i = 0; i < 4; ++i) {
    asio::read_until(socket, buf, '\n');
    std::string reply;
    std::getline(in, reply);
    ids.push_back(decode_response(reply).id);
  }
  HELIXD_EXPECT(ids.size() == 4);
  HELIXD_EXPECT(ids[0] == "a");
  HELIXD_EXPECT(ids[1].empty());
  HELIXD_EXPECT(ids[2] == "b");
  HELIXD_EXPECT(ids[3] == "c");

  // a final request without its newline is still answered at end of stream
  std::string tail = line("d", "ping");
  tail.pop_back();
  asio::write(socket, asio::buffer(tail));
  socket.shutdown(asio::local::stream_protocol::socket::shutdown_send);
  asio::read_until(socket, buf, '\n');
  std::string reply;
  std::getline(in, reply);
  HELIXD_EXPECT(decode_response(reply).id == "d");
  return true;
}

bool test_blocked_wait_does_not_stall_others(TestContext&) {
  DaemonFixture f("concurrent");
  f.start();
  DaemonClient client(f.socket_path(), "editor", "/repo");
  auto job = client.enqueue_sync("src");
  const std::string sync_id = job.payload["sync_id"].get<std::string>();

  const std::string path = f.socket_path();
  auto waiting = std::async(std::launch::async, [path, sync_id](){
    DaemonClient waiter(path, "editor", "/repo");
    return waiter.wait_sync(sync_id, 5000);
  });

  for(int i = 0; i < 3; ++i) {
    DaemonClient other(path, "indexer", "/repo");
    const auto started = std::chrono::steady_clock::now();
    auto ping = other.ping();
    HELIXD_EXPECT(ping.ok);
    HELIXD_EXPECT(std::chrono::steady_clock::now() - started < 1000ms);
  }
  HELIXD_EXPECT(waiting.wait_for(0ms) == std::future_status::timeout);

  f.executor->open();
  HELIXD_EXPECT(waiting.wait_for(5s) == std::future_status::ready);
  auto done = waiting.get();
  HELIXD_EXPECT(done.ok);
  HELIXD_EXPECT(done.payload["state"] == "succeeded");
  return true;
}

bool test_wait_without_practical_limit(TestContext&) {
  DaemonFixture f("wait_forever");
  f.start();
  DaemonClient client(f.socket_path(), "editor", "/repo");
  auto job = client.enqueue_sync("src");
  HELIXD_EXPECT(job.ok);
  const std::string sync_id = job.payload["sync_id"].get<std::string>();

  const std::string path = f.socket_path();
  auto waiting = std::async(std::launch::async, [path, sync_id](){
    DaemonClient waiter(path, "editor", "/repo");
    return waiter.wait_sync(sync_id, std::numeric_limits<uint64_t>::max());
  });
  std::this_thread::sleep_for(100ms);
  HELIXD_EXPECT(waiting.wait_for(0ms) == std::future_status::timeout);

  f.executor->open();
  HELIXD_EXPECT(waiting.wait_for(5s) == std::future_status::ready);
  auto done = waiting.get();
  HELIXD_EXPECT(done.ok);
  HELIXD_EXPECT(done.payload["state"] == "succeeded");
  return true;
}

bool test_status_lists_queues(TestContext&) {
  DaemonFixture f("status");
  f.start();
  DaemonClient editor(f.socket_path(), "editor", "/repo");
  DaemonClient indexer(f.socket_path(), "indexer", "/repo");
  editor.enqueue_sync("src");
  editor.enqueue_sync("src");
  editor.enqueue_sync("docs");
  indexer.enqueue_sync("src");

  auto status = editor.status();
  HELIXD_EXPECT(status.ok);
  HELIXD_EXPECT(status.payload["type"] == "status");
  HELIXD_EXPECT(status.payload.contains("uptime_ms"));
  const auto& queues = status.payload["queues"];
  HELIXD_EXPECT(queues.size() == 3);
  for(const auto& q : queues) {
    HELIXD_EXPECT(q["repo_root"] == "/repo");
    HELIXD_EXPECT(q["state"] == "queued" || q["state"] == "running");
    HELIXD_EXPECT(q.contains("age_ms"));
  }
  return true;
}

bool test_shutdown_request(TestContext& ctx) {
  DaemonFixture f("shutdown");
  ctx.logs.attach(*f.daemon);
  f.start();
  DaemonClient client(f.socket_path(), "helixctl", "/repo");
  auto r = client.shutdown("tests done");
  HELIXD_EXPECT(r.ok);
  HELIXD_EXPECT(r.payload["type"] == "shutdown");
  HELIXD_EXPECT(f.daemon->wait_stopped(5s));
  HELIXD_EXPECT(!std::filesystem::exists(f.socket_path()));
  HELIXD_EXPECT(ctx.logs.wait_for_substring("tests done", 1s));

  DaemonClient late(f.socket_path());
  bool refused = false;
  try {
    late.connect();
  } catch(const std::system_error&) {
    refused = true;
  }
  HELIXD_EXPECT(refused);
  HELIXD_EXPECT(!late.connected());
  return true;
}

bool test_request_shutdown_api(TestContext&) {
  DaemonFixture f("shutdown_api");
  f.start();
  HELIXD_EXPECT(!f.daemon->wait_stopped(50ms));
  f.daemon->request_shutdown("api");
  HELIXD_EXPECT(f.daemon->wait_stopped(5s));
  HELIXD_EXPECT(!std::filesystem::exists(f.socket_path()));
  return true;
}

bool test_stale_socket_replaced(TestContext&) {
  DaemonFixture f("stale");
  write_file(f.socket_path(), "left over");
  f.start();
  DaemonClient client(f.socket_path());
  HELIXD_EXPECT(client.ping().ok);
  return true;
}

bool test_socket_path_too_long(TestContext&) {
  DaemonFixture f("too_long");
  std::string error;
  HELIXD_EXPECT(f.settings->set_from_string("socket_path", (f.root / std::string(200, 's')).string(), error));
  bool thrown = false;
  try {
    f.daemon->start();
  } catch(const std::system_error&) {
    thrown = true;
  }
  HELIXD_EXPECT(thrown);
  return true;
}

bool test_scan_sync_end_to_end(TestContext&) {
  DaemonFixture f("scan", false);
  auto tree = f.root / "tree";
  write_file(tree / "src" / "main.cpp", "int main(){}");
  write_file(tree / "src" / "util" / "util.hpp", "#pragma once");
  f.start();

  DaemonClient client(f.socket_path(), "editor", tree.string());
  auto job = client.enqueue_sync("src");
  HELIXD_EXPECT(job.ok);
  auto done = client.wait_sync(job.payload["sync_id"].get<std::string>(), 5000);
  HELIXD_EXPECT(done.ok);
  HELIXD_EXPECT(done.payload["state"] == "succeeded");
  auto stats = stats_from_json(done.payload["stats"]);
  HELIXD_EXPECT(stats.files_scanned == 2);
  HELIXD_EXPECT(stats.files_added == 2);
  HELIXD_EXPECT(!stats.error);

  write_file(tree / "src" / "main.cpp", "int main(){ return 1; }");
  auto again = client.enqueue_sync("src");
  HELIXD_EXPECT(again.ok && again.payload["is_new"] == true);
  auto second = client.wait_sync(again.payload["sync_id"].get<std::string>(), 5000);
  HELIXD_EXPECT(second.ok);
  auto delta = stats_from_json(second.payload["stats"]);
  HELIXD_EXPECT(delta.files_added == 0);
  HELIXD_EXPECT(delta.files_modified == 1);
  return true;
}

} // namespace
} // namespace helixd::test

int main(int argc, char** argv) {
  using namespace helixd::test;
  const std::vector<TestCase> tests = {
    {"ping", test_ping},
    {"enqueue_dedup_and_wait", test_enqueue_dedup_and_wait},
    {"wait_errors", test_wait_errors},
    {"failed_sync_reported", test_failed_sync_reported},
    {"version_mismatch_rejected", test_version_mismatch_rejected},
    {"bad_lines_keep_connection", test_bad_lines_keep_connection},
    {"pipelined_requests_answer_in_order", test_pipelined_requests_answer_in_order},
    {"blocked_wait_does_not_stall_others", test_blocked_wait_does_not_stall_others},
    {"wait_without_practical_limit", test_wait_without_practical_limit},
    {"status_lists_queues", test_status_lists_queues},
    {"shutdown_request", test_shutdown_request},
    {"request_shutdown_api", test_request_shutdown_api},
    {"stale_socket_replaced", test_stale_socket_replaced},
    {"socket_path_too_long", test_socket_path_too_long},
    {"scan_sync_end_to_end", test_scan_sync_end_to_end},
  };
  return run_tests("daemon", tests, argc, argv);
}
