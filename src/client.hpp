#pragma once
#include <asio.hpp>
#include <cstdint>
#include <string>

#include "protocol.hpp"

// Blocking client for one daemon connection. Requests are sent one at a time
// and each call returns the matching response line. Channel failures throw
// std::system_error.
class DaemonClient {
public:
    explicit DaemonClient(std::string socket_path,
                          std::string tool = "helixctl",
                          std::string repo_root = "");

    void connect();
    bool connected() const { return socket_.is_open(); }
    void close();

    Response request(const Command& command);

    Response ping();
    Response enqueue_sync(const std::string& directory, bool force = false);
    Response wait_sync(const std::string& sync_id, uint64_t timeout_ms);
    Response status();
    Response shutdown(const std::string& reason);

    // Writes `line` plus a newline and returns the raw reply line.
    std::string send_line(const std::string& line);

    void set_version(int64_t version) { version_ = version; }
    const std::string& socket_path() const { return socket_path_; }

private:
    std::string read_line();

    asio::io_context io_;
    asio::local::stream_protocol::socket socket_;
    asio::streambuf read_buf_;
    std::string socket_path_;
    std::string tool_;
    std::string repo_root_;
    int64_t version_ = PROTOCOL_VERSION;
    uint64_t next_id_ = 1;
};
