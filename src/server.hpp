#pragma once
#include <asio.hpp>
#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "command_dispatcher.hpp"
#include "log.hpp"

// Listens on a Unix domain socket and hands every accepted client to its own
// Connection. shutdown() only stops accepting; open connections run until
// their peer goes away.
class Server {
public:
    using StoppedCallback = std::function<void()>;

    Server(asio::io_context& io, std::string socket_path, CommandDispatcher& dispatcher,
           std::shared_ptr<Logger> logger = nullptr);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Removes a stale socket file, creates the parent directory, binds and
    // starts accepting. Throws std::system_error when the socket cannot be bound.
    void start();

    // Idempotent, callable from any thread.
    void shutdown();

    // Synchronous teardown for when the io_context no longer runs.
    void close();

    // Fires once, on an io thread, after the accept loop has exited and the
    // socket file is gone.
    void set_stopped_callback(StoppedCallback cb) { on_stopped_ = std::move(cb); }

    const std::string& socket_path() const { return socket_path_; }
    bool stopped() const { return stopped_.load(); }

private:
    void do_accept();
    void finish();

    asio::io_context& io_;
    std::string socket_path_;
    CommandDispatcher& dispatcher_;
    std::shared_ptr<Logger> logger_;
    asio::local::stream_protocol::acceptor acceptor_;
    StoppedCallback on_stopped_;
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<std::size_t> accepted_{0};
};
