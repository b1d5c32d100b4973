#pragma once
#include <asio.hpp>
#include <array>
#include <cstddef>
#include <memory>
#include <string>

#include "command_dispatcher.hpp"
#include "log.hpp"
#include "protocol.hpp"

// One accepted client. Requests are handled strictly one at a time: the next
// line is not looked at until the previous response has been written.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using socket_type = asio::local::stream_protocol::socket;

    static std::shared_ptr<Connection> create(socket_type sock,
                                              CommandDispatcher& dispatcher,
                                              std::shared_ptr<Logger> logger,
                                              std::size_t id);

    ~Connection();

    void start(); // start read loop

    std::size_t id() const { return id_; }

private:
    Connection(socket_type sock, CommandDispatcher& dispatcher, std::shared_ptr<Logger> logger, std::size_t id);
    void do_read();
    void process_next();
    void handle_frame(LineFramer::Frame frame);
    void send_response(const Response& response);
    void close();

    socket_type socket_;
    CommandDispatcher& dispatcher_;
    std::shared_ptr<Logger> logger_;
    LineFramer framer_;
    std::array<char, 16 * 1024> read_buf_;
    std::string write_buf_;
    std::size_t id_;
    std::size_t handled_ = 0;
    bool eof_ = false;
    bool closed_ = false;
};
