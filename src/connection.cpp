#include "connection.hpp"

#include <utility>

std::shared_ptr<Connection> Connection::create(socket_type sock,
                                               CommandDispatcher& dispatcher,
                                               std::shared_ptr<Logger> logger,
                                               std::size_t id)
{
    auto c = std::shared_ptr<Connection>(new Connection(std::move(sock), dispatcher, std::move(logger), id));
    c->start();
    return c;
}

Connection::Connection(socket_type sock, CommandDispatcher& dispatcher, std::shared_ptr<Logger> logger, std::size_t id)
: socket_(std::move(sock)), dispatcher_(dispatcher), logger_(std::move(logger)), id_(id)
{
}

Connection::~Connection(){
    std::error_code ec;
    socket_.close(ec);
    log_debug(logger_.get(), "connection {} finished after {} requests", id_, handled_);
}

void Connection::start(){
    auto self = shared_from_this();
    asio::dispatch(socket_.get_executor(), [self](){ self->do_read(); });
}

void Connection::do_read(){
    auto self = shared_from_this();
    socket_.async_read_some(asio::buffer(read_buf_),
        [this, self](std::error_code ec, std::size_t bytes_transferred){
            if(ec == asio::error::eof){
                eof_ = true;
                process_next();
                return;
            }
            if(ec){
                if(ec != asio::error::operation_aborted){
                    log_warn(logger_.get(), "connection {} read error: {}", id_, ec.message());
                }
                close();
                return;
            }
            framer_.feed(read_buf_.data(), bytes_transferred);
            process_next();
        });
}

void Connection::process_next(){
    if(closed_) return;
    auto frame = framer_.next();
    if(!frame && eof_) frame = framer_.finish();
    if(!frame){
        if(eof_){
            close();
        } else {
            do_read();
        }
        return;
    }
    handle_frame(std::move(*frame));
}

void Connection::handle_frame(LineFramer::Frame frame){
    ++handled_;
    if(frame.oversized){
        log_warn(logger_.get(), "connection {} sent a line over {} bytes", id_, kMaxMessageSize);
        send_response(Response::failure("", ErrorCode::InvalidRequest, "Message too large"));
        return;
    }

    auto decoded = decode_request(frame.line);
    if(decoded.error){
        log_debug(logger_.get(), "connection {} rejected request: {}", id_, decoded.error->error->message);
        send_response(*decoded.error);
        return;
    }

    auto self = shared_from_this();
    dispatcher_.dispatch(*decoded.request, [self](Response response){
        // WaitSync answers from the queue's waiter, off this connection's strand
        asio::dispatch(self->socket_.get_executor(), [self, response = std::move(response)](){
            self->send_response(response);
        });
    });
}

void Connection::send_response(const Response& response){
    if(closed_) return;
    write_buf_ = encode_response(response);
    write_buf_.push_back('\n');
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(write_buf_),
        [this, self](std::error_code ec, std::size_t){
            if(ec){
                log_warn(logger_.get(), "connection {} write error: {}", id_, ec.message());
                close();
                return;
            }
            process_next();
        });
}

void Connection::close(){
    if(closed_) return;
    closed_ = true;
    std::error_code ec;
    socket_.shutdown(socket_type::shutdown_both, ec);
    socket_.close(ec);
}
