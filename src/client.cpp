#include "client.hpp"
#include "log.hpp"
#include "utils.hpp"

#include <istream>
#include <system_error>

DaemonClient::DaemonClient(std::string socket_path, std::string tool, std::string repo_root)
: socket_(io_),
  socket_path_(expand_tilde(socket_path)),
  tool_(std::move(tool)),
  repo_root_(std::move(repo_root)) {}

void DaemonClient::connect(){
    if(socket_.is_open()) return;
    std::error_code ec;
    socket_.connect(asio::local::stream_protocol::endpoint(socket_path_), ec);
    if(ec){
        std::error_code ignored;
        socket_.close(ignored);
        throw std::system_error(ec, "connect " + socket_path_);
    }
    log_debug(nullptr, "connected to {}", socket_path_);
}

void DaemonClient::close(){
    std::error_code ec;
    socket_.shutdown(asio::local::stream_protocol::socket::shutdown_both, ec);
    socket_.close(ec);
    read_buf_.consume(read_buf_.size());
}

std::string DaemonClient::read_line(){
    asio::read_until(socket_, read_buf_, '\n');
    std::istream is(&read_buf_);
    std::string line;
    std::getline(is, line);
    return line;
}

std::string DaemonClient::send_line(const std::string& line){
    connect();
    std::string m = line + "\n";
    asio::write(socket_, asio::buffer(m));
    return read_line();
}

Response DaemonClient::request(const Command& command){
    Request req;
    req.id = std::to_string(next_id_++);
    req.version = version_;
    req.tool = tool_;
    req.repo_root = repo_root_;
    req.command = command;
    return decode_response(send_line(encode_request(req)));
}

Response DaemonClient::ping(){
    return request(PingCommand{});
}

Response DaemonClient::enqueue_sync(const std::string& directory, bool force){
    return request(EnqueueSyncCommand{directory, force});
}

Response DaemonClient::wait_sync(const std::string& sync_id, uint64_t timeout_ms){
    return request(WaitSyncCommand{sync_id, timeout_ms});
}

Response DaemonClient::status(){
    return request(StatusCommand{});
}

Response DaemonClient::shutdown(const std::string& reason){
    return request(ShutdownCommand{reason});
}
