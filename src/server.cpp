#include "server.hpp"

#include <sys/un.h>

#include <filesystem>
#include <system_error>

#include "connection.hpp"
#include "utils.hpp"

Server::Server(asio::io_context& io, std::string socket_path, CommandDispatcher& dispatcher,
               std::shared_ptr<Logger> logger)
: io_(io),
  socket_path_(expand_tilde(socket_path)),
  dispatcher_(dispatcher),
  logger_(logger ? std::move(logger) : std::make_shared<Logger>("server")),
  acceptor_(asio::make_strand(io))
{
}

Server::~Server(){
    close();
}

void Server::start(){
    namespace fs = std::filesystem;
    fs::path path(socket_path_);

    if(socket_path_.size() >= sizeof(sockaddr_un::sun_path)){
        throw std::system_error(std::make_error_code(std::errc::filename_too_long),
                                "socket path too long for AF_UNIX: " + socket_path_);
    }

    std::error_code ec;
    if(path.has_parent_path()){
        fs::create_directories(path.parent_path(), ec);
        if(ec) throw std::system_error(ec, "cannot create " + path.parent_path().string());
    }
    if(fs::exists(fs::symlink_status(path, ec))){
        logger_->info("Removing stale socket {}", socket_path_);
        fs::remove(path, ec);
        if(ec) throw std::system_error(ec, "cannot remove stale socket " + socket_path_);
    }

    asio::local::stream_protocol::endpoint endpoint(socket_path_);
    acceptor_.open(endpoint.protocol());
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);

    logger_->info("helixd listening on {}", socket_path_);
    asio::dispatch(acceptor_.get_executor(), [this](){ do_accept(); });
}

void Server::do_accept(){
    if(shutdown_requested_){
        finish();
        return;
    }
    acceptor_.async_accept(asio::make_strand(io_),
        [this](std::error_code ec, asio::local::stream_protocol::socket sock){
            if(shutdown_requested_ || !acceptor_.is_open()){
                logger_->info("Shutdown signal received");
                finish();
                return;
            }
            if(ec){
                logger_->error("Accept error: {}", ec.message());
            } else {
                auto id = ++accepted_;
                logger_->debug("Accepted connection {}", id);
                Connection::create(std::move(sock), dispatcher_, logger_, id);
            }
            do_accept();
        });
}

void Server::shutdown(){
    if(shutdown_requested_.exchange(true)) return;
    asio::post(acceptor_.get_executor(), [this](){
        std::error_code ec;
        acceptor_.close(ec);
    });
}

void Server::finish(){
    if(stopped_.exchange(true)) return;
    std::error_code ec;
    acceptor_.close(ec);
    std::filesystem::remove(socket_path_, ec);
    logger_->info("helixd stopped listening on {} after {} connections", socket_path_, accepted_.load());
    if(on_stopped_) on_stopped_();
}

void Server::close(){
    shutdown_requested_ = true;
    if(stopped_.exchange(true)) return;
    std::error_code ec;
    bool was_open = acceptor_.is_open();
    acceptor_.close(ec);
    if(was_open) std::filesystem::remove(socket_path_, ec);
}
