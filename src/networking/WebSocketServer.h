#pragma once

#include "networking/Session.hpp"

#include <boost/asio/io_context.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace portal::networking {

class WebSocketServer {
public:
    using OnConnect    = std::function<void(ConnectionId)>;
    using OnDisconnect = std::function<void(ConnectionId)>;
    using OnMessage    = std::function<void(ConnectionId, const std::string&)>;

    static constexpr std::size_t kMaxMessageBytes = 256 * 1024;

    WebSocketServer(boost::asio::io_context& ioc, const std::string& address, unsigned short port);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    // Install before start(); handlers run on the io_context.
    void set_on_connect(OnConnect cb);
    void set_on_disconnect(OnDisconnect cb);
    void set_on_message(OnMessage cb);

    void start();  // start accepting
    void stop();   // stop accepting + close active sessions

    // Queue a text frame; unknown or closed connections are ignored.
    void send(ConnectionId connection, const std::string& msg);

    std::size_t connection_count() const;

    // Actual listening port, useful when constructed with port 0.
    unsigned short local_port() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace portal::networking
