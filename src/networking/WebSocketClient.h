#pragma once

#include <boost/asio/io_context.hpp>

#include <functional>
#include <memory>
#include <string>

namespace portal::networking {

// Outbound WebSocket connection to the signaling hub. One connection at a
// time; the owner decides when to reconnect.
class WebSocketClient {
public:
    using OnOpen    = std::function<void()>;
    using OnClose   = std::function<void(const std::string& reason)>;
    using OnMessage = std::function<void(const std::string&)>;

    WebSocketClient(boost::asio::io_context& ioc, std::string host, unsigned short port, std::string path);
    ~WebSocketClient();

    WebSocketClient(const WebSocketClient&) = delete;
    WebSocketClient& operator=(const WebSocketClient&) = delete;

    void set_on_open(OnOpen cb);
    void set_on_close(OnClose cb);
    void set_on_message(OnMessage cb);

    // Starts one connection attempt. A failed attempt reports through on_close.
    void connect();
    void close();

    // Frames sent while not open are dropped.
    void send(const std::string& msg);

    bool is_open() const;

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace portal::networking
