#include "networking/WebSocketClient.h"

#include <spdlog/spdlog.h>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <deque>

namespace portal::networking {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

class WebSocketClient::Impl : public std::enable_shared_from_this<WebSocketClient::Impl> {
public:
    Impl(asio::io_context& ioc, std::string host, unsigned short port, std::string path)
        : ioc_(ioc),
          host_(std::move(host)),
          port_(port),
          path_(std::move(path)) {}

    void connect() {
        if (connection_) return;
        connection_ = std::make_shared<Connection>(shared_from_this(), ++generation_);
        connection_->start();
    }

    void close() {
        if (connection_) connection_->close();
    }

    void send(const std::string& msg) {
        if (!connection_ || !connection_->is_open()) {
            spdlog::debug("[Client] dropping frame while disconnected");
            return;
        }
        connection_->send(msg);
    }

    bool is_open() const { return connection_ && connection_->is_open(); }

    OnOpen on_open_;
    OnClose on_close_;
    OnMessage on_message_;

private:
    class Connection : public std::enable_shared_from_this<Connection> {
    public:
        // Holds its client alive until finish() breaks the cycle.
        Connection(std::shared_ptr<Impl> client, unsigned generation)
            : client_(std::move(client)),
              generation_(generation),
              resolver_(asio::make_strand(client_->ioc_)),
              ws_(resolver_.get_executor()) {}

        void start() {
            resolver_.async_resolve(
                client_->host_, std::to_string(client_->port_),
                [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type results) {
                    if (ec) return self->finish("resolve", ec);
                    self->on_resolve(results);
                });
        }

        void send(const std::string& msg) {
            asio::post(
                ws_.get_executor(),
                [self = shared_from_this(), msg] {
                    if (!self->open_) return;
                    bool writing = !self->write_queue_.empty();
                    self->write_queue_.push_back(msg);
                    if (!writing) self->do_write();
                });
        }

        void close() {
            asio::post(
                ws_.get_executor(),
                [self = shared_from_this()] {
                    if (!self->open_) {
                        beast::get_lowest_layer(self->ws_).cancel();
                        return;
                    }
                    self->ws_.async_close(websocket::close_code::normal,
                                          [self](beast::error_code ec) {
                                              if (ec) self->finish("close", ec);
                                          });
                });
        }

        bool is_open() const { return open_; }

    private:
        void on_resolve(const tcp::resolver::results_type& results) {
            beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(10));
            beast::get_lowest_layer(ws_).async_connect(
                results,
                [self = shared_from_this()](beast::error_code ec, tcp::endpoint) {
                    if (ec) return self->finish("connect", ec);
                    self->on_connect();
                });
        }

        void on_connect() {
            beast::get_lowest_layer(ws_).expires_never();
            ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));

            const std::string host = client_->host_ + ":" + std::to_string(client_->port_);
            ws_.async_handshake(
                host, client_->path_,
                [self = shared_from_this()](beast::error_code ec) {
                    if (ec) return self->finish("handshake", ec);
                    self->open_ = true;
                    if (self->current() && self->client_->on_open_) self->client_->on_open_();
                    self->do_read();
                });
        }

        void do_read() {
            ws_.async_read(
                buffer_,
                [self = shared_from_this()](beast::error_code ec, std::size_t) {
                    if (ec) return self->finish("read", ec);

                    std::string msg = beast::buffers_to_string(self->buffer_.data());
                    self->buffer_.consume(self->buffer_.size());

                    if (self->current() && self->client_->on_message_) self->client_->on_message_(msg);
                    self->do_read();
                });
        }

        void do_write() {
            ws_.text(true);
            ws_.async_write(
                asio::buffer(write_queue_.front()),
                [self = shared_from_this()](beast::error_code ec, std::size_t) {
                    if (ec) return self->finish("write", ec);

                    self->write_queue_.pop_front();
                    if (!self->write_queue_.empty()) self->do_write();
                });
        }

        bool current() const { return client_->generation_ == generation_; }

        void finish(const char* what, beast::error_code ec) {
            if (finished_) return;
            finished_ = true;
            open_ = false;
            write_queue_.clear();

            const std::string reason = std::string(what) + ": " + ec.message();
            if (!current()) return;

            client_->connection_.reset();
            if (client_->on_close_) client_->on_close_(reason);
        }

        std::shared_ptr<Impl> client_;
        unsigned generation_;

        tcp::resolver resolver_;
        websocket::stream<beast::tcp_stream> ws_;
        beast::flat_buffer buffer_;
        std::deque<std::string> write_queue_;
        bool open_ = false;
        bool finished_ = false;
    };

    asio::io_context& ioc_;
    std::string host_;
    unsigned short port_;
    std::string path_;

    std::shared_ptr<Connection> connection_;
    unsigned generation_ = 0;
};

WebSocketClient::WebSocketClient(asio::io_context& ioc, std::string host, unsigned short port, std::string path)
    : impl_(std::make_shared<Impl>(ioc, std::move(host), port, std::move(path))) {}

WebSocketClient::~WebSocketClient() {
    // The pending operations keep impl_ alive; they must not call back into the owner.
    impl_->on_open_ = nullptr;
    impl_->on_close_ = nullptr;
    impl_->on_message_ = nullptr;
    impl_->close();
}

void WebSocketClient::set_on_open(OnOpen cb) { impl_->on_open_ = std::move(cb); }
void WebSocketClient::set_on_close(OnClose cb) { impl_->on_close_ = std::move(cb); }
void WebSocketClient::set_on_message(OnMessage cb) { impl_->on_message_ = std::move(cb); }

void WebSocketClient::connect() { impl_->connect(); }
void WebSocketClient::close() { impl_->close(); }
void WebSocketClient::send(const std::string& msg) { impl_->send(msg); }
bool WebSocketClient::is_open() const { return impl_->is_open(); }

} // namespace portal::networking
