#include "networking/WebSocketServer.h"

#include <spdlog/spdlog.h>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <deque>
#include <mutex>
#include <unordered_map>

namespace portal::networking {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

class WebSocketServer::Impl {
public:
    Impl(asio::io_context& ioc, const std::string& address, unsigned short port)
        : ioc_(ioc),
          acceptor_(ioc, tcp::endpoint(asio::ip::make_address(address), port)) {}

    void start() { do_accept(); }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);

        std::lock_guard<std::mutex> lk(mu_);
        for (auto& [id, s] : sessions_) {
            s->close();
        }
    }

    void send(ConnectionId connection, const std::string& msg) {
        std::shared_ptr<Connection> s;
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto it = sessions_.find(connection);
            if (it == sessions_.end()) return;
            s = it->second;
        }
        s->send(msg);
    }

    std::size_t connection_count() const {
        std::lock_guard<std::mutex> lk(mu_);
        return sessions_.size();
    }

    unsigned short local_port() const {
        beast::error_code ec;
        const auto endpoint = acceptor_.local_endpoint(ec);
        return ec ? 0 : endpoint.port();
    }

    void set_on_connect(OnConnect cb) { on_connect_ = std::move(cb); }
    void set_on_disconnect(OnDisconnect cb) { on_disconnect_ = std::move(cb); }
    void set_on_message(OnMessage cb) { on_message_ = std::move(cb); }

private:
    class Connection : public std::enable_shared_from_this<Connection> {
    public:
        Connection(Impl& server, tcp::socket socket, ConnectionId id)
            : server_(server),
              id_(id),
              ws_(std::move(socket)),
              strand_(asio::make_strand(server_.ioc_)) {}

        void start() {
            ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
            ws_.read_message_max(kMaxMessageBytes);

            ws_.async_accept(
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec) {
                        if (ec) return self->finish("accept", ec);

                        self->accepted_ = true;
                        if (self->server_.on_connect_) self->server_.on_connect_(self->id_);
                        self->do_read();
                    }));
        }

        void send(const std::string& msg) {
            asio::post(
                strand_,
                [self = shared_from_this(), msg] {
                    if (self->finished_) return;
                    bool writing = !self->write_queue_.empty();
                    self->write_queue_.push_back(msg);
                    if (!writing) self->do_write();
                });
        }

        void close() {
            asio::post(
                strand_,
                [self = shared_from_this()] {
                    beast::error_code ec;
                    self->ws_.close(websocket::close_code::going_away, ec);
                });
        }

    private:
        void do_read() {
            ws_.async_read(
                buffer_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec) return self->finish("read", ec);

                        std::string msg = beast::buffers_to_string(self->buffer_.data());
                        self->buffer_.consume(self->buffer_.size());

                        if (self->server_.on_message_) self->server_.on_message_(self->id_, msg);

                        self->do_read();
                    }));
        }

        void do_write() {
            ws_.text(true);
            ws_.async_write(
                asio::buffer(write_queue_.front()),
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec) return self->finish("write", ec);

                        self->write_queue_.pop_front();
                        if (!self->write_queue_.empty()) self->do_write();
                    }));
        }

        // Read and write failures can both land here; report the disconnect once.
        void finish(const char* what, beast::error_code ec) {
            if (finished_) return;
            finished_ = true;
            write_queue_.clear();

            if (ec != websocket::error::closed && ec != asio::error::operation_aborted) {
                spdlog::debug("[Session {}] {}: {}", id_, what, ec.message());
            }

            server_.remove_session(id_);
            if (accepted_ && server_.on_disconnect_) server_.on_disconnect_(id_);
        }

        Impl& server_;
        ConnectionId id_;

        websocket::stream<beast::tcp_stream> ws_;
        // io_context executor type keeps this working with older Boost.Asio.
        asio::strand<asio::io_context::executor_type> strand_;

        beast::flat_buffer buffer_;
        std::deque<std::string> write_queue_;
        bool accepted_ = false;
        bool finished_ = false;
    };

    void do_accept() {
        acceptor_.async_accept(
            [this](beast::error_code ec, tcp::socket socket) {
                if (ec) {
                    if (ec == asio::error::operation_aborted) return;
                    spdlog::error("[accept] {}", ec.message());
                    return do_accept();
                }

                auto id = next_connection_id_++;
                auto session = std::make_shared<Connection>(*this, std::move(socket), id);

                {
                    std::lock_guard<std::mutex> lk(mu_);
                    sessions_[id] = session;
                }

                session->start();
                do_accept();
            });
    }

    void remove_session(ConnectionId id) {
        std::lock_guard<std::mutex> lk(mu_);
        sessions_.erase(id);
    }

    asio::io_context& ioc_;
    tcp::acceptor acceptor_;

    std::atomic<ConnectionId> next_connection_id_{1};

    mutable std::mutex mu_;
    std::unordered_map<ConnectionId, std::shared_ptr<Connection>> sessions_;

    OnConnect on_connect_;
    OnDisconnect on_disconnect_;
    OnMessage on_message_;
};

WebSocketServer::WebSocketServer(asio::io_context& ioc, const std::string& address, unsigned short port)
    : impl_(std::make_unique<Impl>(ioc, address, port)) {}

void WebSocketServer::set_on_connect(OnConnect cb) { impl_->set_on_connect(std::move(cb)); }
void WebSocketServer::set_on_disconnect(OnDisconnect cb) { impl_->set_on_disconnect(std::move(cb)); }
void WebSocketServer::set_on_message(OnMessage cb) { impl_->set_on_message(std::move(cb)); }

void WebSocketServer::start() { impl_->start(); }
void WebSocketServer::stop() { impl_->stop(); }

void WebSocketServer::send(ConnectionId connection, const std::string& msg) { impl_->send(connection, msg); }

std::size_t WebSocketServer::connection_count() const { return impl_->connection_count(); }
unsigned short WebSocketServer::local_port() const { return impl_->local_port(); }

WebSocketServer::~WebSocketServer() = default;

} // namespace portal::networking
