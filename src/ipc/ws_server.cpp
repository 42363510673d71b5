#include "ipc/ws_server.hpp"
#include <spdlog/spdlog.h>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <chrono>
#include <deque>

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
namespace ws    = beast::websocket;
using tcp       = asio::ip::tcp;

namespace codeact::ipc {

// ============================================================================
// WebSocketSession
// ============================================================================

class WebSocketSession : public Transport,
                         public std::enable_shared_from_this<WebSocketSession> {
public:
    WebSocketSession(tcp::socket socket, ConnectionHub& hub, const WsLimits& limits)
        : ws_(std::move(socket))
        , strand_(asio::make_strand(ws_.get_executor()))
        , hub_(hub)
        , limits_(limits) {}

    void run(http::request<http::string_body> req) {
        ws_.set_option(ws::stream_base::timeout::suggested(beast::role_type::server));
        ws_.read_message_max(limits_.max_message_bytes);

        ws_.async_accept(
            req,
            asio::bind_executor(
                strand_,
                beast::bind_front_handler(&WebSocketSession::on_accept, shared_from_this())));
    }

    bool is_open() const override { return open_; }

    void send_text(std::string text) override {
        auto msg = std::make_shared<std::string>(std::move(text));
        asio::dispatch(strand_, [self = shared_from_this(), msg = std::move(msg)]() mutable {
            if (!self->open_) {
                return;
            }
            // A single oversized frame is still sent when nothing else is queued
            if (!self->outbox_.empty() &&
                self->outbox_bytes_ + msg->size() > self->limits_.max_outbox_bytes) {
                spdlog::warn("Client {} is not keeping up ({} bytes queued), disconnecting",
                             self->id_, self->outbox_bytes_);
                self->close();
                return;
            }
            self->outbox_bytes_ += msg->size();
            self->outbox_.push_back(std::move(msg));
            if (!self->write_in_progress_) {
                self->write_in_progress_ = true;
                self->do_write();
            }
        });
    }

private:
    ws::stream<beast::tcp_stream> ws_;
    asio::strand<asio::any_io_executor> strand_;
    beast::flat_buffer buffer_;
    ConnectionHub& hub_;
    WsLimits limits_;

    std::string id_;
    std::atomic<bool> open_{false};
    std::deque<std::shared_ptr<std::string>> outbox_;
    size_t outbox_bytes_ = 0;
    bool write_in_progress_ = false;

    void on_accept(beast::error_code ec) {
        if (ec) {
            spdlog::warn("WebSocket handshake failed: {}", ec.message());
            return;
        }
        open_ = true;
        id_ = hub_.attach(shared_from_this());
        do_read();
    }

    void do_read() {
        ws_.async_read(
            buffer_,
            asio::bind_executor(
                strand_,
                beast::bind_front_handler(&WebSocketSession::on_read, shared_from_this())));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec) {
            if (ec != ws::error::closed) {
                spdlog::debug("Read error on {}: {}", id_, ec.message());
            }
            close();
            return;
        }

        if (!ws_.got_text()) {
            buffer_.consume(buffer_.size());
            hub_.send(id_, events::error(INVALID_MESSAGE_FORMAT));
            do_read();
            return;
        }

        std::string raw = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        hub_.on_message(id_, std::move(raw));
        do_read();
    }

    void do_write() {
        if (outbox_.empty()) {
            write_in_progress_ = false;
            return;
        }

        auto msg = outbox_.front();
        ws_.text(true);
        ws_.async_write(
            asio::buffer(*msg),
            asio::bind_executor(
                strand_,
                [self = shared_from_this(), msg](beast::error_code ec, std::size_t) {
                    self->on_write(ec);
                }));
    }

    void on_write(const beast::error_code& ec) {
        if (!open_) {
            // close() already emptied the outbox
            write_in_progress_ = false;
            return;
        }
        if (ec) {
            spdlog::debug("Write error on {}: {}", id_, ec.message());
            write_in_progress_ = false;
            close();
            return;
        }
        outbox_bytes_ -= outbox_.front()->size();
        outbox_.pop_front();
        do_write();
    }

    // Runs on strand_
    void close() {
        if (!open_.exchange(false)) {
            return;
        }
        outbox_.clear();
        outbox_bytes_ = 0;
        hub_.detach(id_);

        // Aborts any pending read or write
        beast::error_code ec;
        ws_.next_layer().socket().close(ec);
    }
};

// ============================================================================
// HttpSession: answers plain HTTP, hands upgrades to WebSocketSession
// ============================================================================

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, ConnectionHub& hub, const HttpApi& api, const WsLimits& limits)
        : stream_(std::move(socket))
        , hub_(hub)
        , api_(api)
        , limits_(limits) {}

    void run() {
        asio::dispatch(stream_.get_executor(),
                       beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
    }

private:
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    std::shared_ptr<http::response<http::string_body>> res_;
    ConnectionHub& hub_;
    const HttpApi& api_;
    WsLimits limits_;

    void do_read() {
        req_ = {};
        stream_.expires_after(std::chrono::seconds(30));
        http::async_read(stream_, buffer_, req_,
                         beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            return;
        }
        if (ec) {
            spdlog::debug("HTTP read error: {}", ec.message());
            return;
        }

        if (ws::is_upgrade(req_)) {
            stream_.expires_never();
            std::make_shared<WebSocketSession>(stream_.release_socket(), hub_, limits_)
                ->run(std::move(req_));
            return;
        }

        auto res = std::make_shared<http::response<http::string_body>>();
        res->version(req_.version());
        res->keep_alive(req_.keep_alive());
        res->set(http::field::access_control_allow_origin, "*");

        if (req_.method() == http::verb::options) {
            res->result(http::status::no_content);
            res->set(http::field::access_control_allow_headers, "Content-Type");
            res->set(http::field::access_control_allow_methods, "GET,OPTIONS");
        } else {
            auto method = req_.method_string();
            auto target = req_.target();
            HttpReply reply = api_.handle(std::string(method.data(), method.size()),
                                          std::string(target.data(), target.size()));
            res->result(static_cast<http::status>(reply.status));
            res->set(http::field::content_type, "application/json");
            res->body() = reply.body.dump();
        }
        res->prepare_payload();

        res_ = res;
        http::async_write(stream_, *res_,
                          beast::bind_front_handler(&HttpSession::on_write, shared_from_this(),
                                                    res_->keep_alive()));
    }

    void on_write(bool keep_alive, beast::error_code ec, std::size_t) {
        res_.reset();
        if (ec) {
            spdlog::debug("HTTP write error: {}", ec.message());
            return;
        }
        if (!keep_alive) {
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            return;
        }
        do_read();
    }
};

// ============================================================================
// Listener
// ============================================================================

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(asio::io_context& ioc, ConnectionHub& hub, const HttpApi& api, const WsLimits& limits)
        : ioc_(ioc)
        , acceptor_(ioc)
        , hub_(hub)
        , api_(api)
        , limits_(limits) {}

    bool open(const tcp::endpoint& endpoint) {
        beast::error_code ec;

        acceptor_.open(endpoint.protocol(), ec);
        if (!ec) acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
        if (!ec) acceptor_.bind(endpoint, ec);
        if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);

        if (ec) {
            spdlog::error("Cannot listen on {}:{}: {}",
                          endpoint.address().to_string(), endpoint.port(), ec.message());
            return false;
        }
        return true;
    }

    void run() { do_accept(); }

    void stop() {
        asio::post(acceptor_.get_executor(), [self = shared_from_this()] {
            beast::error_code ec;
            self->acceptor_.close(ec);
        });
    }

    uint16_t port() const {
        beast::error_code ec;
        auto endpoint = acceptor_.local_endpoint(ec);
        return ec ? 0 : endpoint.port();
    }

private:
    asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    ConnectionHub& hub_;
    const HttpApi& api_;
    WsLimits limits_;

    void do_accept() {
        acceptor_.async_accept(
            asio::make_strand(ioc_),
            beast::bind_front_handler(&Listener::on_accept, shared_from_this()));
    }

    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        if (ec) {
            spdlog::warn("Accept failed: {}", ec.message());
        } else {
            std::make_shared<HttpSession>(std::move(socket), hub_, api_, limits_)->run();
        }
        if (acceptor_.is_open()) {
            do_accept();
        }
    }
};

// ============================================================================
// WsServer Implementation
// ============================================================================

WsServer::WsServer(asio::io_context& ioc, ConnectionHub& hub, const HttpApi& api,
                   WsLimits limits)
    : ioc_(ioc)
    , hub_(hub)
    , api_(api)
    , limits_(limits) {}

WsServer::~WsServer() = default;

bool WsServer::listen(const std::string& host, uint16_t port) {
    beast::error_code ec;
    auto address = asio::ip::make_address(host, ec);
    if (ec) {
        spdlog::error("Invalid listen address {}: {}", host, ec.message());
        return false;
    }

    auto listener = std::make_shared<Listener>(ioc_, hub_, api_, limits_);
    if (!listener->open(tcp::endpoint(address, port))) {
        return false;
    }
    listener->run();
    listener_ = listener;
    spdlog::info("Listening on {}:{}", host, listener_->port());
    return true;
}

void WsServer::stop() {
    if (listener_) {
        listener_->stop();
    }
}

uint16_t WsServer::port() const {
    return listener_ ? listener_->port() : 0;
}

} // namespace codeact::ipc
