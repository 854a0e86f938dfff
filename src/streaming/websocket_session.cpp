#include "websocket_session.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <format>
#include <openssl/ssl.h>
#include <print>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

WebSocketSession::WebSocketSession(std::string port)
    : port_(std::move(port)), ssl_ctx_(ssl::context::tlsv12_client) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

WebSocketSession::~WebSocketSession() {
    close();
}

std::expected<void, TranscriptionError>
WebSocketSession::open(const std::string& host, const std::string& target) {
    if (used_) {
        return fail(ErrorKind::Transport, "session already used");
    }
    used_ = true;

    beast::error_code ec;
    tcp::resolver resolver(ioc_);
    auto results = resolver.resolve(host, port_, ec);
    if (ec) {
        return fail(ErrorKind::Transport, std::format("resolve {}: {}", host, ec.message()));
    }

    ws_ = std::make_unique<Stream>(ioc_, ssl_ctx_);

    beast::get_lowest_layer(*ws_).connect(results, ec);
    if (ec) {
        return fail(ErrorKind::Transport, std::format("connect {}: {}", host, ec.message()));
    }

    // SNI, the endpoint serves several hosts
    if (!SSL_set_tlsext_host_name(ws_->next_layer().native_handle(), host.c_str())) {
        return fail(ErrorKind::Transport, "failed to set SNI host name");
    }
    ws_->next_layer().handshake(ssl::stream_base::client, ec);
    if (ec) {
        return fail(ErrorKind::Transport, std::format("TLS handshake with {}: {}", host, ec.message()));
    }

    ws_->set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(http::field::user_agent, "clipscribe");
    }));

    websocket::response_type res;
    ws_->handshake(res, host, target, ec);
    if (ec) {
        auto status = res.result_int();
        auto kind = (status == 401 || status == 403) ? ErrorKind::Auth : ErrorKind::Transport;
        return fail(kind, std::format("WebSocket handshake: {} (HTTP {})", ec.message(), status));
    }

    ws_->binary(true);
    open_ = true;
    return {};
}

std::expected<void, TranscriptionError>
WebSocketSession::send_binary(std::span<const uint8_t> message) {
    if (!open_) {
        return fail(ErrorKind::Transport, "session is not open");
    }

    beast::error_code ec;
    ws_->write(net::buffer(message.data(), message.size()), ec);
    if (ec) {
        return fail(ErrorKind::Transport, "send: " + ec.message());
    }
    return {};
}

std::expected<std::string, TranscriptionError>
WebSocketSession::receive(std::chrono::milliseconds timeout) {
    if (!open_ || broken_) {
        return fail(ErrorKind::Transport, "session is not open");
    }

    buffer_.clear();
    bool done = false;
    beast::error_code read_ec;
    ws_->async_read(buffer_, [&](beast::error_code ec, std::size_t) {
        read_ec = ec;
        done = true;
    });

    ioc_.restart();
    ioc_.run_for(timeout);

    if (!done) {
        // Abort the pending read and let its handler run before returning
        beast::get_lowest_layer(*ws_).cancel();
        ioc_.restart();
        ioc_.run();
        broken_ = true;
        return fail(ErrorKind::Timeout,
                    std::format("no message within {}ms", timeout.count()));
    }

    if (read_ec == websocket::error::closed) {
        open_ = false;
        return fail(ErrorKind::Transport, "session closed by server");
    }
    if (read_ec) {
        broken_ = true;
        return fail(ErrorKind::Transport, "receive: " + read_ec.message());
    }

    return beast::buffers_to_string(buffer_.data());
}

void WebSocketSession::close() {
    if (!ws_) return;

    if (open_ && !broken_) {
        beast::error_code ec;
        ws_->close(websocket::close_code::normal, ec);
        if (ec && ec != websocket::error::closed && ec != ssl::error::stream_truncated) {
            std::println(stderr, "websocket: close failed: {}", ec.message());
        }
    }

    beast::error_code ignored;
    beast::get_lowest_layer(*ws_).socket().close(ignored);
    ws_.reset();
    open_ = false;
}
