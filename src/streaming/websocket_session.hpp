#pragma once

#include "speech_socket.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/beast/websocket/stream.hpp>
#include <memory>
#include <string>

// TLS WebSocket client (Boost.Beast). Every instance owns its own io_context,
// so concurrent attempts share nothing.
class WebSocketSession : public SpeechSocket {
public:
    explicit WebSocketSession(std::string port = "443");
    ~WebSocketSession() override;

    WebSocketSession(const WebSocketSession&) = delete;
    WebSocketSession& operator=(const WebSocketSession&) = delete;

    std::expected<void, TranscriptionError>
        open(const std::string& host, const std::string& target) override;
    std::expected<void, TranscriptionError> send_binary(std::span<const uint8_t> message) override;
    std::expected<std::string, TranscriptionError>
        receive(std::chrono::milliseconds timeout) override;
    void close() override;

private:
    using Stream = boost::beast::websocket::stream<
        boost::beast::ssl_stream<boost::beast::tcp_stream>>;

    std::string port_;
    boost::asio::io_context ioc_;
    boost::asio::ssl::context ssl_ctx_;
    std::unique_ptr<Stream> ws_;
    boost::beast::flat_buffer buffer_;
    bool used_ = false;
    bool open_ = false;
    // Set after a cancelled read; the stream cannot be closed gracefully then.
    bool broken_ = false;
};
