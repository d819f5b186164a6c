/**
 * @file websocket_transport.hpp
 * @brief TLS websocket client transport on Boost.Beast.
 */
#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "dingstream/core/interfaces/itransport.hpp"

namespace dingstream {

    /**
     * @struct WebSocketOptions
     * @brief Settings of one websocket connection.
     */
    struct WebSocketOptions {
        std::string               userAgent{ "dingstream/1.0" };
        std::chrono::seconds      handshakeTimeout{ 30 };
        std::chrono::milliseconds writeTimeout{ 10000 };
        size_t                    maxMessageSize{ 16 * 1024 * 1024 };
    };

    /**
     * @class WebSocketTransport
     * @brief ITransport over wss:// driven by a private io_context thread.
     *
     * The stream gateway uses certificates that do not validate, so peer
     * verification is disabled. Reads run continuously on the io thread and
     * are queued for read(); writes are posted to the io thread and waited on.
     */
    class WebSocketTransport : public ITransport {
    public:
        explicit WebSocketTransport(WebSocketOptions options = {});
        ~WebSocketTransport() override;

        WebSocketTransport(const WebSocketTransport&) = delete;
        WebSocketTransport& operator=(const WebSocketTransport&) = delete;

        void open(const std::string& url) override;
        void sendText(const std::string& text) override;
        void ping() override;
        std::optional<InboundFrame> read() override;
        void abort() override;
        bool isOpen() const override;

    private:
        struct Impl;
        std::unique_ptr<Impl> pImpl_;
    };

}
