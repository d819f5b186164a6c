/**
 * @file itransport.hpp
 * @brief Interface for the websocket connection underneath a stream session.
 *
 * One ITransport instance lives for exactly one connection epoch. The core
 * guarantees at most one writer at a time (sendText/ping are serialized by
 * TransportSession) and exactly one reader (the dispatcher); implementations
 * must allow that writer and that reader to run on different threads.
 */
#pragma once
#include <optional>
#include <string>

namespace dingstream {

    /**
     * @enum FrameKind
     * @brief Kind of a frame surfaced by ITransport::read().
     */
    enum class FrameKind { Text, Binary, Ping, Pong, Close };

    /**
     * @struct InboundFrame
     * @brief One frame read from the websocket.
     */
    struct InboundFrame {
        FrameKind   kind{ FrameKind::Text };
        std::string payload;
    };

    /**
     * @class ITransport
     * @brief Websocket client connection.
     */
    class ITransport {
    public:
        virtual ~ITransport() = default;

        /**
         * @brief Connect and complete the websocket handshake.
         * @param url Full "wss://host/path?ticket=..." URL
         * @throws TransportError if the handshake does not complete
         */
        virtual void open(const std::string& url) = 0;

        /**
         * @brief Write one text frame; returns once the write completed.
         * @throws NotConnectedError if not open, TransportError if the write fails
         */
        virtual void sendText(const std::string& text) = 0;

        /**
         * @brief Write one websocket ping frame.
         * @throws NotConnectedError if not open, TransportError if the write fails
         */
        virtual void ping() = 0;

        /**
         * @brief Block for the next inbound frame.
         * @return The frame, or std::nullopt once the stream ended or failed
         */
        virtual std::optional<InboundFrame> read() = 0;

        /**
         * @brief Tear the connection down; a blocked read() returns std::nullopt.
         *
         * Safe to call from any thread, any number of times.
         */
        virtual void abort() = 0;

        virtual bool isOpen() const = 0;
    };

}
