/**
 * @file error_types.hpp
 * @brief Error type definitions for dingstream.
 *
 * Every failure the library raises is a StreamError carrying a StreamErr
 * code. Auth, Negotiation and Transport errors escape StreamClient::connect();
 * ProtocolParse and DispatchHandler errors are caught and logged by the
 * dispatcher and the topic consumers.
 */
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace dingstream {

    /**
     * @enum StreamErr
     * @brief Error codes for stream client operations.
     */
    enum class StreamErr : int {
        Auth = 1,        ///< Access token fetch or parse failed
        Negotiation,     ///< Gateway endpoint exchange failed
        Transport,       ///< Websocket open/handshake/write failed
        NotConnected,    ///< Send attempted without a live session
        ProtocolParse,   ///< Inbound frame could not be decoded
        DispatchHandler, ///< User event/topic handler failed
        Internal = 99    ///< Internal error
    };

    /**
     * @brief Short name of an error code, used in log lines.
     */
    inline const char* toString(StreamErr code) {
        switch (code) {
            case StreamErr::Auth:            return "Auth";
            case StreamErr::Negotiation:     return "Negotiation";
            case StreamErr::Transport:       return "Transport";
            case StreamErr::NotConnected:    return "NotConnected";
            case StreamErr::ProtocolParse:   return "ProtocolParse";
            case StreamErr::DispatchHandler: return "DispatchHandler";
            case StreamErr::Internal:        return "Internal";
        }
        return "Unknown";
    }

    /**
     * @class StreamError
     * @brief Base exception for every error raised by dingstream.
     */
    class StreamError : public std::runtime_error {
    public:
        StreamError(StreamErr code, const std::string& msg)
            : std::runtime_error(msg), code_(code) {}

        StreamErr code() const noexcept { return code_; }

    private:
        StreamErr code_;
    };

    class AuthError : public StreamError {
    public:
        explicit AuthError(const std::string& msg) : StreamError(StreamErr::Auth, msg) {}
    };

    class NegotiationError : public StreamError {
    public:
        explicit NegotiationError(const std::string& msg) : StreamError(StreamErr::Negotiation, msg) {}
    };

    class TransportError : public StreamError {
    public:
        explicit TransportError(const std::string& msg) : StreamError(StreamErr::Transport, msg) {}
    };

    class NotConnectedError : public StreamError {
    public:
        NotConnectedError() : StreamError(StreamErr::NotConnected, "stream not connected") {}
    };

    class ProtocolParseError : public StreamError {
    public:
        explicit ProtocolParseError(const std::string& msg) : StreamError(StreamErr::ProtocolParse, msg) {}
    };

    class DispatchHandlerError : public StreamError {
    public:
        explicit DispatchHandlerError(const std::string& msg) : StreamError(StreamErr::DispatchHandler, msg) {}
    };

}
