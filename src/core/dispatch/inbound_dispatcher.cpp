#include "dingstream/core/dispatch/inbound_dispatcher.hpp"
#include "dingstream/core/dispatch/callback_registry.hpp"
#include "dingstream/core/protocol/stream_protocol.hpp"
#include "dingstream/core/session/transport_session.hpp"
#include "dingstream/core/util/error_types.hpp"
#include "dingstream/core/util/logger.hpp"

namespace dingstream {

    namespace {
        constexpr const char* SYSTEM_TOPIC_CONNECTED  = "CONNECTED";
        constexpr const char* SYSTEM_TOPIC_REGISTERED = "REGISTERED";
        constexpr const char* SYSTEM_TOPIC_DISCONNECT = "disconnect";
        constexpr const char* SYSTEM_TOPIC_KEEPALIVE  = "KEEPALIVE";
        constexpr const char* SYSTEM_TOPIC_PING       = "ping";
    }

    InboundDispatcher::InboundDispatcher(TransportSession& session,
                                         CallbackRegistry& registry,
                                         std::function<void()> onPong)
        : session_(session), registry_(registry), onPong_(std::move(onPong)) {}

    void InboundDispatcher::run() {
        LOG_DEBUG("[Dispatcher] receive loop started");
        while (auto frame = session_.receive()) {
            switch (frame->kind) {
            case FrameKind::Text:
                if (!handleText(frame->payload)) {
                    LOG_DEBUG("[Dispatcher] receive loop ended after failed write");
                    return;
                }
                break;
            case FrameKind::Pong:
                LOG_TRACE("[Dispatcher] pong");
                if (onPong_) onPong_();
                break;
            case FrameKind::Ping:
                LOG_TRACE("[Dispatcher] ping from peer");
                break;
            case FrameKind::Close:
                LOG_INFO("[Dispatcher] peer closed the connection");
                return;
            case FrameKind::Binary:
                LOG_WARN("[Dispatcher] ignoring binary frame of " + std::to_string(frame->payload.size()) + " bytes");
                break;
            }
        }
        LOG_DEBUG("[Dispatcher] stream ended");
    }

    bool InboundDispatcher::handleText(const std::string& text) {
        DownstreamFrame frame;
        try {
            frame = StreamProtocol::parse(text);
        } catch (const ProtocolParseError& e) {
            LOG_WARN(std::string("[Dispatcher] dropping malformed frame: ") + e.what());
            return true;
        }

        LOG_TRACE("[Dispatcher] " + std::string(toString(frame.type)) + " " + frame.headers.topic
                  + " messageId=" + frame.headers.messageId);

        try {
            switch (frame.type) {
            case FrameType::System:   handleSystem(frame); break;
            case FrameType::Event:    handleEvent(frame); break;
            case FrameType::Callback: handleCallback(std::move(frame)); break;
            case FrameType::Unknown:
                LOG_WARN("[Dispatcher] unknown frame type '" + frame.rawType + "', messageId "
                         + frame.headers.messageId);
                break;
            }
        } catch (const StreamError& e) {
            LOG_ERROR(std::string("[Dispatcher] cannot write acknowledgement: ") + e.what());
            return false;
        }
        return true;
    }

    void InboundDispatcher::handleSystem(const DownstreamFrame& frame) {
        const std::string& topic = frame.headers.topic;
        if (topic == SYSTEM_TOPIC_PING) {
            session_.send(StreamProtocol::makeAck(frame.headers.messageId, frame.data));
        } else if (topic == SYSTEM_TOPIC_CONNECTED || topic == SYSTEM_TOPIC_REGISTERED
                   || topic == SYSTEM_TOPIC_KEEPALIVE) {
            LOG_DEBUG("[Dispatcher] system " + topic);
        } else if (topic == SYSTEM_TOPIC_DISCONNECT) {
            LOG_INFO("[Dispatcher] server announced disconnect");
        } else {
            LOG_WARN("[Dispatcher] unknown system topic '" + topic + "'");
        }
    }

    void InboundDispatcher::handleEvent(const DownstreamFrame& frame) {
        EventAck result;
        try {
            result = registry_.dispatchEvent(frame.headers.event);
        } catch (const DispatchHandlerError& e) {
            LOG_ERROR(std::string("[Dispatcher] ") + e.what() + ", acking LATER");
            result = EventAck::later(e.what());
        }
        session_.send(StreamProtocol::makeEventAck(frame.headers.messageId, result));
    }

    void InboundDispatcher::handleCallback(DownstreamFrame frame) {
        session_.send(StreamProtocol::makeCallbackAck(frame.headers.messageId));
        auto shared = std::make_shared<const DownstreamFrame>(std::move(frame));
        size_t delivered = registry_.publish(shared);
        if (delivered == 0)
            LOG_DEBUG("[Dispatcher] no consumer for topic " + shared->headers.topic);
    }

}
