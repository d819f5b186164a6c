#include "dingstream/core/protocol/stream_protocol.hpp"
#include "dingstream/core/util/error_types.hpp"
#include "dingstream/core/util/logger.hpp"

namespace dingstream {

    namespace {
        /* Missing or null → empty; numbers are kept as their text form. */
        std::string optString(const nlohmann::json& j, const char* key) {
            auto it = j.find(key);
            if (it == j.end() || it->is_null()) return {};
            if (it->is_string()) return it->get<std::string>();
            return it->dump();
        }
    }

    const char* toString(FrameType t) {
        switch (t) {
            case FrameType::System:   return "SYSTEM";
            case FrameType::Event:    return "EVENT";
            case FrameType::Callback: return "CALLBACK";
            case FrameType::Unknown:  return "UNKNOWN";
        }
        return "UNKNOWN";
    }

    FrameType frameTypeFromString(std::string_view s) {
        if (s == "SYSTEM")   return FrameType::System;
        if (s == "EVENT")    return FrameType::Event;
        if (s == "CALLBACK") return FrameType::Callback;
        return FrameType::Unknown;
    }

    void from_json(const nlohmann::json& j, EventData& e) {
        e.eventType         = optString(j, "eventType");
        e.eventBornTime     = optString(j, "eventBornTime");
        e.eventId           = optString(j, "eventId");
        e.eventCorpId       = optString(j, "eventCorpId");
        e.eventUnifiedAppId = optString(j, "eventUnifiedAppId");
    }

    void from_json(const nlohmann::json& j, DownstreamHeaders& h) {
        h.appId        = optString(j, "appId");
        h.connectionId = optString(j, "connectionId");
        h.contentType  = optString(j, "contentType");
        h.messageId    = optString(j, "messageId");
        h.time         = optString(j, "time");
        h.topic        = optString(j, "topic");
        from_json(j, h.event);
    }

    void from_json(const nlohmann::json& j, DownstreamFrame& f) {
        f.specVersion = optString(j, "specVersion");
        f.rawType     = j.at("type").get<std::string>();
        f.type        = frameTypeFromString(f.rawType);
        from_json(j.at("headers"), f.headers);
        f.data        = optString(j, "data");
    }

    void to_json(nlohmann::json& j, const UpstreamAck& a) {
        j = nlohmann::json{
            { "code", a.code },
            { "headers", { { "contentType", a.contentType }, { "messageId", a.messageId } } },
            { "message", a.message },
            { "data", a.data }
        };
    }

    void to_json(nlohmann::json& j, const EventAck& a) {
        j = nlohmann::json{ { "status", a.status }, { "message", a.message } };
    }

    DownstreamFrame StreamProtocol::parse(std::string_view text) {
        try {
            auto j = nlohmann::json::parse(text);
            if (!j.is_object())
                throw ProtocolParseError("downstream frame is not a JSON object");
            DownstreamFrame f = j.get<DownstreamFrame>();
            if (!j.at("headers").contains("messageId"))
                throw ProtocolParseError("downstream frame without messageId");
            if (f.headers.messageId.empty())
                LOG_DEBUG("[Protocol] " + f.rawType + " frame with empty messageId on topic " + f.headers.topic);
            return f;
        } catch (const nlohmann::json::exception& e) {
            throw ProtocolParseError(std::string("malformed downstream frame: ") + e.what());
        }
    }

    std::string StreamProtocol::serialize(const UpstreamAck& ack) {
        return nlohmann::json(ack).dump();
    }

    UpstreamAck StreamProtocol::makeAck(std::string messageId, std::string data) {
        UpstreamAck ack;
        ack.messageId = std::move(messageId);
        ack.data = std::move(data);
        return ack;
    }

    UpstreamAck StreamProtocol::makeEventAck(std::string messageId, const EventAck& result) {
        return makeAck(std::move(messageId), nlohmann::json(result).dump());
    }

    UpstreamAck StreamProtocol::makeCallbackAck(std::string messageId) {
        static const std::string body = nlohmann::json{ { "response", nlohmann::json::object() } }.dump();
        return makeAck(std::move(messageId), body);
    }

}
