/**
 * @file stream_protocol.hpp
 * @brief Wire types of the stream protocol and their JSON codec.
 *
 * Downstream (server → client) frames:
 *
 *     {"specVersion":"1.0","type":"CALLBACK",
 *      "headers":{"appId":..,"connectionId":..,"contentType":"application/json",
 *                 "messageId":..,"time":..,"topic":..,"eventType":..,...},
 *      "data":"<opaque string>"}
 *
 * Upstream (client → server) acknowledgements:
 *
 *     {"code":200,"headers":{"contentType":"application/json","messageId":..},
 *      "message":"OK","data":"<opaque string>"}
 */
#pragma once
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace dingstream {

    /**
     * @enum FrameType
     * @brief Value of the "type" field of a downstream frame.
     */
    enum class FrameType { System, Event, Callback, Unknown };

    const char* toString(FrameType t);
    FrameType frameTypeFromString(std::string_view s);

    /**
     * @brief Event metadata carried in the headers of EVENT frames.
     * All fields are optional on the wire.
     */
    struct EventData {
        std::string eventType;
        std::string eventBornTime;
        std::string eventId;
        std::string eventCorpId;
        std::string eventUnifiedAppId;
    };

    struct DownstreamHeaders {
        std::string appId;
        std::string connectionId;
        std::string contentType;
        std::string messageId;
        std::string time;
        std::string topic;
        EventData   event;
    };

    /**
     * @brief One parsed inbound text frame.
     */
    struct DownstreamFrame {
        std::string       specVersion;
        FrameType         type{ FrameType::Unknown };
        std::string       rawType;   ///< "type" as received, for logging unknown types
        DownstreamHeaders headers;
        std::string       data;
    };

    /**
     * @brief Acknowledgement written back for a frame that requires one.
     */
    struct UpstreamAck {
        int         code{ 200 };
        std::string contentType{ "application/json" };
        std::string messageId;
        std::string message{ "OK" };
        std::string data;
    };

    /**
     * @brief Result of the event handler, serialized into UpstreamAck::data.
     */
    struct EventAck {
        static constexpr const char* SUCCESS = "SUCCESS";
        static constexpr const char* LATER   = "LATER";

        std::string status{ SUCCESS };
        std::string message;

        static EventAck success(std::string msg = {}) { return { SUCCESS, std::move(msg) }; }
        static EventAck later(std::string msg = {})   { return { LATER, std::move(msg) }; }
    };

    void from_json(const nlohmann::json& j, EventData& e);
    void from_json(const nlohmann::json& j, DownstreamHeaders& h);
    void from_json(const nlohmann::json& j, DownstreamFrame& f);
    void to_json(nlohmann::json& j, const UpstreamAck& a);
    void to_json(nlohmann::json& j, const EventAck& a);

    /**
     * @class StreamProtocol
     * @brief Encodes and decodes the text frames exchanged over the websocket.
     */
    class StreamProtocol {
    public:
        /**
         * @brief Decode a downstream text frame.
         * @throws ProtocolParseError if the text is not valid JSON or lacks required fields
         */
        static DownstreamFrame parse(std::string_view text);

        static std::string serialize(const UpstreamAck& ack);

        /// Ack echoing @p data for the frame identified by @p messageId.
        static UpstreamAck makeAck(std::string messageId, std::string data);

        /// Ack carrying a serialized EventAck.
        static UpstreamAck makeEventAck(std::string messageId, const EventAck& result);

        /// Ack sent for every CALLBACK frame before it is handed to topic consumers.
        static UpstreamAck makeCallbackAck(std::string messageId);
    };

}
