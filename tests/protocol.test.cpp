#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>
#include "dingstream/core/protocol/stream_protocol.hpp"
#include "dingstream/core/util/error_types.hpp"

using namespace dingstream;
using json = nlohmann::json;

TEST_CASE("StreamProtocol: parse SYSTEM ping frame", "[protocol]") {
    auto f = StreamProtocol::parse(R"({"specVersion":"1.0","type":"SYSTEM",
        "headers":{"contentType":"application/json","messageId":"m1","time":"1690000000000","topic":"ping"},
        "data":"PONG"})");

    REQUIRE(f.type == FrameType::System);
    REQUIRE(f.specVersion == "1.0");
    REQUIRE(f.headers.topic == "ping");
    REQUIRE(f.headers.messageId == "m1");
    REQUIRE(f.headers.time == "1690000000000");
    REQUIRE(f.data == "PONG");
}

TEST_CASE("StreamProtocol: ping ack echoes messageId and data", "[protocol]") {
    auto f = StreamProtocol::parse(
        R"({"type":"SYSTEM","headers":{"topic":"ping","messageId":"m1"},"data":"PONG"})");
    auto out = json::parse(StreamProtocol::serialize(StreamProtocol::makeAck(f.headers.messageId, f.data)));

    REQUIRE(out == json::parse(
        R"({"code":200,"headers":{"contentType":"application/json","messageId":"m1"},"message":"OK","data":"PONG"})"));
}

TEST_CASE("StreamProtocol: event fields are read from headers", "[protocol]") {
    auto f = StreamProtocol::parse(R"({"type":"EVENT","headers":{
        "messageId":"e1","topic":"*","eventType":"chat_update_title","eventId":"ev-9",
        "eventBornTime":1690000000123,"eventCorpId":"corp","eventUnifiedAppId":"app"},
        "data":"{\"title\":\"x\"}"})");

    REQUIRE(f.type == FrameType::Event);
    REQUIRE(f.headers.event.eventType == "chat_update_title");
    REQUIRE(f.headers.event.eventId == "ev-9");
    REQUIRE(f.headers.event.eventBornTime == "1690000000123");
    REQUIRE(f.headers.event.eventCorpId == "corp");
    REQUIRE(f.headers.event.eventUnifiedAppId == "app");
    REQUIRE(f.data == R"({"title":"x"})");
}

TEST_CASE("StreamProtocol: unknown type is kept, not rejected", "[protocol]") {
    auto f = StreamProtocol::parse(R"({"type":"FUTURE","headers":{"messageId":"u1"}})");
    REQUIRE(f.type == FrameType::Unknown);
    REQUIRE(f.rawType == "FUTURE");
    REQUIRE(f.data.empty());
}

TEST_CASE("StreamProtocol: malformed frames raise ProtocolParseError", "[protocol]") {
    REQUIRE_THROWS_AS(StreamProtocol::parse("not json"), ProtocolParseError);
    REQUIRE_THROWS_AS(StreamProtocol::parse("[1,2,3]"), ProtocolParseError);
    REQUIRE_THROWS_AS(StreamProtocol::parse(R"({"headers":{"messageId":"x"}})"), ProtocolParseError);
    REQUIRE_THROWS_AS(StreamProtocol::parse(R"({"type":"EVENT"})"), ProtocolParseError);
    REQUIRE_THROWS_AS(StreamProtocol::parse(R"({"type":"EVENT","headers":{"topic":"t"}})"), ProtocolParseError);
}

TEST_CASE("StreamProtocol: empty messageId is accepted when the key is present", "[protocol]") {
    auto f = StreamProtocol::parse(R"({"type":"CALLBACK","headers":{"topic":"/t","messageId":""},"data":"{}"})");
    REQUIRE(f.type == FrameType::Callback);
    REQUIRE(f.headers.messageId.empty());
    REQUIRE(f.headers.topic == "/t");
}

TEST_CASE("StreamProtocol: event ack carries serialized EventAck", "[protocol]") {
    auto ack = StreamProtocol::makeEventAck("e1", EventAck::later("busy"));
    REQUIRE(ack.messageId == "e1");
    REQUIRE(ack.code == 200);
    REQUIRE(json::parse(ack.data) == json{ { "status", "LATER" }, { "message", "busy" } });
}

TEST_CASE("StreamProtocol: callback ack has an empty response object", "[protocol]") {
    auto ack = StreamProtocol::makeCallbackAck("c1");
    auto out = json::parse(StreamProtocol::serialize(ack));
    REQUIRE(out["headers"]["messageId"] == "c1");
    REQUIRE(out["message"] == "OK");
    REQUIRE(json::parse(out["data"].get<std::string>()) == json{ { "response", json::object() } });
}
