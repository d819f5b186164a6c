#include <catch2/catch_all.hpp>
#include <atomic>
#include <nlohmann/json.hpp>
#include <thread>
#include "dingstream/core/dispatch/callback_registry.hpp"
#include "dingstream/core/dispatch/inbound_dispatcher.hpp"
#include "dingstream/core/session/transport_session.hpp"
#include "dingstream/core/util/thread_pool.hpp"
#include "mock_transport.hpp"

using namespace dingstream;
using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {

struct Harness {
    MockNetwork       net;
    TransportSession  session{ net.factory() };
    Credentials       creds{ { "id", "secret" } };
    ThreadPool        pool{ 2 };
    CallbackRegistry  registry{ creds, pool };
    std::atomic<int>  pongs{ 0 };
    InboundDispatcher dispatcher{ session, registry, [this] { ++pongs; } };
    std::shared_ptr<MockLink> link;

    Harness() {
        session.open("wss://gw.test/connect?ticket=t");
        link = net.waitForLink(0);
    }

    ~Harness() {
        registry.shutdown();
        pool.join();
    }

    /// Feed frames, then a close frame, and run the loop to completion.
    void runWith(const std::vector<std::string>& texts) {
        for (const auto& t : texts) link->deliverText(t);
        link->deliver(FrameKind::Close);
        dispatcher.run();
    }

    json sent(size_t i) { return json::parse(link->sentFrames().at(i)); }
};

std::string frame(const char* type, const char* topic, const char* id, const std::string& data) {
    return json{ { "specVersion", "1.0" }, { "type", type },
                 { "headers", { { "topic", topic }, { "messageId", id }, { "contentType", "application/json" } } },
                 { "data", data } }.dump();
}

}

TEST_CASE("SYSTEM ping is answered with its own data", "[dispatcher]") {
    Harness h;
    h.runWith({ frame("SYSTEM", "ping", "m1", "PONG") });

    REQUIRE(h.link->sentFrames().size() == 1);
    REQUIRE(h.sent(0) == json::parse(
        R"({"code":200,"headers":{"contentType":"application/json","messageId":"m1"},"message":"OK","data":"PONG"})"));
}

TEST_CASE("informational SYSTEM topics send nothing", "[dispatcher]") {
    Harness h;
    h.runWith({ frame("SYSTEM", "CONNECTED", "s1", ""),
                frame("SYSTEM", "REGISTERED", "s2", ""),
                frame("SYSTEM", "KEEPALIVE", "s3", ""),
                frame("SYSTEM", "disconnect", "s4", "") });
    REQUIRE(h.link->sentFrames().empty());
}

TEST_CASE("EVENT frames are acked with the handler result", "[dispatcher]") {
    Harness h;
    std::string seenType;
    h.registry.setEventHandler([&](const EventData& ev) {
        seenType = ev.eventType;
        return EventAck::success("done");
    });

    auto ev = json::parse(frame("EVENT", "*", "e1", "{}"));
    ev["headers"]["eventType"] = "org_dept_create";
    h.runWith({ ev.dump() });

    REQUIRE(seenType == "org_dept_create");
    auto ack = h.sent(0);
    REQUIRE(ack["headers"]["messageId"] == "e1");
    REQUIRE(json::parse(ack["data"].get<std::string>()) == json{ { "status", "SUCCESS" }, { "message", "done" } });
}

TEST_CASE("replacing the event handler takes effect for the next frame", "[dispatcher]") {
    Harness h;
    h.registry.setEventHandler([](const EventData&) { return EventAck::success("first"); });
    h.link->deliverText(frame("EVENT", "*", "e1", "{}"));

    std::thread loop([&] { h.dispatcher.run(); });
    REQUIRE(h.link->waitSent(1));

    h.registry.setEventHandler([](const EventData&) { return EventAck::later("second"); });
    h.link->deliverText(frame("EVENT", "*", "e2", "{}"));
    REQUIRE(h.link->waitSent(2));

    h.link->deliver(FrameKind::Close);
    loop.join();

    REQUIRE(json::parse(h.sent(0)["data"].get<std::string>())["message"] == "first");
    REQUIRE(json::parse(h.sent(1)["data"].get<std::string>())["message"] == "second");
}

TEST_CASE("throwing event handler is acked LATER and the loop continues", "[dispatcher]") {
    Harness h;
    h.registry.setEventHandler([](const EventData&) -> EventAck { throw std::runtime_error("db down"); });
    h.runWith({ frame("EVENT", "*", "e1", "{}"), frame("SYSTEM", "ping", "m2", "x") });

    REQUIRE(h.link->sentFrames().size() == 2);
    REQUIRE(json::parse(h.sent(0)["data"].get<std::string>())["status"] == "LATER");
    REQUIRE(h.sent(1)["headers"]["messageId"] == "m2");
}

TEST_CASE("EVENT without a handler is acked SUCCESS", "[dispatcher]") {
    Harness h;
    h.runWith({ frame("EVENT", "*", "e1", "{}") });
    REQUIRE(json::parse(h.sent(0)["data"].get<std::string>())["status"] == "SUCCESS");
}

TEST_CASE("CALLBACK is acked before the topic listener runs", "[dispatcher]") {
    Harness h;
    std::mutex mx;
    std::condition_variable cv;
    size_t ackedBeforeHandler = 0;
    std::string seenId;
    int calls = 0;

    h.registry.registerRawTopicListener("/v1.0/im/bot/messages/get", [&](const DownstreamFrame& f) {
        std::lock_guard<std::mutex> lk(mx);
        ackedBeforeHandler = h.link->sentFrames().size();
        seenId = f.headers.messageId;
        ++calls;
        cv.notify_all();
    });

    h.runWith({ frame("CALLBACK", "/v1.0/im/bot/messages/get", "m2", R"({"text":{"content":"hi"}})") });

    std::unique_lock<std::mutex> lk(mx);
    REQUIRE(cv.wait_for(lk, 2s, [&] { return calls == 1; }));
    REQUIRE(ackedBeforeHandler == 1);
    REQUIRE(seenId == "m2");

    auto ack = h.sent(0);
    REQUIRE(ack["headers"]["messageId"] == "m2");
    REQUIRE(json::parse(ack["data"].get<std::string>()) == json{ { "response", json::object() } });
}

TEST_CASE("malformed frames are skipped", "[dispatcher]") {
    Harness h;
    h.runWith({ "{not json", R"({"type":"SYSTEM"})", frame("SYSTEM", "ping", "m3", "ok") });
    REQUIRE(h.link->sentFrames().size() == 1);
    REQUIRE(h.sent(0)["headers"]["messageId"] == "m3");
}

TEST_CASE("pong frames are reported and binary frames ignored", "[dispatcher]") {
    Harness h;
    h.link->deliver(FrameKind::Pong);
    h.link->deliver(FrameKind::Binary, "\x01\x02");
    h.link->deliver(FrameKind::Pong);
    h.runWith({});
    REQUIRE(h.pongs == 2);
    REQUIRE(h.link->sentFrames().empty());
}

TEST_CASE("close frame ends the loop before later frames", "[dispatcher]") {
    Harness h;
    h.link->deliver(FrameKind::Close);
    h.link->deliverText(frame("SYSTEM", "ping", "late", "x"));
    h.dispatcher.run();
    REQUIRE(h.link->sentFrames().empty());
}

TEST_CASE("stream end terminates the loop", "[dispatcher]") {
    Harness h;
    h.link->deliverText(frame("SYSTEM", "ping", "m1", "x"));
    h.link->endStream();
    h.dispatcher.run();
    // the ack could not be written once the stream ended
    REQUIRE(h.link->sentFrames().empty());
}

TEST_CASE("closed session ends the loop without acking", "[dispatcher]") {
    Harness h;
    h.link->deliverText(frame("SYSTEM", "ping", "m1", "x"));
    h.link->deliverText(frame("SYSTEM", "ping", "m2", "x"));
    h.session.close();
    h.dispatcher.run();
    REQUIRE(h.link->sentFrames().empty());
}
