#include <catch2/catch_all.hpp>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include "dingstream/core/dispatch/callback_registry.hpp"
#include "dingstream/core/util/error_types.hpp"
#include "dingstream/core/util/thread_pool.hpp"

using namespace dingstream;
using namespace std::chrono_literals;

namespace {

struct Note {
    std::string content;
};

void from_json(const nlohmann::json& j, Note& n) {
    j.at("content").get_to(n.content);
}

/// Thread-safe sink the consumer tasks write into.
struct Collector {
    std::mutex mx;
    std::condition_variable cv;
    std::vector<std::string> items;

    void add(std::string s) {
        {
            std::lock_guard<std::mutex> lk(mx);
            items.push_back(std::move(s));
        }
        cv.notify_all();
    }

    bool waitFor(size_t n, std::chrono::milliseconds timeout = 2000ms) {
        std::unique_lock<std::mutex> lk(mx);
        return cv.wait_for(lk, timeout, [&] { return items.size() >= n; });
    }

    std::vector<std::string> snapshot() {
        std::lock_guard<std::mutex> lk(mx);
        return items;
    }
};

FramePtr callback(const std::string& topic, const std::string& id, const std::string& data) {
    auto f = std::make_shared<DownstreamFrame>();
    f->type = FrameType::Callback;
    f->rawType = "CALLBACK";
    f->headers.topic = topic;
    f->headers.messageId = id;
    f->data = data;
    return f;
}

struct Fixture {
    Credentials      creds{ { "id", "secret" } };
    ThreadPool       pool{ 2 };
    CallbackRegistry registry{ creds, pool };

    ~Fixture() {
        registry.shutdown();
        pool.join();
    }
};

}

TEST_CASE("registering a topic adds a CALLBACK subscription once", "[registry]") {
    Fixture f;
    f.registry.registerRawTopicListener("/a", [](const DownstreamFrame&) {});
    f.registry.registerRawTopicListener("/a", [](const DownstreamFrame&) {});
    f.registry.registerRawTopicListener("/b", [](const DownstreamFrame&) {});

    REQUIRE(f.creds.hasSubscription(SubscriptionKind::Callback, "/a"));
    REQUIRE(f.creds.hasSubscription(SubscriptionKind::Callback, "/b"));
    REQUIRE(f.creds.subscriptions().size() == 4);
    REQUIRE(f.registry.consumerCount() == 2);
}

TEST_CASE("consumers only handle frames of their own topic", "[registry]") {
    Fixture f;
    Collector a, b;
    f.registry.registerRawTopicListener("/a", [&](const DownstreamFrame& fr) { a.add(fr.headers.messageId); });
    f.registry.registerRawTopicListener("/b", [&](const DownstreamFrame& fr) { b.add(fr.headers.messageId); });

    REQUIRE(f.registry.publish(callback("/a", "1", "{}")) == 1);
    REQUIRE(f.registry.publish(callback("/b", "2", "{}")) == 1);
    REQUIRE(f.registry.publish(callback("/a", "3", "{}")) == 1);
    REQUIRE(f.registry.publish(callback("/c", "4", "{}")) == 0);

    REQUIRE(a.waitFor(2));
    REQUIRE(b.waitFor(1));
    std::this_thread::sleep_for(50ms);
    REQUIRE(a.snapshot() == std::vector<std::string>{ "1", "3" });
    REQUIRE(b.snapshot() == std::vector<std::string>{ "2" });
}

TEST_CASE("re-registering a topic replaces its handler", "[registry]") {
    Fixture f;
    Collector first, second;
    f.registry.registerRawTopicListener("/a", [&](const DownstreamFrame& fr) { first.add(fr.headers.messageId); });
    f.registry.publish(callback("/a", "1", "{}"));
    REQUIRE(first.waitFor(1));

    f.registry.registerRawTopicListener("/a", [&](const DownstreamFrame& fr) { second.add(fr.headers.messageId); });
    f.registry.publish(callback("/a", "2", "{}"));
    REQUIRE(second.waitFor(1));

    std::this_thread::sleep_for(50ms);
    REQUIRE(first.snapshot() == std::vector<std::string>{ "1" });
    REQUIRE(second.snapshot() == std::vector<std::string>{ "2" });
}

TEST_CASE("typed listener decodes data and skips undecodable payloads", "[registry]") {
    Fixture f;
    Collector got;
    f.registry.registerTopicListener<Note>("/notes", [&](const Note& n) { got.add(n.content); });

    f.registry.publish(callback("/notes", "1", R"({"content":"hello"})"));
    f.registry.publish(callback("/notes", "2", "not json"));
    f.registry.publish(callback("/notes", "3", R"({"other":1})"));
    f.registry.publish(callback("/notes", "4", R"({"content":"world"})"));

    REQUIRE(got.waitFor(2));
    REQUIRE(got.snapshot() == std::vector<std::string>{ "hello", "world" });
}

TEST_CASE("a throwing handler does not stop its consumer", "[registry]") {
    Fixture f;
    Collector got;
    f.registry.registerRawTopicListener("/a", [&](const DownstreamFrame& fr) {
        got.add(fr.headers.messageId);
        if (fr.headers.messageId == "1") throw std::runtime_error("handler bug");
    });

    f.registry.publish(callback("/a", "1", "{}"));
    f.registry.publish(callback("/a", "2", "{}"));
    REQUIRE(got.waitFor(2));
}

TEST_CASE("event handler slot", "[registry]") {
    Fixture f;
    EventData ev;
    ev.eventType = "x";

    REQUIRE_FALSE(f.registry.hasEventHandler());
    REQUIRE(f.registry.dispatchEvent(ev).status == EventAck::SUCCESS);

    f.registry.setEventHandler([](const EventData& e) { return EventAck::later(e.eventType); });
    REQUIRE(f.registry.hasEventHandler());
    auto ack = f.registry.dispatchEvent(ev);
    REQUIRE(ack.status == EventAck::LATER);
    REQUIRE(ack.message == "x");

    f.registry.setEventHandler([](const EventData&) -> EventAck { throw std::logic_error("nope"); });
    REQUIRE_THROWS_AS(f.registry.dispatchEvent(ev), DispatchHandlerError);
}

TEST_CASE("shutdown ends every consumer", "[registry]") {
    Fixture f;
    f.registry.registerRawTopicListener("/a", [](const DownstreamFrame&) {});
    f.registry.registerRawTopicListener("/b", [](const DownstreamFrame&) {});
    f.registry.shutdown();
    REQUIRE(f.registry.publish(callback("/a", "1", "{}")) == 0);
    f.pool.join();   // returns only once both consumer loops finished
    REQUIRE(f.pool.getThreadCount() == 0);
}

TEST_CASE("shutdown waits for a consumer still inside its handler", "[registry]") {
    Credentials creds{ { "id", "secret" } };
    ThreadPool pool{ 2 };
    std::atomic<bool> entered{ false };
    std::atomic<bool> finished{ false };
    {
        CallbackRegistry registry{ creds, pool };
        registry.registerRawTopicListener("/slow", [&](const DownstreamFrame&) {
            entered = true;
            std::this_thread::sleep_for(200ms);
            finished = true;
        });
        registry.publish(callback("/slow", "1", "{}"));
        while (!entered) std::this_thread::sleep_for(1ms);
        registry.shutdown();
        REQUIRE(finished);
    }
    pool.join();
}

TEST_CASE("a slow consumer receives every frame published past its capacity", "[registry]") {
    Credentials creds{ { "id", "secret" } };
    ThreadPool pool{ 2 };
    Collector got;
    {
        CallbackRegistry registry{ creds, pool, 4 };
        registry.registerRawTopicListener("/a", [&](const DownstreamFrame& fr) {
            std::this_thread::sleep_for(1ms);
            got.add(fr.headers.messageId);
        });
        registry.registerRawTopicListener("/b", [](const DownstreamFrame&) {});

        for (int i = 0; i < 50; ++i) {
            registry.publish(callback("/a", std::to_string(i), "{}"));
            registry.publish(callback("/c", "other-" + std::to_string(i), "{}"));
        }
        REQUIRE(got.waitFor(50));
    }
    pool.join();

    auto ids = got.snapshot();
    REQUIRE(ids.size() == 50);
    for (int i = 0; i < 50; ++i) REQUIRE(ids[i] == std::to_string(i));
}
