// Core API - everything you always need
#include "dingstream/dingstream.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>

using namespace dingstream;

static volatile std::sig_atomic_t g_stop = 0;

static void onSignal(int) { g_stop = 1; }

static std::string describe(const RobotRecvMessage& msg) {
    std::string text = msg.text();
    if (!text.empty()) return text;
    return "<" + msg.msgtype + " message>";
}

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: " << argv[0] << " <client-id> <client-secret>\n";
        return 2;
    }

    const char* level = std::getenv("DINGSTREAM_LOG_LEVEL");
    Logger::inst().setLevel(parseLogLevel(level ? level : "info"));

    ClientOptions opts;
    opts.userAgent = "dingstream-log-bot/1.0";

    StreamClient client(argv[1], argv[2], opts);

    client.onStateChange([](ConnectionState s) {
        LOG_INFO(std::string("[log_bot] connection ") + toString(s));
    });

    client.registerEventListener([](const EventData& ev) {
        LOG_INFO("[log_bot] event " + ev.eventType + " id=" + ev.eventId + " corp=" + ev.eventCorpId);
        return EventAck::success();
    });

    client.registerTopicListener<RobotRecvMessage>(TOPIC_ROBOT, [](const RobotRecvMessage& msg) {
        LOG_INFO("[log_bot] " + msg.senderNick + " in '" + msg.conversationTitle + "': " + describe(msg));
    });

    client.registerRawTopicListener(TOPIC_CARD, [](const DownstreamFrame& frame) {
        LOG_INFO("[log_bot] card callback " + frame.headers.messageId + ": " + frame.data);
    });

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    std::future<void> loop = client.start();
    while (loop.wait_for(std::chrono::milliseconds(200)) != std::future_status::ready) {
        if (g_stop) client.exit();
    }

    try {
        loop.get();
    } catch (const StreamError& e) {
        std::cerr << "stream stopped (" << toString(e.code()) << "): " << e.what() << "\n";
        return 1;
    }
    return 0;
}
