#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>
#include "dingstream/core/protocol/robot_message.hpp"

using namespace dingstream;
using json = nlohmann::json;

namespace {

json baseMessage(const char* msgtype) {
    return json{
        { "msgId", "msgABC" }, { "msgtype", msgtype },
        { "conversationId", "cidXYZ" }, { "conversationType", "2" }, { "conversationTitle", "team" },
        { "chatbotCorpId", "corp" }, { "chatbotUserId", "$:LWCP_v1:$bot" },
        { "senderId", "$:LWCP_v1:$sender" }, { "senderNick", "Lee" }, { "senderStaffId", "staff-7" },
        { "sessionWebhook", "https://oapi.dingtalk.com/robot/sendBySession?session=abc" },
        { "sessionWebhookExpiredTime", 1700000000000ULL },
        { "createAt", 1699999990000ULL }, { "isAdmin", true }, { "isInAtList", true },
        { "atUsers", json::array({ { { "dingtalkId", "$:LWCP_v1:$bot" } } }) }
    };
}

}

TEST_CASE("text robot message decodes every field", "[robot]") {
    json j = baseMessage("text");
    j["text"] = { { "content", "ping" } };

    auto m = j.get<RobotRecvMessage>();
    REQUIRE(m.msgId == "msgABC");
    REQUIRE(m.text() == "ping");
    REQUIRE(m.conversationType == "2");
    REQUIRE(m.conversationTitle == "team");
    REQUIRE(m.senderNick == "Lee");
    REQUIRE(m.senderStaffId == "staff-7");
    REQUIRE(m.senderCorpId.empty());
    REQUIRE(m.isAdmin);
    REQUIRE(m.isInAtList);
    REQUIRE(m.atUsers.size() == 1);
    REQUIRE(m.atUsers[0].dingtalkId == "$:LWCP_v1:$bot");
    REQUIRE(m.atUsers[0].staffId.empty());
    REQUIRE(m.sessionWebhookExpiredTime == 1700000000000ULL);
    REQUIRE(m.createAt == 1699999990000ULL);
}

TEST_CASE("media robot messages decode their content", "[robot]") {
    SECTION("picture") {
        json j = baseMessage("picture");
        j["content"] = { { "downloadCode", "dc1" }, { "pictureDownloadCode", "pdc1" } };
        auto m = j.get<RobotRecvMessage>();
        auto* p = std::get_if<content::Picture>(&m.content);
        REQUIRE(p);
        REQUIRE(p->downloadCode == "dc1");
        REQUIRE(p->pictureDownloadCode == "pdc1");
        REQUIRE(m.text().empty());
    }
    SECTION("file") {
        json j = baseMessage("file");
        j["content"] = { { "downloadCode", "dc2" }, { "fileName", "report.pdf" } };
        auto m = j.get<RobotRecvMessage>();
        auto* f = std::get_if<content::File>(&m.content);
        REQUIRE(f);
        REQUIRE(f->fileName == "report.pdf");
    }
    SECTION("audio") {
        json j = baseMessage("audio");
        j["content"] = { { "duration", 4000 }, { "downloadCode", "dc3" }, { "recognition", "hello" } };
        auto m = j.get<RobotRecvMessage>();
        auto* a = std::get_if<content::Audio>(&m.content);
        REQUIRE(a);
        REQUIRE(a->duration == 4000);
        REQUIRE(a->recognition == "hello");
    }
    SECTION("video") {
        json j = baseMessage("video");
        j["content"] = { { "duration", 12 }, { "downloadCode", "dc4" }, { "videoType", "mp4" } };
        auto m = j.get<RobotRecvMessage>();
        auto* v = std::get_if<content::Video>(&m.content);
        REQUIRE(v);
        REQUIRE(v->videoType == "mp4");
    }
}

TEST_CASE("rich text keeps text and picture items in order", "[robot]") {
    json j = baseMessage("richText");
    j["content"] = { { "richText", json::array({
        { { "text", "look:" } },
        { { "downloadCode", "img1" }, { "type", "picture" } },
        { { "text", "nice" } } }) } };

    auto m = j.get<RobotRecvMessage>();
    auto* rt = std::get_if<content::RichText>(&m.content);
    REQUIRE(rt);
    REQUIRE(rt->richText.size() == 3);
    REQUIRE(std::get<content::RichTextText>(rt->richText[0]).text == "look:");
    REQUIRE(std::get<content::RichTextPicture>(rt->richText[1]).downloadCode == "img1");
    REQUIRE(std::get<content::RichTextText>(rt->richText[2]).text == "nice");
}

TEST_CASE("unknown msgtype keeps the raw content", "[robot]") {
    json j = baseMessage("interactiveCard");
    j["content"] = { { "cardId", "c1" } };
    auto m = j.get<RobotRecvMessage>();
    auto* u = std::get_if<content::Unknown>(&m.content);
    REQUIRE(u);
    REQUIRE(u->msgtype == "interactiveCard");
    REQUIRE(u->raw["cardId"] == "c1");
}

TEST_CASE("missing required fields fail to decode", "[robot]") {
    json j = baseMessage("text");
    j["text"] = { { "content", "x" } };
    j.erase("senderId");
    REQUIRE_THROWS_AS(j.get<RobotRecvMessage>(), json::exception);

    json noContent = baseMessage("file");
    REQUIRE_THROWS_AS(noContent.get<RobotRecvMessage>(), json::exception);
}
