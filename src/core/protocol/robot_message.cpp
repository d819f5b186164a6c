#include "dingstream/core/protocol/robot_message.hpp"

namespace dingstream {

    namespace {
        using nlohmann::json;

        std::string str(const json& j, const char* key) {
            auto it = j.find(key);
            if (it == j.end() || it->is_null()) return {};
            return it->get<std::string>();
        }

        /* "text" messages carry {"text":{"content":..}}, the rest {"content":{..}}. */
        const json& contentNode(const json& j, const std::string& msgtype) {
            if (msgtype == "text") {
                if (auto it = j.find("text"); it != j.end()) return *it;
            }
            return j.at("content");
        }

        content::RichTextItem richTextItem(const json& j) {
            if (j.contains("text"))
                return content::RichTextText{ j.at("text").get<std::string>() };
            return content::RichTextPicture{ j.at("downloadCode").get<std::string>(), str(j, "type") };
        }

        MsgContent decodeContent(const json& j, const std::string& msgtype) {
            if (msgtype == "text") {
                const json& c = contentNode(j, msgtype);
                return content::Text{ c.at("content").get<std::string>() };
            }
            if (msgtype == "file") {
                const json& c = j.at("content");
                return content::File{ c.at("downloadCode").get<std::string>(), c.at("fileName").get<std::string>() };
            }
            if (msgtype == "picture") {
                const json& c = j.at("content");
                return content::Picture{ c.at("downloadCode").get<std::string>(), str(c, "pictureDownloadCode") };
            }
            if (msgtype == "richText") {
                content::RichText rt;
                for (const auto& item : j.at("content").at("richText"))
                    rt.richText.push_back(richTextItem(item));
                return rt;
            }
            if (msgtype == "audio") {
                const json& c = j.at("content");
                return content::Audio{ c.at("duration").get<uint32_t>(),
                                       c.at("downloadCode").get<std::string>(),
                                       str(c, "recognition") };
            }
            if (msgtype == "video") {
                const json& c = j.at("content");
                return content::Video{ c.at("duration").get<uint32_t>(),
                                       c.at("downloadCode").get<std::string>(),
                                       str(c, "videoType") };
            }
            json raw = j.contains("content") ? j.at("content") : json{};
            return content::Unknown{ msgtype, std::move(raw) };
        }
    }

    void from_json(const json& j, AtUser& u) {
        u.dingtalkId = j.at("dingtalkId").get<std::string>();
        u.staffId    = str(j, "staffId");
    }

    void from_json(const json& j, RobotRecvMessage& m) {
        m.msgId   = j.at("msgId").get<std::string>();
        m.msgtype = j.at("msgtype").get<std::string>();
        m.content = decodeContent(j, m.msgtype);

        m.conversationId    = j.at("conversationId").get<std::string>();
        m.conversationType  = j.at("conversationType").get<std::string>();
        m.conversationTitle = str(j, "conversationTitle");

        m.atUsers    = j.value("atUsers", std::vector<AtUser>{});
        m.isInAtList = j.value("isInAtList", false);

        m.chatbotCorpId = str(j, "chatbotCorpId");
        m.chatbotUserId = j.at("chatbotUserId").get<std::string>();

        m.senderId      = j.at("senderId").get<std::string>();
        m.senderNick    = j.at("senderNick").get<std::string>();
        m.senderCorpId  = str(j, "senderCorpId");
        m.senderStaffId = str(j, "senderStaffId");

        m.sessionWebhookExpiredTime = j.at("sessionWebhookExpiredTime").get<uint64_t>();
        m.sessionWebhook            = j.at("sessionWebhook").get<std::string>();

        m.isAdmin  = j.value("isAdmin", false);
        m.createAt = j.at("createAt").get<uint64_t>();
    }

    std::string RobotRecvMessage::text() const {
        if (auto* t = std::get_if<content::Text>(&content)) return t->content;
        return {};
    }

}
