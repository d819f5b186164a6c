/**
 * @file robot_message.hpp
 * @brief Payload of robot (chat bot) message callbacks, topic "/v1.0/im/bot/messages/get".
 *
 * Decoded from the "data" string of a CALLBACK frame by a typed topic
 * listener:
 *
 *     client.registerTopicListener<RobotRecvMessage>(TOPIC_ROBOT,
 *         [](const RobotRecvMessage& m) { ... });
 */
#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace dingstream {

    /// An @-mentioned user.
    struct AtUser {
        std::string dingtalkId;
        std::string staffId;
    };

    namespace content {
        struct Text    { std::string content; };
        struct File    { std::string downloadCode; std::string fileName; };
        struct Picture { std::string downloadCode; std::string pictureDownloadCode; };
        struct Audio   { uint32_t duration{ 0 }; std::string downloadCode; std::string recognition; };
        struct Video   { uint32_t duration{ 0 }; std::string downloadCode; std::string videoType; };

        struct RichTextText    { std::string text; };
        struct RichTextPicture { std::string downloadCode; std::string type; };
        using RichTextItem = std::variant<RichTextText, RichTextPicture>;
        struct RichText { std::vector<RichTextItem> richText; };

        /// Any msgtype this library does not model.
        struct Unknown { std::string msgtype; nlohmann::json raw; };
    }

    using MsgContent = std::variant<content::Text, content::File, content::Picture,
                                    content::RichText, content::Audio, content::Video,
                                    content::Unknown>;

    /**
     * @brief Message received by the robot.
     */
    struct RobotRecvMessage {
        std::string msgId;
        std::string msgtype;          ///< "text", "file", "picture", "richText", "audio", "video"
        MsgContent  content;

        std::string conversationId;
        std::string conversationType; ///< "1" single chat, "2" group chat
        std::string conversationTitle;

        std::vector<AtUser> atUsers;
        bool isInAtList{ false };

        std::string chatbotCorpId;
        std::string chatbotUserId;

        std::string senderId;
        std::string senderNick;
        std::string senderCorpId;
        std::string senderStaffId;

        uint64_t    sessionWebhookExpiredTime{ 0 };
        std::string sessionWebhook;

        bool     isAdmin{ false };
        uint64_t createAt{ 0 };

        /// Text body for "text" messages, empty otherwise.
        std::string text() const;
    };

    void from_json(const nlohmann::json& j, AtUser& u);
    void from_json(const nlohmann::json& j, RobotRecvMessage& m);

}
