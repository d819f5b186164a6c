#pragma once

namespace dingstream {

    inline constexpr const char* GATEWAY_URL   = "https://api.dingtalk.com/v1.0/gateway/connections/open";
    inline constexpr const char* GET_TOKEN_URL = "https://oapi.dingtalk.com/gettoken";

    /// Topic for robot (chat bot) message callbacks
    inline constexpr const char* TOPIC_ROBOT = "/v1.0/im/bot/messages/get";
    /// Topic for interactive card callbacks
    inline constexpr const char* TOPIC_CARD  = "/v1.0/card/instances/callback";

}
