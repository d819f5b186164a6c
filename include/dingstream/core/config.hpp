/**
 * @file config.hpp
 * @brief Configuration options for a StreamClient.
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <string>

#include "dingstream/core/constants.hpp"

namespace dingstream {

    /**
     * @struct ClientOptions
     * @brief Tuning knobs and service URLs.
     *
     * heartbeatInterval and reconnectInterval are copied into the client's
     * Credentials at construction; later changes go through the client's
     * setters and apply from the next negotiation cycle.
     */
    struct ClientOptions {
        std::string tokenUrl{ GET_TOKEN_URL };            ///< Access token endpoint
        std::string gatewayUrl{ GATEWAY_URL };            ///< Connection (endpoint/ticket) endpoint
        std::string userAgent{ "dingstream/1.0" };        ///< Sent as "ua" to the gateway
        std::chrono::milliseconds heartbeatInterval{ 8000 };  ///< 0 disables the watchdog
        std::chrono::milliseconds reconnectInterval{ 1000 };  ///< 0 disables reconnection
        std::chrono::seconds      httpTimeout{ 30 };      ///< Per-request timeout for token/gateway calls
        size_t broadcastCapacity{ 1024 };                 ///< Queued CALLBACK frames per topic consumer
        size_t schedulerThreads{ 4 };                     ///< Initial workers of the default ThreadPool
    };

}
