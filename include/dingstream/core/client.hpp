/**
 * @file client.hpp
 * @brief StreamClient: the connection supervisor a host application talks to.
 *
 * Negotiates a websocket endpoint, runs the dispatcher and heartbeat of each
 * connection epoch, and reconnects with a fresh endpoint until exit() is
 * called.
 */
#pragma once
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "dingstream/core/auth/credentials.hpp"
#include "dingstream/core/config.hpp"
#include "dingstream/core/dispatch/callback_registry.hpp"
#include "dingstream/core/interfaces/ihttp_client.hpp"
#include "dingstream/core/interfaces/ischeduler.hpp"
#include "dingstream/core/types.hpp"
#include "dingstream/core/util/conn_state.hpp"

namespace dingstream {

    /**
     * @class StreamClient
     * @brief Stream-mode bot client.
     *
     * Listeners may be registered before or while connected. New topic
     * subscriptions are advertised from the next negotiation on.
     */
    class StreamClient {
    public:
        /**
         * @brief Client talking to the real service over Beast HTTPS and TLS websockets.
         */
        StreamClient(std::string clientId, std::string clientSecret, ClientOptions options = {});

        /**
         * @brief Client with injected collaborators.
         * @param scheduler Task scheduler; a ThreadPool of options.schedulerThreads is created if null
         */
        StreamClient(ClientIdentity identity,
                     ClientOptions options,
                     std::shared_ptr<IHttpClient> http,
                     TransportFactory transports,
                     std::shared_ptr<IScheduler> scheduler = nullptr);

        /**
         * @brief Requests exit and waits for every task the client spawned.
         */
        ~StreamClient();

        StreamClient(const StreamClient&) = delete;
        StreamClient& operator=(const StreamClient&) = delete;

        /// Replace the catch-all EVENT handler.
        void registerEventListener(EventHandler handler);

        /// Subscribe a CALLBACK topic with a handler receiving the raw frame.
        void registerRawTopicListener(const std::string& topic, RawTopicHandler handler);

        /**
         * @brief Subscribe a CALLBACK topic with a handler receiving the decoded payload.
         */
        template<typename Msg>
        void registerTopicListener(const std::string& topic, std::function<void(const Msg&)> handler) {
            registry().registerTopicListener<Msg>(topic, std::move(handler));
        }

        void setUserAgent(std::string ua);

        /// 0 disables the heartbeat. Applies from the next connection epoch.
        void setHeartbeatInterval(std::chrono::milliseconds interval);

        /// 0 disables reconnection.
        void setReconnectInterval(std::chrono::milliseconds interval);

        /**
         * @brief Run the connection loop on the calling thread.
         *
         * Returns after exit(), or after the first epoch ends when
         * reconnection is disabled.
         * @throws AuthError, NegotiationError, TransportError from any negotiation or handshake
         */
        void connect();

        /**
         * @brief Run connect() as a scheduler task.
         * @return Future that completes when the loop returns, carrying its exception if any
         */
        std::future<void> start();

        /**
         * @brief Stop the current epoch and prevent any further reconnect. Idempotent.
         */
        void exit();

        bool exited() const noexcept;

        ConnectionState state() const noexcept;

        /// Observer invoked on every state transition, on the supervisor's thread.
        void onStateChange(StateObserver observer);

        Credentials& credentials();

        /**
         * @brief Cached access token, fetched if missing or expired.
         * @throws AuthError
         */
        std::string token();

    private:
        CallbackRegistry& registry();

        struct Impl;
        std::unique_ptr<Impl> pImpl_;
    };

}
