/**
 * @file credentials.hpp
 * @brief Client identity, subscriptions, cached access token and tuning knobs.
 *
 * Credentials is the one piece of mutable state shared by every stream task.
 * All access goes through a short critical section; callers copy what they
 * need (snapshot(), accessToken(), heartbeatInterval()) before doing I/O.
 */
#pragma once
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "dingstream/core/util/time.hpp"

namespace dingstream {

    /**
     * @brief Application credentials (AppKey / AppSecret in the vendor console).
     */
    struct ClientIdentity {
        std::string clientId;
        std::string clientSecret;

        [[nodiscard]] bool operator==(const ClientIdentity& o) const noexcept {
            return clientId == o.clientId && clientSecret == o.clientSecret;
        }
    };

    /**
     * @enum SubscriptionKind
     * @brief Frame class a subscription is registered for.
     */
    enum class SubscriptionKind { Event, System, Callback };

    const char* toString(SubscriptionKind kind);

    /**
     * @brief One (kind, topic) pair advertised to the gateway.
     *
     * Topics used in practice:
     * - "*" for EVENT and SYSTEM
     * - "/v1.0/im/bot/messages/get" for robot messages
     * - "/v1.0/card/instances/callback" for card callbacks
     */
    struct Subscription {
        SubscriptionKind kind;
        std::string      topic;

        [[nodiscard]] bool operator==(const Subscription& o) const noexcept {
            return kind == o.kind && topic == o.topic;
        }
    };

    /**
     * @brief Copy of everything the gateway needs to open a connection.
     */
    struct CredentialsSnapshot {
        ClientIdentity            identity;
        std::string               userAgent;
        std::vector<Subscription> subscriptions;
    };

    void to_json(nlohmann::json& j, const Subscription& s);
    void to_json(nlohmann::json& j, const CredentialsSnapshot& c);

    /**
     * @class Credentials
     * @brief Lock-protected credential store shared by the negotiator, the registry and the supervisor.
     */
    class Credentials {
    public:
        explicit Credentials(ClientIdentity identity);

        Credentials(const Credentials&) = delete;
        Credentials& operator=(const Credentials&) = delete;

        /// Identity never changes after construction, so no lock is needed.
        const ClientIdentity& identity() const noexcept { return identity_; }

        CredentialsSnapshot snapshot() const;

        /**
         * @brief Add a subscription unless the same (kind, topic) is already present.
         * @return true if it was inserted
         */
        bool addSubscription(SubscriptionKind kind, const std::string& topic);

        bool hasSubscription(SubscriptionKind kind, const std::string& topic) const;

        std::vector<Subscription> subscriptions() const;

        void setUserAgent(std::string ua);
        std::string userAgent() const;

        /**
         * @brief Cached token if it is still valid at @p now (now <= expiresAt).
         */
        std::optional<std::string> validToken(WallTime now) const;

        void storeToken(std::string token, WallTime expiresAt);

        std::string accessToken() const;
        WallTime tokenExpiresAt() const;

        void setHeartbeatInterval(std::chrono::milliseconds interval);
        std::chrono::milliseconds heartbeatInterval() const;

        void setReconnectInterval(std::chrono::milliseconds interval);
        std::chrono::milliseconds reconnectInterval() const;

    private:
        const ClientIdentity      identity_;
        mutable std::mutex        mx_;
        std::string               userAgent_;
        std::vector<Subscription> subscriptions_;
        std::string               accessToken_;
        WallTime                  tokenExpiresAt_{};
        std::chrono::milliseconds heartbeatInterval_{ 8000 };
        std::chrono::milliseconds reconnectInterval_{ 1000 };
    };

}
