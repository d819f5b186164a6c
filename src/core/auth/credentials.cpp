#include "dingstream/core/auth/credentials.hpp"
#include <algorithm>

namespace dingstream {

    const char* toString(SubscriptionKind kind) {
        switch (kind) {
            case SubscriptionKind::Event:    return "EVENT";
            case SubscriptionKind::System:   return "SYSTEM";
            case SubscriptionKind::Callback: return "CALLBACK";
        }
        return "EVENT";
    }

    void to_json(nlohmann::json& j, const Subscription& s) {
        j = nlohmann::json{ { "type", toString(s.kind) }, { "topic", s.topic } };
    }

    /* camelCase keys as the gateway expects them */
    void to_json(nlohmann::json& j, const CredentialsSnapshot& c) {
        j = nlohmann::json{
            { "clientId",      c.identity.clientId },
            { "clientSecret",  c.identity.clientSecret },
            { "ua",            c.userAgent },
            { "subscriptions", c.subscriptions }
        };
    }

    Credentials::Credentials(ClientIdentity identity)
        : identity_(std::move(identity)),
          subscriptions_{ { SubscriptionKind::Event, "*" }, { SubscriptionKind::System, "*" } } {}

    CredentialsSnapshot Credentials::snapshot() const {
        std::lock_guard<std::mutex> lk(mx_);
        return CredentialsSnapshot{ identity_, userAgent_, subscriptions_ };
    }

    bool Credentials::addSubscription(SubscriptionKind kind, const std::string& topic) {
        std::lock_guard<std::mutex> lk(mx_);
        Subscription sub{ kind, topic };
        if (std::find(subscriptions_.begin(), subscriptions_.end(), sub) != subscriptions_.end())
            return false;
        subscriptions_.push_back(std::move(sub));
        return true;
    }

    bool Credentials::hasSubscription(SubscriptionKind kind, const std::string& topic) const {
        std::lock_guard<std::mutex> lk(mx_);
        return std::find(subscriptions_.begin(), subscriptions_.end(), Subscription{ kind, topic })
            != subscriptions_.end();
    }

    std::vector<Subscription> Credentials::subscriptions() const {
        std::lock_guard<std::mutex> lk(mx_);
        return subscriptions_;
    }

    void Credentials::setUserAgent(std::string ua) {
        std::lock_guard<std::mutex> lk(mx_);
        userAgent_ = std::move(ua);
    }

    std::string Credentials::userAgent() const {
        std::lock_guard<std::mutex> lk(mx_);
        return userAgent_;
    }

    std::optional<std::string> Credentials::validToken(WallTime now) const {
        std::lock_guard<std::mutex> lk(mx_);
        if (accessToken_.empty() || now > tokenExpiresAt_) return std::nullopt;
        return accessToken_;
    }

    void Credentials::storeToken(std::string token, WallTime expiresAt) {
        std::lock_guard<std::mutex> lk(mx_);
        accessToken_ = std::move(token);
        tokenExpiresAt_ = expiresAt;
    }

    std::string Credentials::accessToken() const {
        std::lock_guard<std::mutex> lk(mx_);
        return accessToken_;
    }

    WallTime Credentials::tokenExpiresAt() const {
        std::lock_guard<std::mutex> lk(mx_);
        return tokenExpiresAt_;
    }

    void Credentials::setHeartbeatInterval(std::chrono::milliseconds interval) {
        std::lock_guard<std::mutex> lk(mx_);
        heartbeatInterval_ = interval;
    }

    std::chrono::milliseconds Credentials::heartbeatInterval() const {
        std::lock_guard<std::mutex> lk(mx_);
        return heartbeatInterval_;
    }

    void Credentials::setReconnectInterval(std::chrono::milliseconds interval) {
        std::lock_guard<std::mutex> lk(mx_);
        reconnectInterval_ = interval;
    }

    std::chrono::milliseconds Credentials::reconnectInterval() const {
        std::lock_guard<std::mutex> lk(mx_);
        return reconnectInterval_;
    }

}
