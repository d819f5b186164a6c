#include "dingstream/core/auth/token_negotiator.hpp"
#include "dingstream/core/util/error_types.hpp"
#include "dingstream/core/util/logger.hpp"
#include "dingstream/core/util/url.hpp"

#include <nlohmann/json.hpp>

namespace dingstream {

    namespace {

        /* The gettoken endpoint answers in snake_case; accept the camelCase spelling too. */
        template<typename T>
        T fieldOr(const nlohmann::json& j, const char* camel, const char* snake, T fallback) {
            if (auto it = j.find(camel); it != j.end() && !it->is_null()) return it->template get<T>();
            if (auto it = j.find(snake); it != j.end() && !it->is_null()) return it->template get<T>();
            return fallback;
        }

        std::string truncate(const std::string& s, size_t n = 256) {
            return s.size() <= n ? s : s.substr(0, n) + "...";
        }
    }

    TokenNegotiator::TokenNegotiator(Credentials& creds,
                                     std::shared_ptr<IHttpClient> http,
                                     std::string tokenUrl,
                                     std::string gatewayUrl,
                                     Clock clock)
        : creds_(creds),
          http_(std::move(http)),
          tokenUrl_(std::move(tokenUrl)),
          gatewayUrl_(std::move(gatewayUrl)),
          clock_(clock ? std::move(clock) : Clock(systemNow)) {}

    std::string TokenNegotiator::getToken() {
        if (auto cached = creds_.validToken(clock_()))
            return *cached;
        return refreshToken();
    }

    std::string TokenNegotiator::refreshToken() {
        const auto& id = creds_.identity();
        std::string url = tokenUrl_ + "?appkey=" + urlEncode(id.clientId)
                        + "&appsecret=" + urlEncode(id.clientSecret);

        HttpResponse resp;
        try {
            resp = http_->get(url, { { "Accept", "application/json" } });
        } catch (const std::exception& e) {
            throw AuthError(std::string("get token request failed: ") + e.what());
        }
        if (!resp.ok()) {
            throw AuthError("get token http error: " + std::to_string(resp.status)
                            + " - " + truncate(resp.body));
        }

        std::string token;
        long long expiresIn = 0;
        try {
            auto j = nlohmann::json::parse(resp.body);
            auto errcode = j.value("errcode", 0LL);
            if (errcode != 0) {
                throw AuthError("get token content error: " + std::to_string(errcode)
                                + " - " + j.value("errmsg", std::string{}));
            }
            token = fieldOr<std::string>(j, "accessToken", "access_token", "");
            expiresIn = fieldOr<long long>(j, "expiresIn", "expires_in", 0LL);
        } catch (const nlohmann::json::exception& e) {
            throw AuthError(std::string("malformed token response: ") + e.what());
        }
        if (token.empty())
            throw AuthError("token response without access token: " + truncate(resp.body));

        creds_.storeToken(token, clock_() + std::chrono::seconds(expiresIn));
        LOG_DEBUG("[TokenNegotiator] token refreshed, expires in " + std::to_string(expiresIn) + "s");
        return token;
    }

    std::string TokenNegotiator::getEndpoint() {
        std::string token = refreshToken();
        nlohmann::json body = creds_.snapshot();

        HttpResponse resp;
        try {
            resp = http_->post(gatewayUrl_, body.dump(), {
                { "Accept", "application/json" },
                { "Content-Type", "application/json" },
                { "access-token", token }
            });
        } catch (const std::exception& e) {
            throw NegotiationError(std::string("get endpoint request failed: ") + e.what());
        }
        if (!resp.ok()) {
            throw NegotiationError("get endpoint http error: " + std::to_string(resp.status)
                                   + " - " + truncate(resp.body));
        }

        std::string endpoint, ticket;
        try {
            auto j = nlohmann::json::parse(resp.body);
            endpoint = j.at("endpoint").get<std::string>();
            ticket = j.at("ticket").get<std::string>();
        } catch (const nlohmann::json::exception& e) {
            throw NegotiationError(std::string("malformed endpoint response: ") + e.what());
        }
        if (endpoint.empty() || ticket.empty())
            throw NegotiationError("endpoint response with empty endpoint or ticket");

        LOG_DEBUG("[TokenNegotiator] endpoint " + endpoint);
        return endpoint + "?ticket=" + ticket;
    }

}
