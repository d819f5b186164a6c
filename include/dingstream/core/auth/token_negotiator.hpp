/**
 * @file token_negotiator.hpp
 * @brief Access token cache and gateway endpoint negotiation.
 */
#pragma once
#include <memory>
#include <string>

#include "dingstream/core/auth/credentials.hpp"
#include "dingstream/core/interfaces/ihttp_client.hpp"
#include "dingstream/core/util/time.hpp"

namespace dingstream {

    /**
     * @class TokenNegotiator
     * @brief Obtains access tokens and exchanges them for single-use websocket URLs.
     *
     * The negotiator is the only writer of the token fields in Credentials.
     * The HTTP calls are made without holding the Credentials lock.
     */
    class TokenNegotiator {
    public:
        /**
         * @param creds Shared credential store
         * @param http HTTP client used for both calls
         * @param tokenUrl Token endpoint (GET, appkey/appsecret query)
         * @param gatewayUrl Gateway endpoint (POST, credentials body)
         * @param clock Wall-clock source for expiry checks
         */
        TokenNegotiator(Credentials& creds,
                        std::shared_ptr<IHttpClient> http,
                        std::string tokenUrl,
                        std::string gatewayUrl,
                        Clock clock = systemNow);

        /**
         * @brief Return the cached token, fetching a new one only if it expired.
         * @throws AuthError
         */
        std::string getToken();

        /**
         * @brief Fetch a new token unconditionally and cache it.
         * @throws AuthError
         */
        std::string refreshToken();

        /**
         * @brief Refresh the token and open a connection ticket.
         * @return "<endpoint>?ticket=<ticket>"
         * @throws AuthError, NegotiationError
         */
        std::string getEndpoint();

    private:
        Credentials&                 creds_;
        std::shared_ptr<IHttpClient> http_;
        std::string                  tokenUrl_;
        std::string                  gatewayUrl_;
        Clock                        clock_;
    };

}
