/**
 * @file https_client.hpp
 * @brief Blocking HTTP/HTTPS client on Boost.Beast, used for token and gateway calls.
 */
#pragma once
#include <chrono>
#include <memory>
#include <string>

#include "dingstream/core/interfaces/ihttp_client.hpp"

namespace dingstream {

    /**
     * @class HttpsClient
     * @brief One connection per request; TLS peers are verified against the system trust store.
     */
    class HttpsClient : public IHttpClient {
    public:
        /**
         * @param timeout Budget for resolve, connect, handshake, write and read of one request
         * @param userAgent Value of the User-Agent header
         */
        explicit HttpsClient(std::chrono::seconds timeout = std::chrono::seconds(30),
                             std::string userAgent = "dingstream/1.0");
        ~HttpsClient() override;

        HttpsClient(const HttpsClient&) = delete;
        HttpsClient& operator=(const HttpsClient&) = delete;

        HttpResponse get(const std::string& url, const HttpHeaders& headers) override;
        HttpResponse post(const std::string& url,
                          const std::string& body,
                          const HttpHeaders& headers) override;

    private:
        struct Impl;
        std::unique_ptr<Impl> pImpl_;
    };

}
