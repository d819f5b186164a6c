/**
 * @file ihttp_client.hpp
 * @brief Interface for the one-shot HTTP calls made during token and endpoint negotiation.
 */
#pragma once
#include <string>
#include <utility>
#include <vector>

namespace dingstream {

    using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

    /**
     * @struct HttpResponse
     * @brief Status line and body of a completed request.
     */
    struct HttpResponse {
        unsigned    status{ 0 };
        std::string body;

        bool ok() const { return status >= 200 && status < 300; }
    };

    /**
     * @class IHttpClient
     * @brief Blocking HTTP(S) client.
     *
     * Implementations throw (any std::exception) when the request cannot be
     * completed at all; a non-2xx status is returned, not thrown.
     */
    class IHttpClient {
    public:
        virtual ~IHttpClient() = default;

        virtual HttpResponse get(const std::string& url, const HttpHeaders& headers) = 0;

        virtual HttpResponse post(const std::string& url,
                                  const std::string& body,
                                  const HttpHeaders& headers) = 0;
    };

}
