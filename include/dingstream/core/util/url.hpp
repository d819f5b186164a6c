/**
 * @file url.hpp
 * @brief Minimal URL helpers for the HTTPS and websocket clients.
 */
#pragma once
#include <string>
#include <string_view>

namespace dingstream {

    /**
     * @struct ParsedUrl
     * @brief Pieces of an absolute http(s)/ws(s) URL.
     */
    struct ParsedUrl {
        std::string scheme;   ///< "https", "http", "wss" or "ws"
        std::string host;
        std::string port;     ///< explicit port, or the scheme default
        std::string target;   ///< path plus query, always starts with '/'

        bool secure() const { return scheme == "https" || scheme == "wss"; }
    };

    /**
     * @brief Split an absolute URL.
     * @throws std::invalid_argument when the scheme is missing/unsupported or the host is empty
     */
    ParsedUrl parseUrl(std::string_view url);

    /**
     * @brief Percent-encode a query component (RFC 3986 unreserved set kept).
     */
    std::string urlEncode(std::string_view value);

}
