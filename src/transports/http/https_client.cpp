#include "dingstream/transports/http/https_client.hpp"
#include "dingstream/core/util/logger.hpp"
#include "dingstream/core/util/url.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <mutex>
#include <stdexcept>

namespace dingstream {

    namespace beast = boost::beast;
    namespace http = beast::http;
    namespace net = boost::asio;
    namespace ssl = net::ssl;
    using tcp = net::ip::tcp;

    struct HttpsClient::Impl {
        std::chrono::seconds timeout;
        std::string          userAgent;
        std::mutex           mx;            ///< one request at a time per io_context
        net::io_context      ioc;
        ssl::context         sslCtx{ ssl::context::tls_client };

        Impl(std::chrono::seconds t, std::string ua) : timeout(t), userAgent(std::move(ua)) {
            sslCtx.set_default_verify_paths();
            sslCtx.set_verify_mode(ssl::verify_peer);
        }

        http::request<http::string_body> buildRequest(http::verb verb,
                                                      const ParsedUrl& u,
                                                      const std::string& body,
                                                      const HttpHeaders& headers) const {
            http::request<http::string_body> req{ verb, u.target, 11 };
            req.set(http::field::host, u.host);
            req.set(http::field::user_agent, userAgent);
            for (const auto& [name, value] : headers) req.set(name, value);
            if (verb == http::verb::post) {
                req.body() = body;
                req.prepare_payload();
            }
            return req;
        }

        static HttpResponse toResponse(http::response<http::string_body>& res) {
            HttpResponse out;
            out.status = res.result_int();
            out.body = std::move(res.body());
            return out;
        }

        /// Run one async step to completion on ioc; tcp_stream timeouts only apply to async operations.
        template<typename Initiate>
        void runStep(const char* step, Initiate&& initiate) {
            beast::error_code result;
            initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
            ioc.restart();
            ioc.run();
            if (result) throw beast::system_error(result, step);
        }

        HttpResponse requestPlain(const ParsedUrl& u, http::request<http::string_body>& req) {
            tcp::resolver resolver(ioc);
            beast::tcp_stream stream(ioc);
            auto endpoints = resolver.resolve(u.host, u.port);

            stream.expires_after(timeout);
            runStep("connect", [&](auto handler) { stream.async_connect(endpoints, std::move(handler)); });
            runStep("write", [&](auto handler) { http::async_write(stream, req, std::move(handler)); });

            beast::flat_buffer buffer;
            http::response<http::string_body> res;
            runStep("read", [&](auto handler) { http::async_read(stream, buffer, res, std::move(handler)); });

            beast::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            return toResponse(res);
        }

        HttpResponse requestTls(const ParsedUrl& u, http::request<http::string_body>& req) {
            tcp::resolver resolver(ioc);
            beast::ssl_stream<beast::tcp_stream> stream(ioc, sslCtx);

            if (!SSL_set_tlsext_host_name(stream.native_handle(), u.host.c_str())) {
                beast::error_code ec{ static_cast<int>(::ERR_get_error()), net::error::get_ssl_category() };
                throw beast::system_error{ ec };
            }
            stream.set_verify_callback(ssl::host_name_verification(u.host));
            auto endpoints = resolver.resolve(u.host, u.port);

            beast::get_lowest_layer(stream).expires_after(timeout);
            runStep("connect", [&](auto handler) {
                beast::get_lowest_layer(stream).async_connect(endpoints, std::move(handler));
            });
            runStep("tls handshake", [&](auto handler) {
                stream.async_handshake(ssl::stream_base::client, std::move(handler));
            });
            runStep("write", [&](auto handler) { http::async_write(stream, req, std::move(handler)); });

            beast::flat_buffer buffer;
            http::response<http::string_body> res;
            runStep("read", [&](auto handler) { http::async_read(stream, buffer, res, std::move(handler)); });

            beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(5));
            beast::error_code shutdownEc;
            stream.async_shutdown([&shutdownEc](beast::error_code ec) { shutdownEc = ec; });
            ioc.restart();
            ioc.run();
            // Servers commonly drop the connection without a close_notify.
            if (shutdownEc && shutdownEc != net::error::eof && shutdownEc != ssl::error::stream_truncated)
                LOG_DEBUG("[HttpsClient] tls shutdown: " + shutdownEc.message());
            return toResponse(res);
        }

        HttpResponse perform(http::verb verb,
                             const std::string& url,
                             const std::string& body,
                             const HttpHeaders& headers) {
            ParsedUrl u = parseUrl(url);
            auto req = buildRequest(verb, u, body, headers);

            std::lock_guard<std::mutex> lk(mx);
            ioc.restart();
            LOG_TRACE(std::string("[HttpsClient] ") + (verb == http::verb::post ? "POST " : "GET ") + u.scheme + "://" + u.host + u.target.substr(0, u.target.find('?')));
            HttpResponse res = u.secure() ? requestTls(u, req) : requestPlain(u, req);
            LOG_DEBUG("[HttpsClient] " + u.host + " answered " + std::to_string(res.status));
            return res;
        }
    };

    HttpsClient::HttpsClient(std::chrono::seconds timeout, std::string userAgent)
        : pImpl_(std::make_unique<Impl>(timeout, std::move(userAgent))) {}

    HttpsClient::~HttpsClient() = default;

    HttpResponse HttpsClient::get(const std::string& url, const HttpHeaders& headers) {
        return pImpl_->perform(http::verb::get, url, {}, headers);
    }

    HttpResponse HttpsClient::post(const std::string& url,
                                   const std::string& body,
                                   const HttpHeaders& headers) {
        return pImpl_->perform(http::verb::post, url, body, headers);
    }

}
