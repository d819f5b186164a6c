#include "dingstream/transports/websocket/websocket_transport.hpp"
#include "dingstream/core/util/error_types.hpp"
#include "dingstream/core/util/logger.hpp"
#include "dingstream/core/util/url.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <thread>

namespace dingstream {

    namespace beast = boost::beast;
    namespace http = beast::http;
    namespace websocket = beast::websocket;
    namespace net = boost::asio;
    namespace ssl = net::ssl;
    using tcp = net::ip::tcp;

    using WsStream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;
    using WorkGuard = net::executor_work_guard<net::io_context::executor_type>;

    struct WebSocketTransport::Impl {
        WebSocketOptions          options;
        net::io_context           ioc;
        ssl::context              sslCtx{ ssl::context::tls_client };
        std::unique_ptr<WsStream> ws;
        beast::flat_buffer        readBuf;
        std::unique_ptr<WorkGuard> work;
        std::thread               ioThread;

        std::atomic<bool>         open{ false };
        std::atomic<bool>         aborted{ false };

        std::mutex                inMx;
        std::condition_variable   inCv;
        std::deque<InboundFrame>  inbound;
        bool                      ended{ false };

        explicit Impl(WebSocketOptions o) : options(std::move(o)) {
            sslCtx.set_verify_mode(ssl::verify_none);
        }

        ~Impl() {
            shutdown();
        }

        void push(InboundFrame frame) {
            {
                std::lock_guard<std::mutex> lk(inMx);
                if (ended) return;
                inbound.push_back(std::move(frame));
            }
            inCv.notify_one();
        }

        void finish() {
            open.store(false);
            {
                std::lock_guard<std::mutex> lk(inMx);
                ended = true;
            }
            inCv.notify_all();
        }

        /// Run one async step of the handshake on the calling thread.
        template<typename Initiate>
        void runStep(const char* step, Initiate&& initiate) {
            beast::error_code result;
            initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
            ioc.restart();
            ioc.run();
            if (result) throw TransportError(std::string(step) + " failed: " + result.message());
        }

        void connect(const ParsedUrl& u) {
            ws = std::make_unique<WsStream>(ioc, sslCtx);

            if (!SSL_set_tlsext_host_name(ws->next_layer().native_handle(), u.host.c_str()))
                throw TransportError("cannot set SNI host name, openssl error " + std::to_string(::ERR_get_error()));

            tcp::resolver resolver(ioc);
            beast::error_code ec;
            auto endpoints = resolver.resolve(u.host, u.port, ec);
            if (ec) throw TransportError("resolve " + u.host + " failed: " + ec.message());

            auto& lowest = beast::get_lowest_layer(*ws);
            lowest.expires_after(options.handshakeTimeout);
            runStep("connect", [&](auto handler) { lowest.async_connect(endpoints, std::move(handler)); });
            runStep("tls handshake", [&](auto handler) {
                ws->next_layer().async_handshake(ssl::stream_base::client, std::move(handler));
            });

            // The websocket layer manages its own timeouts from here on.
            lowest.expires_never();
            auto timeouts = websocket::stream_base::timeout::suggested(beast::role_type::client);
            timeouts.handshake_timeout = options.handshakeTimeout;
            ws->set_option(timeouts);

            const std::string ua = options.userAgent;
            ws->set_option(websocket::stream_base::decorator([ua](websocket::request_type& req) {
                req.set(http::field::user_agent, ua);
            }));
            ws->read_message_max(options.maxMessageSize);

            std::string hostHeader = u.host;
            if (u.port != "443") hostHeader += ":" + u.port;
            runStep("websocket handshake", [&](auto handler) {
                ws->async_handshake(hostHeader, u.target, std::move(handler));
            });

            ws->control_callback([this](websocket::frame_type kind, beast::string_view payload) {
                if (kind == websocket::frame_type::pong)
                    push({ FrameKind::Pong, std::string(payload.data(), payload.size()) });
                else if (kind == websocket::frame_type::ping)
                    push({ FrameKind::Ping, std::string(payload.data(), payload.size()) });
            });
        }

        void startIo() {
            ioc.restart();
            work = std::make_unique<WorkGuard>(ioc.get_executor());
            ioThread = std::thread([this] {
                ioc.run();
                LOG_TRACE("[WebSocket] io thread finished");
            });
            net::post(ioc, [this] { doRead(); });
        }

        void doRead() {
            ws->async_read(readBuf, [this](beast::error_code ec, std::size_t) {
                if (ec) {
                    if (ec == websocket::error::closed) {
                        const auto& reason = ws->reason();
                        LOG_INFO("[WebSocket] closed by peer, code " + std::to_string(static_cast<int>(reason.code))
                                 + " " + std::string(reason.reason.c_str()));
                        push({ FrameKind::Close, std::string(reason.reason.c_str()) });
                    } else if (!aborted.load()) {
                        LOG_WARN("[WebSocket] read failed: " + ec.message());
                    }
                    finish();
                    return;
                }
                InboundFrame frame;
                frame.kind = ws->got_text() ? FrameKind::Text : FrameKind::Binary;
                frame.payload = beast::buffers_to_string(readBuf.data());
                readBuf.consume(readBuf.size());
                push(std::move(frame));
                doRead();
            });
        }

        /// Post a write to the io thread and wait for its completion.
        template<typename Start>
        void write(const char* what, Start&& start) {
            if (!open.load()) throw NotConnectedError();

            auto done = std::make_shared<std::promise<beast::error_code>>();
            std::future<beast::error_code> result = done->get_future();
            net::post(ioc, [this, done, start = std::forward<Start>(start)]() mutable {
                start(*ws, [done](beast::error_code ec, auto&&...) { done->set_value(ec); });
            });

            if (result.wait_for(options.writeTimeout) != std::future_status::ready) {
                abortSocket();
                throw TransportError(std::string(what) + " timed out");
            }
            beast::error_code ec = result.get();
            if (ec) throw TransportError(std::string(what) + " failed: " + ec.message());
        }

        void abortSocket() {
            if (aborted.exchange(true)) return;
            open.store(false);
            if (ioThread.joinable()) {
                net::post(ioc, [this] {
                    beast::error_code ec;
                    beast::get_lowest_layer(*ws).socket().close(ec);
                });
            }
            finish();
        }

        void shutdown() {
            abortSocket();
            work.reset();
            if (ioThread.joinable()) {
                ioc.stop();
                ioThread.join();
            }
        }
    };

    WebSocketTransport::WebSocketTransport(WebSocketOptions options)
        : pImpl_(std::make_unique<Impl>(std::move(options))) {}

    WebSocketTransport::~WebSocketTransport() = default;

    void WebSocketTransport::open(const std::string& url) {
        if (pImpl_->ws) throw TransportError("transport already used");

        ParsedUrl u;
        try {
            u = parseUrl(url);
        } catch (const std::invalid_argument& e) {
            throw TransportError(std::string("bad websocket url: ") + e.what());
        }
        if (u.scheme != "wss") throw TransportError("unsupported websocket scheme " + u.scheme);

        LOG_DEBUG("[WebSocket] connecting to " + u.host + ":" + u.port);
        pImpl_->connect(u);
        pImpl_->open.store(true);
        pImpl_->startIo();
        LOG_INFO("[WebSocket] connected to " + u.host);
    }

    void WebSocketTransport::sendText(const std::string& text) {
        auto msg = std::make_shared<std::string>(text);
        pImpl_->write("write", [msg](WsStream& ws, auto handler) {
            ws.text(true);
            ws.async_write(net::buffer(*msg), [msg, handler](beast::error_code ec, std::size_t n) {
                handler(ec, n);
            });
        });
    }

    void WebSocketTransport::ping() {
        pImpl_->write("ping", [](WsStream& ws, auto handler) {
            ws.async_ping({}, std::move(handler));
        });
    }

    std::optional<InboundFrame> WebSocketTransport::read() {
        std::unique_lock<std::mutex> lk(pImpl_->inMx);
        pImpl_->inCv.wait(lk, [this] { return pImpl_->ended || !pImpl_->inbound.empty(); });
        if (pImpl_->inbound.empty()) return std::nullopt;
        InboundFrame f = std::move(pImpl_->inbound.front());
        pImpl_->inbound.pop_front();
        return f;
    }

    void WebSocketTransport::abort() {
        pImpl_->abortSocket();
    }

    bool WebSocketTransport::isOpen() const {
        return pImpl_->open.load();
    }

}
