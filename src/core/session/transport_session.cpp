#include "dingstream/core/session/transport_session.hpp"
#include "dingstream/core/util/error_types.hpp"
#include "dingstream/core/util/logger.hpp"

namespace dingstream {

    TransportSession::TransportSession(TransportFactory factory)
        : factory_(std::move(factory)) {}

    TransportSession::~TransportSession() {
        close();
    }

    void TransportSession::open(const std::string& url) {
        close();

        std::shared_ptr<ITransport> t = factory_();
        if (!t) throw TransportError("transport factory returned null");
        t->open(url);

        {
            std::lock_guard<std::mutex> lk(transportMx_);
            transport_ = std::move(t);
        }
        alive_.store(true, std::memory_order_release);
        LOG_INFO("[TransportSession] websocket open");
    }

    std::shared_ptr<ITransport> TransportSession::current() const {
        std::lock_guard<std::mutex> lk(transportMx_);
        return transport_;
    }

    void TransportSession::send(const UpstreamAck& ack) {
        sendText(StreamProtocol::serialize(ack));
    }

    void TransportSession::sendText(const std::string& text) {
        std::lock_guard<std::mutex> lk(writeMx_);
        auto t = current();
        if (!t) throw NotConnectedError();
        t->sendText(text);
        LOG_TRACE("[TransportSession] sent " + text);
    }

    void TransportSession::ping() {
        std::lock_guard<std::mutex> lk(writeMx_);
        auto t = current();
        if (!t) throw NotConnectedError();
        t->ping();
    }

    std::optional<InboundFrame> TransportSession::receive() {
        auto t = current();
        if (!t) return std::nullopt;
        return t->read();
    }

    void TransportSession::abort() {
        if (auto t = current()) t->abort();
    }

    void TransportSession::close() {
        std::shared_ptr<ITransport> t;
        {
            std::lock_guard<std::mutex> lk(transportMx_);
            t.swap(transport_);
        }
        alive_.store(false, std::memory_order_release);
        if (t) {
            t->abort();
            LOG_DEBUG("[TransportSession] transport closed");
        }
    }

}
