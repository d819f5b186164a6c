/**
 * @file transport_session.hpp
 * @brief Send-half / receive-half wrapper around the current epoch's transport.
 */
#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "dingstream/core/interfaces/itransport.hpp"
#include "dingstream/core/protocol/stream_protocol.hpp"
#include "dingstream/core/types.hpp"

namespace dingstream {

    /**
     * @class TransportSession
     * @brief Owns the websocket connection of the current epoch.
     *
     * The send-half (send/sendText/ping) is guarded by a mutex held for the
     * duration of one write, so heartbeat pings and acknowledgements never
     * interleave. The receive-half (receive) is used by the dispatcher only
     * and takes no write lock.
     */
    class TransportSession {
    public:
        explicit TransportSession(TransportFactory factory);
        ~TransportSession();

        TransportSession(const TransportSession&) = delete;
        TransportSession& operator=(const TransportSession&) = delete;

        /**
         * @brief Create a transport and open it; the session becomes alive on success.
         * @throws TransportError
         */
        void open(const std::string& url);

        /**
         * @brief Serialize and write an acknowledgement.
         * @throws NotConnectedError, TransportError
         */
        void send(const UpstreamAck& ack);

        void sendText(const std::string& text);

        void ping();

        /**
         * @brief Next inbound frame of the current epoch.
         * @return std::nullopt when the stream ended or no transport is open
         */
        std::optional<InboundFrame> receive();

        /// Force the current connection down; unblocks receive().
        void abort();

        /// Drop the transport after the epoch ended. Sends fail with NotConnectedError afterwards.
        void close();

        bool alive() const noexcept { return alive_.load(std::memory_order_acquire); }

    private:
        std::shared_ptr<ITransport> current() const;

        TransportFactory             factory_;
        mutable std::mutex           transportMx_;   ///< guards transport_ pointer swaps
        std::shared_ptr<ITransport>  transport_;
        std::mutex                   writeMx_;       ///< held for one write
        std::atomic<bool>            alive_{ false };
    };

}
