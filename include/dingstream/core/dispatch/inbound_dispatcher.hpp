/**
 * @file inbound_dispatcher.hpp
 * @brief Reads frames of one connection epoch and routes them by type.
 */
#pragma once
#include <functional>
#include <string>

namespace dingstream {

    class TransportSession;
    class CallbackRegistry;
    struct DownstreamFrame;

    /**
     * @class InboundDispatcher
     * @brief Receive loop of a connection epoch.
     *
     * SYSTEM frames are acknowledged by echoing their data, EVENT frames by the
     * event handler's result, CALLBACK frames by a fixed acknowledgement that
     * is written before the frame is published to the topic consumers.
     * Frames that do not parse are logged and skipped. The loop ends when the
     * peer closes, the stream fails, or an acknowledgement cannot be written.
     */
    class InboundDispatcher {
    public:
        /**
         * @param onPong Called for every pong frame; used to feed the heartbeat watchdog
         */
        InboundDispatcher(TransportSession& session,
                          CallbackRegistry& registry,
                          std::function<void()> onPong = {});

        /// Blocking receive loop.
        void run();

    private:
        /// @return false when the acknowledgement could not be written
        bool handleText(const std::string& text);
        void handleSystem(const DownstreamFrame& frame);
        void handleEvent(const DownstreamFrame& frame);
        void handleCallback(DownstreamFrame frame);

        TransportSession&     session_;
        CallbackRegistry&     registry_;
        std::function<void()> onPong_;
    };

}
