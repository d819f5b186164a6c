/**
 * @file callback_registry.hpp
 * @brief Event handler slot and topic consumers fed by the CALLBACK broadcast channel.
 */
#pragma once
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "dingstream/core/auth/credentials.hpp"
#include "dingstream/core/interfaces/ischeduler.hpp"
#include "dingstream/core/protocol/stream_protocol.hpp"
#include "dingstream/core/types.hpp"
#include "dingstream/core/util/broadcast_channel.hpp"
#include "dingstream/core/util/logger.hpp"

namespace dingstream {

    /**
     * @class CallbackRegistry
     * @brief Holds the single EVENT handler and one consumer task per CALLBACK topic.
     *
     * Topic consumers live as long as the registry, across reconnects. Each one
     * owns a broadcast subscription that only queues frames whose headers.topic
     * equals its own topic, and runs as a scheduler task. Registering a topic a
     * second time swaps the handler of the existing consumer.
     */
    class CallbackRegistry {
    public:
        /**
         * @param creds Credential store receiving the CALLBACK subscriptions
         * @param scheduler Scheduler running the consumer tasks
         * @param capacity Queued frames per consumer before publish() waits for it
         */
        CallbackRegistry(Credentials& creds, IScheduler& scheduler, size_t capacity = 1024);

        /// Same as shutdown().
        ~CallbackRegistry();

        CallbackRegistry(const CallbackRegistry&) = delete;
        CallbackRegistry& operator=(const CallbackRegistry&) = delete;

        /**
         * @brief Replace the EVENT handler. Takes effect for the next EVENT frame.
         */
        void setEventHandler(EventHandler handler);

        bool hasEventHandler() const;

        /**
         * @brief Run the EVENT handler. Without a handler the event is acknowledged as SUCCESS.
         * @throws DispatchHandlerError if the handler throws
         */
        EventAck dispatchEvent(const EventData& event) const;

        /**
         * @brief Subscribe @p topic and deliver its frames undecoded.
         */
        void registerRawTopicListener(const std::string& topic, RawTopicHandler handler);

        /**
         * @brief Subscribe @p topic and deliver each frame's data decoded as @p Msg.
         *
         * Msg needs an nlohmann from_json overload. Frames whose data does not
         * decode are logged and skipped.
         */
        template<typename Msg>
        void registerTopicListener(const std::string& topic, std::function<void(const Msg&)> handler) {
            registerRawTopicListener(topic,
                [topic, handler = std::move(handler)](const DownstreamFrame& frame) {
                    std::optional<Msg> msg;
                    try {
                        msg = nlohmann::json::parse(frame.data).get<Msg>();
                    } catch (const nlohmann::json::exception& e) {
                        LOG_WARN("[Registry] cannot decode payload for " + topic
                                 + " (messageId " + frame.headers.messageId + "): " + e.what());
                        return;
                    }
                    handler(*msg);
                });
        }

        /**
         * @brief Queue a CALLBACK frame for the consumer of its topic.
         *
         * Does not wait for the handler to run. Blocks only while that
         * consumer's queue is full.
         * @return Number of consumers the frame was queued for
         */
        size_t publish(FramePtr frame);

        /**
         * @brief Close the broadcast channel and wait for every consumer task to return.
         *
         * Consumers drain the frames already queued before they return. Idempotent.
         */
        void shutdown();

        size_t consumerCount() const;

    private:
        struct TopicConsumer {
            std::string topic;
            std::mutex  mx;
            RawTopicHandler handler;
            std::shared_ptr<BroadcastChannel<FramePtr>::Subscriber> subscriber;
        };

        void runConsumer(std::shared_ptr<TopicConsumer> consumer);
        void consumerFinished();

        Credentials& creds_;
        IScheduler&  scheduler_;

        mutable std::shared_mutex eventMx_;
        EventHandler              eventHandler_;

        mutable std::mutex topicsMx_;
        std::unordered_map<std::string, std::shared_ptr<TopicConsumer>> consumers_;

        std::mutex              runningMx_;
        std::condition_variable runningCv_;
        size_t                  running_{ 0 };

        BroadcastChannel<FramePtr> channel_;
    };

}
