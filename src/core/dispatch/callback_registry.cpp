#include "dingstream/core/dispatch/callback_registry.hpp"
#include "dingstream/core/util/error_types.hpp"

namespace dingstream {

    CallbackRegistry::CallbackRegistry(Credentials& creds, IScheduler& scheduler, size_t capacity)
        : creds_(creds), scheduler_(scheduler), channel_(capacity) {}

    CallbackRegistry::~CallbackRegistry() {
        shutdown();
    }

    void CallbackRegistry::setEventHandler(EventHandler handler) {
        std::unique_lock<std::shared_mutex> lk(eventMx_);
        eventHandler_ = std::move(handler);
    }

    bool CallbackRegistry::hasEventHandler() const {
        std::shared_lock<std::shared_mutex> lk(eventMx_);
        return static_cast<bool>(eventHandler_);
    }

    EventAck CallbackRegistry::dispatchEvent(const EventData& event) const {
        EventHandler handler;
        {
            std::shared_lock<std::shared_mutex> lk(eventMx_);
            handler = eventHandler_;
        }
        if (!handler) {
            LOG_DEBUG("[Registry] no event handler, acking " + event.eventType + " as SUCCESS");
            return EventAck::success();
        }
        try {
            return handler(event);
        } catch (const std::exception& e) {
            throw DispatchHandlerError("event handler failed for " + event.eventType + ": " + e.what());
        }
    }

    void CallbackRegistry::registerRawTopicListener(const std::string& topic, RawTopicHandler handler) {
        std::lock_guard<std::mutex> lk(topicsMx_);

        creds_.addSubscription(SubscriptionKind::Callback, topic);

        if (auto it = consumers_.find(topic); it != consumers_.end()) {
            std::lock_guard<std::mutex> clk(it->second->mx);
            it->second->handler = std::move(handler);
            LOG_INFO("[Registry] replaced handler for topic " + topic);
            return;
        }

        auto consumer = std::make_shared<TopicConsumer>();
        consumer->topic = topic;
        consumer->handler = std::move(handler);
        consumer->subscriber = channel_.subscribe([topic](const FramePtr& f) {
            return f && f->headers.topic == topic;
        });
        consumers_.emplace(topic, consumer);

        {
            std::lock_guard<std::mutex> rlk(runningMx_);
            ++running_;
        }
        try {
            scheduler_.spawn([this, consumer] {
                try {
                    runConsumer(consumer);
                } catch (...) {
                    consumerFinished();
                    throw;
                }
                consumerFinished();
            });
        } catch (...) {
            consumers_.erase(topic);
            consumerFinished();
            throw;
        }
        LOG_INFO("[Registry] listening on topic " + topic);
    }

    void CallbackRegistry::runConsumer(std::shared_ptr<TopicConsumer> consumer) {
        while (auto frame = consumer->subscriber->receive()) {
            const DownstreamFrame& f = **frame;

            RawTopicHandler handler;
            {
                std::lock_guard<std::mutex> lk(consumer->mx);
                handler = consumer->handler;
            }
            if (!handler) continue;

            try {
                handler(f);
            } catch (const std::exception& e) {
                LOG_ERROR("[Registry] handler for " + consumer->topic + " failed (messageId "
                          + f.headers.messageId + "): " + e.what());
            }
        }
        LOG_DEBUG("[Registry] consumer for " + consumer->topic + " finished");
    }

    void CallbackRegistry::consumerFinished() {
        {
            std::lock_guard<std::mutex> lk(runningMx_);
            --running_;
        }
        runningCv_.notify_all();
    }

    size_t CallbackRegistry::publish(FramePtr frame) {
        return channel_.publish(frame);
    }

    void CallbackRegistry::shutdown() {
        channel_.close();
        std::unique_lock<std::mutex> lk(runningMx_);
        runningCv_.wait(lk, [this] { return running_ == 0; });
    }

    size_t CallbackRegistry::consumerCount() const {
        std::lock_guard<std::mutex> lk(topicsMx_);
        return consumers_.size();
    }

}
