/**
 * @file broadcast_channel.hpp
 * @brief Multi-consumer publish channel used to fan CALLBACK frames out to topic consumers.
 *
 * Every subscriber owns a bounded queue and an optional filter. publish()
 * copies the (shared) value into the queue of each live subscriber whose
 * filter accepts it and returns without waiting for the value to be handled.
 * Nothing is ever dropped: when a subscriber's queue is full, publish() blocks
 * until that subscriber takes an entry, unsubscribes, or the channel closes.
 */
#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "dingstream/core/util/logger.hpp"

namespace dingstream {

    template<typename T>
    class BroadcastChannel {
    public:
        using Filter = std::function<bool(const T&)>;

    private:
        struct Slot {
            std::mutex              mx;
            std::condition_variable cv;       ///< signalled when a value arrives
            std::condition_variable spaceCv;  ///< signalled when a value is taken
            std::deque<T>           queue;
            Filter                  accept;
            bool                    closed{ false };
            bool                    detached{ false };
        };

    public:
        /**
         * @class Subscriber
         * @brief Receiving end of one subscription. Unsubscribes on destruction.
         */
        class Subscriber {
        public:
            explicit Subscriber(std::shared_ptr<Slot> slot) : slot_(std::move(slot)) {}

            ~Subscriber() {
                {
                    std::lock_guard<std::mutex> lk(slot_->mx);
                    slot_->detached = true;
                }
                slot_->spaceCv.notify_all();
            }

            Subscriber(const Subscriber&) = delete;
            Subscriber& operator=(const Subscriber&) = delete;

            /**
             * @brief Block until a value is available or the channel is closed.
             * @return The next value, or std::nullopt once closed and drained
             */
            std::optional<T> receive() {
                std::unique_lock<std::mutex> lk(slot_->mx);
                slot_->cv.wait(lk, [this] { return slot_->closed || !slot_->queue.empty(); });
                return take(lk);
            }

            /// Non-blocking variant of receive().
            std::optional<T> tryReceive() {
                std::unique_lock<std::mutex> lk(slot_->mx);
                return take(lk);
            }

            size_t pending() const {
                std::lock_guard<std::mutex> lk(slot_->mx);
                return slot_->queue.size();
            }

        private:
            std::optional<T> take(std::unique_lock<std::mutex>& lk) {
                if (slot_->queue.empty()) return std::nullopt;
                T v = std::move(slot_->queue.front());
                slot_->queue.pop_front();
                lk.unlock();
                slot_->spaceCv.notify_all();
                return v;
            }

            std::shared_ptr<Slot> slot_;
        };

        explicit BroadcastChannel(size_t capacity = 1024) : capacity_(capacity == 0 ? 1 : capacity) {}

        ~BroadcastChannel() { close(); }

        BroadcastChannel(const BroadcastChannel&) = delete;
        BroadcastChannel& operator=(const BroadcastChannel&) = delete;

        /**
         * @brief Open a new subscription. It sees every value published after this call.
         * @param accept Values it rejects are never queued for this subscriber
         */
        std::shared_ptr<Subscriber> subscribe(Filter accept = {}) {
            auto slot = std::make_shared<Slot>();
            slot->accept = std::move(accept);
            std::lock_guard<std::mutex> lk(mx_);
            if (closed_) slot->closed = true;
            else slots_.push_back(slot);
            return std::make_shared<Subscriber>(std::move(slot));
        }

        /**
         * @brief Deliver a value to every live subscriber that accepts it.
         *
         * Blocks while an accepting subscriber's queue is at capacity.
         * @return Number of subscribers the value was queued for
         */
        size_t publish(const T& value) {
            std::vector<std::shared_ptr<Slot>> targets;
            {
                std::lock_guard<std::mutex> lk(mx_);
                if (closed_) return 0;
                for (auto it = slots_.begin(); it != slots_.end();) {
                    if (auto s = it->lock()) { targets.push_back(std::move(s)); ++it; }
                    else it = slots_.erase(it);
                }
            }
            size_t delivered = 0;
            for (auto& s : targets) {
                if (s->accept && !s->accept(value)) continue;
                {
                    std::unique_lock<std::mutex> lk(s->mx);
                    if (s->queue.size() >= capacity_ && !s->closed && !s->detached) {
                        LOG_DEBUG("[Broadcast] subscriber queue full, waiting for the consumer");
                        s->spaceCv.wait(lk, [&] {
                            return s->queue.size() < capacity_ || s->closed || s->detached;
                        });
                    }
                    if (s->closed || s->detached) continue;
                    s->queue.push_back(value);
                }
                s->cv.notify_one();
                ++delivered;
            }
            return delivered;
        }

        /**
         * @brief Close the channel; blocked receivers return std::nullopt once drained.
         */
        void close() {
            std::vector<std::weak_ptr<Slot>> slots;
            {
                std::lock_guard<std::mutex> lk(mx_);
                if (closed_) return;
                closed_ = true;
                slots.swap(slots_);
            }
            for (auto& w : slots) {
                if (auto s = w.lock()) {
                    {
                        std::lock_guard<std::mutex> lk(s->mx);
                        s->closed = true;
                    }
                    s->cv.notify_all();
                    s->spaceCv.notify_all();
                }
            }
        }

        size_t subscriberCount() const {
            std::lock_guard<std::mutex> lk(mx_);
            size_t n = 0;
            for (auto& w : slots_) if (!w.expired()) ++n;
            return n;
        }

    private:
        mutable std::mutex                mx_;
        std::vector<std::weak_ptr<Slot>>  slots_;
        size_t                            capacity_;
        bool                              closed_{ false };
    };

}
