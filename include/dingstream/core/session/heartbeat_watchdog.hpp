/**
 * @file heartbeat_watchdog.hpp
 * @brief Ping/pong liveness supervision of one connection epoch.
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>

namespace dingstream {

    class TransportSession;

    /**
     * @class HeartbeatWatchdog
     * @brief Pings the peer every interval and aborts the epoch when a pong is missed.
     *
     * Each tick: if no pong was seen since the previous ping, call onTimeout and
     * stop; otherwise clear the flag, ping, and sleep one interval. The
     * dispatcher reports pongs through markAlive(). A watchdog is created per
     * epoch and starts out alive.
     */
    class HeartbeatWatchdog {
    public:
        HeartbeatWatchdog(TransportSession& session,
                          std::chrono::milliseconds interval,
                          std::function<void()> onTimeout);

        /// Blocking loop; returns after a timeout, a failed ping, or stop().
        void run();

        /// Wake the loop and make it return. Idempotent.
        void stop();

        void markAlive() noexcept { alive_.store(true, std::memory_order_release); }

        bool alive() const noexcept { return alive_.load(std::memory_order_acquire); }

        bool timedOut() const noexcept { return timedOut_.load(std::memory_order_acquire); }

    private:
        /// @return true if stop() was requested during the wait
        bool sleepInterval();

        TransportSession&         session_;
        std::chrono::milliseconds interval_;
        std::function<void()>     onTimeout_;

        std::atomic<bool>       alive_{ true };
        std::atomic<bool>       timedOut_{ false };
        std::mutex              mx_;
        std::condition_variable cv_;
        bool                    stopped_{ false };
    };

}
