#include "dingstream/core/session/heartbeat_watchdog.hpp"
#include "dingstream/core/session/transport_session.hpp"
#include "dingstream/core/util/logger.hpp"

namespace dingstream {

    HeartbeatWatchdog::HeartbeatWatchdog(TransportSession& session,
                                         std::chrono::milliseconds interval,
                                         std::function<void()> onTimeout)
        : session_(session), interval_(interval), onTimeout_(std::move(onTimeout)) {}

    void HeartbeatWatchdog::run() {
        if (interval_.count() <= 0) return;

        LOG_DEBUG("[Heartbeat] started, interval " + std::to_string(interval_.count()) + "ms");
        while (true) {
            {
                std::lock_guard<std::mutex> lk(mx_);
                if (stopped_) break;
            }

            if (!alive_.exchange(false, std::memory_order_acq_rel)) {
                LOG_WARN("[Heartbeat] no pong within " + std::to_string(interval_.count())
                         + "ms, aborting connection");
                timedOut_.store(true, std::memory_order_release);
                if (onTimeout_) onTimeout_();
                return;
            }

            try {
                session_.ping();
                LOG_TRACE("[Heartbeat] ping");
            } catch (const std::exception& e) {
                LOG_WARN("[Heartbeat] ping failed: " + std::string(e.what()));
                timedOut_.store(true, std::memory_order_release);
                if (onTimeout_) onTimeout_();
                return;
            }

            if (sleepInterval()) break;
        }
        LOG_DEBUG("[Heartbeat] stopped");
    }

    bool HeartbeatWatchdog::sleepInterval() {
        std::unique_lock<std::mutex> lk(mx_);
        return cv_.wait_for(lk, interval_, [this] { return stopped_; });
    }

    void HeartbeatWatchdog::stop() {
        {
            std::lock_guard<std::mutex> lk(mx_);
            stopped_ = true;
        }
        cv_.notify_all();
    }

}
