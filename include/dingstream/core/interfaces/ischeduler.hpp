/**
 * @file ischeduler.hpp
 * @brief Interface for the background task scheduler supplied by the host.
 */
#pragma once
#include <functional>

namespace dingstream {

    /**
     * @class IScheduler
     * @brief Runs tasks concurrently in the background.
     *
     * The supervisor loop, the heartbeat watchdog, the inbound dispatcher and
     * every topic consumer are spawned through this interface. Tasks may block
     * for the lifetime of a connection, so implementations must not cap the
     * number of tasks running at once below what the client spawns.
     */
    class IScheduler {
    public:
        virtual ~IScheduler() = default;

        /**
         * @brief Schedule a task for concurrent execution.
         * @param task Function to run
         */
        virtual void spawn(std::function<void()> task) = 0;
    };

}
