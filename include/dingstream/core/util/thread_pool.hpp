/**
 * @file thread_pool.hpp
 * @brief Thread pool used as the default task scheduler.
 *
 * Stream tasks block on network reads, heartbeat sleeps and broadcast
 * receives for as long as a connection lives. The pool therefore starts with
 * a fixed number of workers and adds one whenever a task is queued while
 * every worker is busy.
 */
#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <atomic>
#include <memory>
#include <stdexcept>

#include "dingstream/core/interfaces/ischeduler.hpp"

namespace dingstream {

    /**
     * @class ThreadPool
     * @brief Growing thread pool implementing IScheduler.
     */
    class ThreadPool : public IScheduler {
    public:
        /**
         * @brief Constructor for ThreadPool.
         * @param thread_count Number of workers started up front. If 0, uses hardware concurrency.
         * @param max_threads Upper bound on workers; 0 means unbounded.
         */
        explicit ThreadPool(size_t thread_count = 0, size_t max_threads = 0);

        /**
         * @brief Destructor for ThreadPool.
         *
         * Waits for all threads to finish and joins them.
         */
        ~ThreadPool() override;

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * @brief Add a task to the thread pool.
         * @param task Function to execute
         * @return Future containing the result of the task
         */
        template<typename F, typename... Args>
        auto add(F&& task, Args&&... args) -> std::future<decltype(task(args...))>;

        /**
         * @brief Add a task to the thread pool (void return type).
         * @param task Function to execute
         */
        void add(std::function<void()> task);

        void spawn(std::function<void()> task) override { add(std::move(task)); }

        /**
         * @brief Stop accepting tasks, drain the queue and join every worker.
         */
        void join();

        size_t getThreadCount() const;

        size_t getPendingTaskCount() const;

    private:
        void workerFunction();

        /// Requires queue_mutex_ held.
        void growIfSaturated();

        std::vector<std::thread> threads_;
        std::queue<std::function<void()>> tasks_;
        mutable std::mutex queue_mutex_;
        std::condition_variable condition_;
        std::atomic<bool> stop_;
        std::atomic<size_t> pending_tasks_;
        size_t idle_workers_{ 0 };
        size_t max_threads_;
    };

    template<typename F, typename... Args>
    auto ThreadPool::add(F&& task, Args&&... args) -> std::future<decltype(task(args...))> {
        using return_type = decltype(task(args...));

        auto packaged_task = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(task), std::forward<Args>(args)...)
        );

        std::future<return_type> result = packaged_task->get_future();

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (stop_) {
                throw std::runtime_error("ThreadPool is stopped");
            }

            tasks_.emplace([packaged_task]() { (*packaged_task)(); });
            ++pending_tasks_;
            growIfSaturated();
        }

        condition_.notify_one();
        return result;
    }

} // namespace dingstream
