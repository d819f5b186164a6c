/**
 * @file thread_pool.cpp
 * @brief Implementation of the ThreadPool class.
 */
#include "dingstream/core/util/thread_pool.hpp"
#include "dingstream/core/util/logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace dingstream {

    ThreadPool::ThreadPool(size_t thread_count, size_t max_threads)
        : stop_(false), pending_tasks_(0), max_threads_(max_threads) {

        if (thread_count == 0) {
            thread_count = std::thread::hardware_concurrency();
            if (thread_count == 0) {
                thread_count = 2;
            }
        }
        if (max_threads_ != 0) {
            thread_count = std::min(thread_count, max_threads_);
        }

        std::lock_guard<std::mutex> lock(queue_mutex_);
        for (size_t i = 0; i < thread_count; ++i) {
            threads_.emplace_back(&ThreadPool::workerFunction, this);
        }
    }

    ThreadPool::~ThreadPool() {
        join();
    }

    void ThreadPool::add(std::function<void()> task) {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (stop_) {
                throw std::runtime_error("ThreadPool is stopped");
            }

            tasks_.emplace(std::move(task));
            ++pending_tasks_;
            growIfSaturated();
        }

        condition_.notify_one();
    }

    void ThreadPool::growIfSaturated() {
        if (pending_tasks_ <= idle_workers_) return;
        if (max_threads_ != 0 && threads_.size() >= max_threads_) return;
        threads_.emplace_back(&ThreadPool::workerFunction, this);
        LOG_DEBUG("[ThreadPool] all workers busy, grown to " + std::to_string(threads_.size()));
    }

    void ThreadPool::join() {
        std::vector<std::thread> workers;
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            stop_ = true;
            workers.swap(threads_);
        }

        condition_.notify_all();

        for (auto& thread : workers) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

    size_t ThreadPool::getThreadCount() const {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        return threads_.size();
    }

    size_t ThreadPool::getPendingTaskCount() const {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        return pending_tasks_;
    }

    void ThreadPool::workerFunction() {
        while (true) {
            std::function<void()> task;

            {
                std::unique_lock<std::mutex> lock(queue_mutex_);

                ++idle_workers_;
                condition_.wait(lock, [this] {
                    return stop_ || !tasks_.empty();
                });
                --idle_workers_;

                if (stop_ && tasks_.empty()) {
                    return;
                }

                task = std::move(tasks_.front());
                tasks_.pop();
                --pending_tasks_;
            }

            if (task) {
                try {
                    task();
                } catch (const std::exception& e) {
                    LOG_ERROR("[ThreadPool] task threw: " + std::string(e.what()));
                } catch (...) {
                    LOG_ERROR("[ThreadPool] task threw a non-standard exception");
                }
            }
        }
    }

} // namespace dingstream
