#pragma once

/** \file scheduler.hpp
 *  \brief Fixed-size worker pool with a centralized FIFO task queue.
 *
 * Hosts the trainer's long-running loops as well as short tasks. A task that
 * loops until cancelled occupies its worker for its whole lifetime, so size
 * the pool for the number of concurrent loops plus any short work.
 */

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#if defined(__APPLE__) || defined(__linux__)
#include <pthread.h>
#endif

namespace kestrel::core {

class Scheduler {
public:
    /** \brief Start `num_threads` workers (0 = max(2, hardware concurrency / 2)). */
    explicit Scheduler(std::size_t num_threads = 0) {
        if (num_threads == 0) {
            num_threads = std::max(2u, std::thread::hardware_concurrency() / 2);
        }
        workers_.reserve(num_threads);
        for (std::size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    }

    ~Scheduler() {
        request_stop();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /** \brief Queue a task; the future carries its result or exception.
     *  \throws std::runtime_error after request_stop()
     */
    template<typename Func>
    auto submit(Func&& func) -> std::future<std::invoke_result_t<std::decay_t<Func>>> {
        using return_type = std::invoke_result_t<std::decay_t<Func>>;

        auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<Func>(func));
        auto future = task->get_future();
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (stop_) {
                throw std::runtime_error("scheduler is stopped");
            }
            pending_.fetch_add(1, std::memory_order_relaxed);
            tasks_.emplace_back([this, task] {
                (*task)();
                auto rem = pending_.fetch_sub(1, std::memory_order_relaxed) - 1;
                if (rem == 0) {
                    std::unique_lock<std::mutex> lk(queue_mutex_);
                    cv_.notify_all();
                }
            });
        }
        cv_.notify_one();
        return future;
    }

    [[nodiscard]] auto num_threads() const noexcept -> std::size_t {
        return workers_.size();
    }

    /** \brief New submissions fail; workers exit once the queue drains. */
    auto request_stop() noexcept -> void {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            stop_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] auto stopping() const noexcept -> bool { return stop_.load(std::memory_order_relaxed); }

    /** \brief Block until every submitted task has finished. */
    auto wait_all() -> void {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        cv_.wait(lock, [this] { return pending_.load(std::memory_order_relaxed) == 0; });
    }

private:
    auto worker_loop() -> void {
        #if defined(__APPLE__)
          pthread_setname_np("kestrel-worker");
        #elif defined(__linux__)
          pthread_setname_np(pthread_self(), "kestrel-worker");
        #endif
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                if (stop_ && tasks_.empty()) {
                    return;
                }
                task = std::move(tasks_.front());
                tasks_.pop_front();
            }
            task();
        }
    }

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;
    std::atomic<std::size_t> pending_{0};
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::atomic<bool> stop_{false};
};

} // namespace kestrel::core
