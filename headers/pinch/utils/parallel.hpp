//
// Created by gregorian-rayne on 2/5/26.
//

#ifndef PINCH_PARALLEL_HPP
#define PINCH_PARALLEL_HPP

/**
 * @file parallel.hpp
 * @brief Fixed-size worker pool used to run package resolutions side by side.
 */

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace pinch::parallel {

    /**
     * Workers pull tasks in submission order. The destructor finishes
     * every queued task before joining.
     */
    class ThreadPool {
    public:
        /**
         * @param workers Thread count; 0 means one per hardware thread.
         */
        explicit ThreadPool(unsigned int workers = 0) {
            if (workers == 0) {
                workers = std::max(1u, std::thread::hardware_concurrency());
            }
            threads_.reserve(workers);
            for (unsigned int i = 0; i < workers; ++i) {
                threads_.emplace_back(&ThreadPool::drain, this);
            }
        }

        ~ThreadPool() {
            {
                std::lock_guard lock(mutex_);
                closed_ = true;
            }
            wake_.notify_all();
            for (auto& thread : threads_) {
                thread.join();
            }
        }

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * Queues f. Exceptions thrown by f surface from future::get().
         */
        template<typename F>
        auto submit(F&& f) -> std::future<std::invoke_result_t<F>> {
            using R = std::invoke_result_t<F>;
            auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
            auto future = task->get_future();
            {
                std::lock_guard lock(mutex_);
                if (closed_) {
                    throw std::runtime_error("ThreadPool is shutting down");
                }
                queue_.emplace_back([task] { (*task)(); });
            }
            wake_.notify_one();
            return future;
        }

        [[nodiscard]] std::size_t size() const noexcept { return threads_.size(); }

    private:
        void drain() {
            for (;;) {
                std::function<void()> next;
                {
                    std::unique_lock lock(mutex_);
                    wake_.wait(lock, [this] { return closed_ || !queue_.empty(); });
                    if (queue_.empty()) {
                        return;
                    }
                    next = std::move(queue_.front());
                    queue_.pop_front();
                }
                next();
            }
        }

        std::vector<std::thread> threads_;
        std::deque<std::function<void()>> queue_;
        std::mutex mutex_;
        std::condition_variable wake_;
        bool closed_ = false;
    };

    /**
     * Applies f to every item on pool and returns the results in input
     * order. Blocks until all are done.
     */
    template<typename T, typename F>
    auto map(const std::vector<T>& items, F&& f, ThreadPool& pool)
        -> std::vector<std::invoke_result_t<F, const T&>> {
        using R = std::invoke_result_t<F, const T&>;

        std::vector<std::future<R>> pending;
        pending.reserve(items.size());
        for (const auto& item : items) {
            pending.push_back(pool.submit([&f, &item] { return f(item); }));
        }

        std::vector<R> results;
        results.reserve(pending.size());
        for (auto& future : pending) {
            results.push_back(future.get());
        }
        return results;
    }

}  // namespace pinch::parallel

#endif //PINCH_PARALLEL_HPP
