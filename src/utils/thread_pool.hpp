#ifndef OFFLINE_CACHE_THREAD_POOL_HPP
#define OFFLINE_CACHE_THREAD_POOL_HPP

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace concurrency {
    class ThreadPool {
       public:
        explicit ThreadPool(size_t num_threads);

        ~ThreadPool();
        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;
        ThreadPool(ThreadPool&&) = delete;
        ThreadPool& operator=(ThreadPool&&) = delete;

        void enqueue(std::function<void()> next_task);

        // Exceptions thrown by the task are delivered through the returned future.
        template <typename F>
        std::future<std::invoke_result_t<F>> submit(F&& task) {
            using Result = std::invoke_result_t<F>;
            auto packaged = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(task));
            std::future<Result> result = packaged->get_future();
            enqueue([packaged]() { (*packaged)(); });
            return result;
        }

        void wait_all();
        [[nodiscard]] size_t size() const;

       private:
        std::vector<std::thread> threads_;  // reserve
        std::queue<std::function<void()> > tasks_;
        std::mutex queue_mutex_;
        std::condition_variable condition_variable_;
        std::atomic<bool> stop_ = false;
        std::atomic<size_t> active_tasks_ = 0;
        std::condition_variable completion_cv_;
    };
}  // namespace concurrency

#endif
