#pragma once

// ============================================================
// thread_pool.hpp -- Fixed-size FIFO worker pool
//
// Each worker is one concurrency slot: at most size() jobs run at
// once, queued jobs are dispatched strictly in submission order.
// ============================================================

#include <vector>
#include <thread>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <type_traits>

class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads) : stop_(false) {
        if (num_threads == 0) num_threads = 1;
        workers_.reserve(num_threads);
        for (size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    }

    // Drains the queue: every submitted job runs before the workers exit
    ~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        for (auto& w : workers_) {
            if (w.joinable()) w.join();
        }
    }

    // Enqueue a callable and return a future for its result.
    // Exceptions thrown by the callable surface through the future.
    template<typename F>
    auto submit(F&& f) -> std::future<typename std::invoke_result<F>::type> {
        using RetType = typename std::invoke_result<F>::type;

        auto task = std::make_shared<std::packaged_task<RetType()>>(std::forward<F>(f));
        std::future<RetType> res = task->get_future();
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (stop_) throw std::runtime_error("ThreadPool is stopped");
            tasks_.emplace_back([task]() { (*task)(); });
        }
        cv_.notify_one();
        return res;
    }

    // Block until the queue is empty and no job is running
    void wait_idle() {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_cv_.wait(lock, [this] { return tasks_.empty() && busy_ == 0; });
    }

    size_t size() const { return workers_.size(); }

    size_t busy() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return busy_;
    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.size();
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

private:
    void worker_loop() {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                if (stop_ && tasks_.empty()) return;
                task = std::move(tasks_.front());
                tasks_.pop_front();
                ++busy_;
            }
            task();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                --busy_;
                if (tasks_.empty() && busy_ == 0) idle_cv_.notify_all();
            }
        }
    }

    std::vector<std::thread>          workers_;
    std::deque<std::function<void()>> tasks_;
    mutable std::mutex                mutex_;
    std::condition_variable           cv_;
    std::condition_variable           idle_cv_;
    size_t                            busy_{0};
    bool                              stop_;
};
