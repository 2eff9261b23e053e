#pragma once

#include <vector>
#include <thread>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <queue>
#include <type_traits>

namespace lexicon {

    class ThreadPool {
    public:
        explicit ThreadPool(size_t numThreads = std::thread::hardware_concurrency())
            : stop_(false)
        {
            if (numThreads == 0) {
                numThreads = 1;
            }
            workers_.reserve(numThreads);
            for (size_t i = 0; i < numThreads; ++i) {
                workers_.emplace_back([this] {
                    this->workerLoop();
                });
            }
        }

        ~ThreadPool() {
            stop();
        }

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        // Drains the queue, then joins every worker.
        void stop() {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (stop_) {
                    return;
                }
                stop_ = true;
            }
            cv_.notify_all();
            for (std::thread &worker : workers_) {
                if (worker.joinable()) {
                    worker.join();
                }
            }
        }

        size_t size() const { return workers_.size(); }

        void enqueue(std::function<void()> task) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                tasks_.push(std::move(task));
            }
            cv_.notify_one();
        }

        // Runs `fn` on a worker; exceptions surface through the future.
        template <typename Fn>
        std::future<std::invoke_result_t<Fn>> submit(Fn fn) {
            using Result = std::invoke_result_t<Fn>;
            auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
            std::future<Result> future = task->get_future();
            enqueue([task]() { (*task)(); });
            return future;
        }

    private:
        void workerLoop() {
            while (true) {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(mutex_);
                    cv_.wait(lock, [this] {
                        return stop_ || !tasks_.empty();
                    });

                    if (stop_ && tasks_.empty()) {
                        return;
                    }

                    task = std::move(tasks_.front());
                    tasks_.pop();
                }
                task();
            }
        }

        std::vector<std::thread> workers_;
        std::queue<std::function<void()>> tasks_;
        std::mutex mutex_;
        std::condition_variable cv_;
        bool stop_;
    };
}
