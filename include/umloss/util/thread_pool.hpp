#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace umloss {
namespace util {

inline uint32_t resolve_num_threads(uint32_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::max(1u, std::thread::hardware_concurrency());
    }
    return num_threads;
}

// Persistent worker pool; unlike boost::asio::thread_pool it can be joined
// repeatedly, which Prim's per-step relaxation needs.
class ThreadPool {
private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::condition_variable finished_;
    bool stop_ = false;
    size_t active_workers_ = 0;

public:
    explicit ThreadPool(size_t num_threads) {
        for (size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this] {
                while (true) {
                    std::function<void()> task;
                    {
                        std::unique_lock<std::mutex> lock(queue_mutex_);
                        condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

                        if (stop_ && tasks_.empty()) {
                            return;
                        }

                        task = std::move(tasks_.front());
                        tasks_.pop();
                        ++active_workers_;
                    }
                    task();
                    {
                        std::unique_lock<std::mutex> lock(queue_mutex_);
                        --active_workers_;
                        if (tasks_.empty() && active_workers_ == 0) {
                            finished_.notify_all();
                        }
                    }
                }
            });
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    ~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            stop_ = true;
        }
        condition_.notify_all();

        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    size_t size() const {
        return workers_.size();
    }

    template<typename F>
    void post(F&& f) {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (stop_) {
                return;
            }
            tasks_.emplace(std::forward<F>(f));
        }
        condition_.notify_one();
    }

    void join() {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        finished_.wait(lock, [this] { return tasks_.empty() && active_workers_ == 0; });
    }

    // Split [0, count) into one chunk per worker, run fn(chunk, begin, end)
    // on each and wait for all of them.
    template<typename F>
    void run_chunks(uint32_t count, F&& fn) {
        const uint32_t num_chunks = static_cast<uint32_t>(std::max<size_t>(1, workers_.size()));
        const uint32_t chunk_size = std::max(1u, (count + num_chunks - 1) / num_chunks);
        uint32_t chunk = 0;
        for (uint32_t begin = 0; begin < count; begin += chunk_size, ++chunk) {
            uint32_t end = std::min(begin + chunk_size, count);
            post([&fn, chunk, begin, end]() { fn(chunk, begin, end); });
        }
        join();
    }
};

} // namespace util
} // namespace umloss
