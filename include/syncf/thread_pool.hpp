#pragma once
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace syncf {

class ThreadPool {
public:
    // n == 0 picks std::thread::hardware_concurrency().
    explicit ThreadPool(unsigned n);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void submit(std::function<void()> fn);
    // Blocks until the queue is drained and no job is running.
    void wait_idle();

    std::size_t size() const { return workers_.size(); }

private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> q_;
    std::mutex m_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::size_t running_{0};
    bool stop_{false};
};

} // namespace syncf
