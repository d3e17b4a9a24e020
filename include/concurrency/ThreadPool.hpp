#pragma once

#include "Task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace mds::concurrency {

// Fixed-size worker pool. stop() discards queued tasks and joins the workers.
class ThreadPool {
public:
    static constexpr unsigned int MAX_WORKERS = 8;

    explicit ThreadPool(unsigned int nThreads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void stop();

    void submit(std::shared_ptr<Task> task);


    // Clamp a configured worker count into [1, MAX_WORKERS]
    [[nodiscard]] static unsigned int clampWorkers(unsigned int requested);

private:
    void spawnWorker();

    std::vector<std::thread> threads_;

    std::condition_variable cv;
    std::mutex mutex;
    std::queue<std::shared_ptr<Task>> queue;

    std::atomic<bool> stopFlag{false};
};

}
