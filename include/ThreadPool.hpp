#pragma once
#include <vector>
#include <thread>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <condition_variable>

#include "Executor.hpp"

// Fixed-size worker pool with a FIFO admission queue.
class ThreadPool : public Executor
{
public:
    enum class State
    {
        Active,
        ShuttingDown,
        Terminated
    };

    // queueCapacity == 0 means the queue is unbounded.
    explicit ThreadPool(std::size_t threadCount, std::size_t queueCapacity = 0);
    ~ThreadPool() override;

    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;

    // Enqueues a task for execution; returns immediately.
    void execute(std::shared_ptr<Runnable> task) override;
    // Enqueues a plain callable; same admission rules as execute().
    void post(std::function<void()> task);
    // Blocks until all queued tasks are finished.
    void wait();

    void shutdown() override;
    std::size_t shutdownNow() override;
    bool isShutdown() const override;
    bool isTerminated() const override;
    bool awaitTermination(std::chrono::milliseconds timeout) override;

    // Drops cancelled tasks still sitting in the queue; returns how many went.
    std::size_t purge();

    State state() const;
    std::size_t threadCount() const { return workers_.size(); }
    std::size_t queueCapacity() const { return capacity_; }
    std::size_t pendingCount() const;
    std::size_t activeCount() const;

private:
    void workerLoop();
    std::size_t purgeLocked();

    std::vector<std::thread> workers_;
    std::deque<std::shared_ptr<Runnable>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable done_cv_;
    State state_ = State::Active;
    std::size_t active_ = 0;
    std::size_t live_workers_ = 0;
    const std::size_t capacity_;
};
