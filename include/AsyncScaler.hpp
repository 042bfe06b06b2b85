#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "Config.hpp"
#include "Executor.hpp"
#include "Metrics.hpp"
#include "ScaleFuture.hpp"
#include "ScaleOptions.hpp"
#include "Scaler.hpp"

// Bounds and orders calls into a synchronous Scaler.
//
// Every submit() runs on a shared fixed-size pool of config.thread_count
// workers, so at most that many scale operations execute at once and the
// rest queue in submission order. The pool is created on first submission.
// If it has been shut down (by shutdown(), shutdownNow() or directly through
// getPool()), the next submission transparently builds a replacement.
//
// Destroying the AsyncScaler drains and joins every pool it created; pools
// installed through setPool() stay the caller's responsibility.
class AsyncScaler
{
public:
    // Throws ConfigError if config is invalid and std::invalid_argument if scaler is null.
    AsyncScaler(std::shared_ptr<const Scaler> scaler, ScalerConfig config = ScalerConfig{});

    AsyncScaler(const AsyncScaler &) = delete;
    AsyncScaler &operator=(const AsyncScaler &) = delete;

    // Queues one scale request and returns immediately.
    // Argument errors surface from ScaleFuture::get(); throws RejectedSubmission if the pool refuses the task.
    ScaleFuture submit(ImagePtr src, ScaleOptions options);

    // Current pool, or null before the first submission.
    std::shared_ptr<Executor> getPool() const;
    // Installs a caller-owned executor; null reverts to lazy creation.
    void setPool(std::shared_ptr<Executor> pool);

    // Drains queued work, then stops the current pool.
    void shutdown();
    // Stops the current pool and cancels everything still queued; returns the number dropped.
    std::size_t shutdownNow();
    // Waits for the current pool to terminate; true if there is no pool.
    bool awaitTermination(std::chrono::milliseconds timeout);

    const ScalerConfig &config() const { return config_; }
    const Metrics &metrics() const { return *metrics_; }

private:
    std::shared_ptr<Executor> ensureUsablePool();
    static bool usable(const std::shared_ptr<Executor> &pool);

    const ScalerConfig config_;
    const std::shared_ptr<const Scaler> scaler_;
    const std::shared_ptr<Metrics> metrics_;

    mutable std::mutex pool_mutex_; // Guards pool_ and retired_.
    std::shared_ptr<Executor> pool_;
    std::vector<std::shared_ptr<Executor>> retired_;

    std::atomic<std::uint64_t> next_task_id_{1};
};
