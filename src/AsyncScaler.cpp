#include "AsyncScaler.hpp"
#include "Logging.hpp"
#include "ThreadPool.hpp"

#include <algorithm>

namespace
{
    ScalerConfig validated(ScalerConfig config)
    {
        try
        {
            config.validate();
        }
        catch (const ConfigError &e)
        {
            Logger::log_event(LogLevel::Error, "config_error", e.what(), config.to_json());
            throw;
        }
        return config;
    }
}

AsyncScaler::AsyncScaler(std::shared_ptr<const Scaler> scaler, ScalerConfig config)
    : config_(validated(std::move(config))),
      scaler_(std::move(scaler)),
      metrics_(std::make_shared<Metrics>())
{
    if (!scaler_)
        throw std::invalid_argument("AsyncScaler requires a scaler");
}

ScaleFuture AsyncScaler::submit(ImagePtr src, ScaleOptions options)
{
    auto task = std::make_shared<ScaleTask>(next_task_id_.fetch_add(1, std::memory_order_relaxed),
                                            scaler_, std::move(src), std::move(options), metrics_);

    for (int attempt = 1;; ++attempt)
    {
        auto pool = ensureUsablePool();
        try
        {
            pool->execute(task);
            break;
        }
        catch (const RejectedSubmission &e)
        {
            // A shutdown landed between the pool check and the enqueue; the next pass gets a fresh pool.
            if (pool->isShutdown())
                continue;

            metrics_->inc_rejected();
            Logger::log_event(LogLevel::Warn, "submit_rejected", e.what(), {{"task_id", task->id()}, {"attempts", attempt}});
            throw;
        }
    }

    metrics_->inc_submitted();
    return ScaleFuture(task);
}

std::shared_ptr<Executor> AsyncScaler::getPool() const
{
    std::lock_guard<std::mutex> lock(pool_mutex_);
    return pool_;
}

void AsyncScaler::setPool(std::shared_ptr<Executor> pool)
{
    std::lock_guard<std::mutex> lock(pool_mutex_);
    if (pool_ && pool_ != pool)
        retired_.push_back(std::move(pool_));
    pool_ = std::move(pool);
    Logger::log_event(LogLevel::Info, "pool_set", pool_ ? "Custom executor installed" : "Executor reset to lazy creation");
}

void AsyncScaler::shutdown()
{
    auto pool = getPool();
    if (!pool)
        return;
    pool->shutdown();
    Logger::log_event(LogLevel::Info, "pool_shutdown", "Pool draining queued work");
}

std::size_t AsyncScaler::shutdownNow()
{
    auto pool = getPool();
    if (!pool)
        return 0;
    std::size_t dropped = pool->shutdownNow();
    Logger::log_event(LogLevel::Info, "pool_shutdown_now", "Pool stopped, queued work cancelled", {{"dropped", dropped}});
    return dropped;
}

bool AsyncScaler::awaitTermination(std::chrono::milliseconds timeout)
{
    auto pool = getPool();
    if (!pool)
        return true;
    return pool->awaitTermination(timeout);
}

bool AsyncScaler::usable(const std::shared_ptr<Executor> &pool)
{
    return pool && !pool->isShutdown() && !pool->isTerminated();
}

std::shared_ptr<Executor> AsyncScaler::ensureUsablePool()
{
    std::lock_guard<std::mutex> lock(pool_mutex_);
    if (usable(pool_))
        return pool_;

    // The old pool keeps draining on its own; it is joined once terminated or when we are destroyed.
    bool replacing = static_cast<bool>(pool_);
    if (replacing)
        retired_.push_back(std::move(pool_));
    retired_.erase(std::remove_if(retired_.begin(), retired_.end(),
                                  [](const std::shared_ptr<Executor> &p)
                                  { return p->isTerminated(); }),
                   retired_.end());

    pool_ = std::make_shared<ThreadPool>(static_cast<std::size_t>(config_.thread_count),
                                         static_cast<std::size_t>(config_.queue_capacity));
    metrics_->inc_pools_created();

    nlohmann::json extra = config_.to_json();
    extra["pools_created"] = metrics_->pools_created();
    extra["retired_pools"] = retired_.size();
    Logger::log_event(LogLevel::Info, replacing ? "pool_replaced" : "pool_created",
                      replacing ? "Unusable pool replaced" : "Worker pool created", extra);
    return pool_;
}
