#include "ScaleTask.hpp"
#include "Logging.hpp"

#include <string>

const char *to_string(TaskStatus status)
{
    switch (status)
    {
    case TaskStatus::Pending:
        return "pending";
    case TaskStatus::Running:
        return "running";
    case TaskStatus::Succeeded:
        return "succeeded";
    case TaskStatus::Failed:
        return "failed";
    case TaskStatus::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

ScaleTask::ScaleTask(std::uint64_t id, std::shared_ptr<const Scaler> scaler, ImagePtr src, ScaleOptions options,
                     std::shared_ptr<Metrics> metrics)
    : id_(id),
      scaler_(std::move(scaler)),
      src_(std::move(src)),
      options_(std::move(options)),
      metrics_(std::move(metrics)),
      created_(std::chrono::steady_clock::now())
{
}

void ScaleTask::run()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ != TaskStatus::Pending)
            return;
        status_ = TaskStatus::Running;
    }

    auto started = std::chrono::steady_clock::now();
    if (metrics_)
        metrics_->observe_queue_wait(std::chrono::duration_cast<std::chrono::microseconds>(started - created_));

    ImagePtr result;
    std::exception_ptr error;
    std::string failure;
    try
    {
        result = scaler_->scale(src_, options_);
        if (!result)
        {
            failure = "scaler returned no image";
            error = std::make_exception_ptr(std::runtime_error(failure));
        }
    }
    catch (const std::exception &e)
    {
        error = std::current_exception();
        failure = e.what();
    }
    catch (...)
    {
        // Stored as-is and rethrown from get().
        error = std::current_exception();
        failure = "Scaler threw a non-standard exception";
    }

    if (metrics_)
    {
        metrics_->observe_run_time(std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started));
        if (error)
            metrics_->inc_failed();
        else
            metrics_->inc_completed();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        src_.reset();
        result_ = std::move(result);
        error_ = error;
        status_ = error ? TaskStatus::Failed : TaskStatus::Succeeded;
    }
    cv_.notify_all();

    if (error)
        Logger::log_event(LogLevel::Warn, "scale_failed", failure, {{"task_id", id_}, {"options", options_.to_json()}});
}

bool ScaleTask::cancelled() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return status_ == TaskStatus::Cancelled;
}

void ScaleTask::abandon()
{
    transitionToCancelled("Task dropped by executor shutdown");
}

bool ScaleTask::cancel()
{
    return transitionToCancelled("Task cancelled before start");
}

bool ScaleTask::transitionToCancelled(const char *reason)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ != TaskStatus::Pending)
            return false;
        status_ = TaskStatus::Cancelled;
        src_.reset();
    }
    cv_.notify_all();

    if (metrics_)
        metrics_->inc_cancelled();
    Logger::log_event(LogLevel::Debug, "task_cancelled", reason, {{"task_id", id_}});
    return true;
}

TaskStatus ScaleTask::status() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

bool ScaleTask::done() const
{
    TaskStatus s = status();
    return s != TaskStatus::Pending && s != TaskStatus::Running;
}

void ScaleTask::wait() const
{
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]()
             { return status_ != TaskStatus::Pending && status_ != TaskStatus::Running; });
}

bool ScaleTask::waitFor(std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]()
                        { return status_ != TaskStatus::Pending && status_ != TaskStatus::Running; });
}

ImagePtr ScaleTask::get() const
{
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]()
             { return status_ != TaskStatus::Pending && status_ != TaskStatus::Running; });
    return resultLocked();
}

ImagePtr ScaleTask::resultLocked() const
{
    if (status_ == TaskStatus::Cancelled)
        throw TaskCancelled("scale task " + std::to_string(id_) + " was cancelled");
    if (status_ == TaskStatus::Failed)
        std::rethrow_exception(error_);
    return result_;
}
