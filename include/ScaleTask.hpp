#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>

#include "Executor.hpp"
#include "Image.hpp"
#include "Metrics.hpp"
#include "ScaleOptions.hpp"
#include "Scaler.hpp"

enum class TaskStatus
{
    Pending,
    Running,
    Succeeded,
    Failed,
    Cancelled
};

const char *to_string(TaskStatus status);

// Thrown by ScaleFuture::get() when the task was cancelled or abandoned.
class TaskCancelled : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// One deferred call into a Scaler plus the slot its outcome lands in.
class ScaleTask : public Runnable
{
public:
    ScaleTask(std::uint64_t id, std::shared_ptr<const Scaler> scaler, ImagePtr src, ScaleOptions options,
              std::shared_ptr<Metrics> metrics = nullptr);

    void run() override;
    bool cancelled() const override;
    void abandon() override;

    // Succeeds only while the task is still pending.
    bool cancel();

    TaskStatus status() const;
    bool done() const;
    void wait() const;
    bool waitFor(std::chrono::milliseconds timeout) const;
    // Blocks for the outcome; rethrows the scaler's exception or throws TaskCancelled.
    ImagePtr get() const;

    std::uint64_t id() const { return id_; }
    const ScaleOptions &options() const { return options_; }

private:
    bool transitionToCancelled(const char *reason);
    ImagePtr resultLocked() const;

    const std::uint64_t id_;
    const std::shared_ptr<const Scaler> scaler_;
    ImagePtr src_;
    const ScaleOptions options_;
    const std::shared_ptr<Metrics> metrics_;
    const std::chrono::steady_clock::time_point created_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    TaskStatus status_ = TaskStatus::Pending;
    ImagePtr result_;
    std::exception_ptr error_;
};
