#pragma once
#include <chrono>
#include <memory>
#include <stdexcept>

#include "ScaleTask.hpp"

// Thrown by ScaleFuture::getFor() when the outcome is not ready in time.
class TaskTimeout : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Caller-side handle to one submitted ScaleTask. Cheap to copy; copies share the task.
class ScaleFuture
{
public:
    ScaleFuture() = default;
    explicit ScaleFuture(std::shared_ptr<ScaleTask> task) : task_(std::move(task)) {}

    bool valid() const { return static_cast<bool>(task_); }

    TaskStatus status() const;
    // True once succeeded, failed or cancelled.
    bool ready() const;
    bool isCancelled() const;

    void wait() const;
    // Returns false on timeout; the handle stays pending and may be waited on again.
    bool waitFor(std::chrono::milliseconds timeout) const;

    ImagePtr get() const;
    // Like get(), but throws TaskTimeout instead of blocking past the timeout.
    ImagePtr getFor(std::chrono::milliseconds timeout) const;

    // Returns false if the task already started or finished; a computed result is never discarded.
    bool cancel();

    std::uint64_t id() const;

private:
    ScaleTask &task() const;

    std::shared_ptr<ScaleTask> task_;
};
