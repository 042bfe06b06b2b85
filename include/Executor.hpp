#pragma once
#include <chrono>
#include <cstddef>
#include <memory>
#include <stdexcept>

// Thrown synchronously when an executor refuses new work.
class RejectedSubmission : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Unit of work queued on an Executor.
class Runnable
{
public:
    virtual ~Runnable() = default;

    // Executes the work; must capture its own failures.
    virtual void run() = 0;
    // True when the work was cancelled before it started and must be skipped.
    virtual bool cancelled() const = 0;
    // Called when the executor discards the work without running it.
    virtual void abandon() = 0;
};

// Worker pool abstraction AsyncScaler submits to; callers may plug in their own.
class Executor
{
public:
    virtual ~Executor() = default;

    // Queues a task; throws RejectedSubmission if it cannot be accepted.
    virtual void execute(std::shared_ptr<Runnable> task) = 0;

    // Stops accepting work, lets queued work drain.
    virtual void shutdown() = 0;
    // Stops accepting work, abandons queued work and returns how much was dropped.
    virtual std::size_t shutdownNow() = 0;

    virtual bool isShutdown() const = 0;
    // True once shut down and every worker has exited.
    virtual bool isTerminated() const = 0;
    // Blocks until terminated or the timeout expires; returns isTerminated().
    virtual bool awaitTermination(std::chrono::milliseconds timeout) = 0;
};
