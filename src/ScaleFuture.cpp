#include "ScaleFuture.hpp"

#include <string>

ScaleTask &ScaleFuture::task() const
{
    if (!task_)
        throw std::logic_error("ScaleFuture has no associated task");
    return *task_;
}

TaskStatus ScaleFuture::status() const
{
    return task().status();
}

bool ScaleFuture::ready() const
{
    return task().done();
}

bool ScaleFuture::isCancelled() const
{
    return task().status() == TaskStatus::Cancelled;
}

void ScaleFuture::wait() const
{
    task().wait();
}

bool ScaleFuture::waitFor(std::chrono::milliseconds timeout) const
{
    return task().waitFor(timeout);
}

ImagePtr ScaleFuture::get() const
{
    return task().get();
}

ImagePtr ScaleFuture::getFor(std::chrono::milliseconds timeout) const
{
    if (!task().waitFor(timeout))
        throw TaskTimeout("scale task " + std::to_string(task_->id()) + " not ready after " + std::to_string(timeout.count()) + "ms");
    return task_->get();
}

bool ScaleFuture::cancel()
{
    return task().cancel();
}

std::uint64_t ScaleFuture::id() const
{
    return task().id();
}
