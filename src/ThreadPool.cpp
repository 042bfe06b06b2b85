#include "ThreadPool.hpp"
#include "Logging.hpp"

namespace
{
    // Adapts a plain callable to the Runnable interface.
    class FunctionTask : public Runnable
    {
    public:
        explicit FunctionTask(std::function<void()> fn) : fn_(std::move(fn)) {}

        void run() override { fn_(); }
        bool cancelled() const override { return false; }
        void abandon() override {}

    private:
        std::function<void()> fn_;
    };
}

ThreadPool::ThreadPool(std::size_t threadCount, std::size_t queueCapacity)
    : capacity_(queueCapacity)
{
    if (threadCount == 0)
        threadCount = 1;

    live_workers_ = threadCount;
    for (std::size_t i = 0; i < threadCount; ++i)
    {
        workers_.emplace_back([this]()
                              { workerLoop(); });
    }
}

ThreadPool::~ThreadPool()
{
    // Stop accepting new tasks and let workers drain the queue.
    shutdown();

    for (auto &t : workers_)
    {
        if (t.joinable())
            t.join();
    }
}

void ThreadPool::execute(std::shared_ptr<Runnable> task)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (state_ != State::Active)
            throw RejectedSubmission("thread pool is shut down");

        if (capacity_ > 0 && tasks_.size() >= capacity_)
        {
            // Cancelled entries still hold queue slots until purged.
            purgeLocked();
            if (tasks_.size() >= capacity_)
                throw RejectedSubmission("thread pool queue is full (capacity " + std::to_string(capacity_) + ")");
        }

        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void ThreadPool::post(std::function<void()> task)
{
    execute(std::make_shared<FunctionTask>(std::move(task)));
}

void ThreadPool::wait()
{
    std::unique_lock<std::mutex> lock(mutex_);
    done_cv_.wait(lock, [this]()
                  { return tasks_.empty() && active_ == 0; });
}

void ThreadPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::Active)
            state_ = State::ShuttingDown;
    }
    cv_.notify_all();
}

std::size_t ThreadPool::shutdownNow()
{
    std::deque<std::shared_ptr<Runnable>> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::Active)
            state_ = State::ShuttingDown;
        dropped.swap(tasks_);
    }
    cv_.notify_all();
    done_cv_.notify_all();

    // Abandon outside the lock; handles wake their own waiters.
    for (auto &task : dropped)
        task->abandon();
    return dropped.size();
}

bool ThreadPool::isShutdown() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ != State::Active;
}

bool ThreadPool::isTerminated() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == State::Terminated;
}

bool ThreadPool::awaitTermination(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    return done_cv_.wait_for(lock, timeout, [this]()
                             { return state_ == State::Terminated; });
}

std::size_t ThreadPool::purge()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return purgeLocked();
}

std::size_t ThreadPool::purgeLocked()
{
    std::size_t before = tasks_.size();
    for (auto it = tasks_.begin(); it != tasks_.end();)
    {
        if ((*it)->cancelled())
            it = tasks_.erase(it);
        else
            ++it;
    }
    return before - tasks_.size();
}

ThreadPool::State ThreadPool::state() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::size_t ThreadPool::pendingCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

std::size_t ThreadPool::activeCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

void ThreadPool::workerLoop()
{
    while (true)
    {
        std::shared_ptr<Runnable> task;

        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]()
                     { return state_ != State::Active || !tasks_.empty(); });

            if (tasks_.empty())
            {
                // Shutting down with nothing left; the last worker out flips the state.
                if (--live_workers_ == 0)
                {
                    state_ = State::Terminated;
                    done_cv_.notify_all();
                }
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop_front();
            ++active_;
        }

        if (!task->cancelled())
        {
            try
            {
                task->run();
            }
            catch (const std::exception &e)
            {
                Logger::log_event(LogLevel::Error, "task_error", "Task escaped with an exception", {{"error", e.what()}});
            }
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_;
            if (tasks_.empty() && active_ == 0)
                done_cv_.notify_all();
        }
    }
}
