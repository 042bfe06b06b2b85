#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <vector>

#include <nlohmann/json.hpp>

// Fixed-bucket latency histogram in microseconds.
class Histogram
{
public:
    Histogram()
    {
        // Bucket boundaries in microseconds; scale jobs run from sub-ms thumbnails to multi-second originals.
        bounds_ = {1000, 5000, 10000, 50000, 100000, 500000, 1000000, 2000000, 5000000, 10000000};
        counts_.assign(bounds_.size() + 1, 0);
    }

    // Adds a latency observation in microseconds.
    void observe(std::int64_t micros)
    {
        if (micros < 0)
            micros = 0;
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t idx = 0;
        while (idx < bounds_.size() && micros > bounds_[idx])
        {
            ++idx;
        }
        ++counts_[idx];
    }

    struct Snapshot
    {
        std::uint64_t count = 0;
        double p50_ms = 0;
        double p95_ms = 0;
        double p99_ms = 0;
    };

    // Returns a snapshot with count and percentile estimates.
    Snapshot snapshot() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Snapshot snap;
        for (auto c : counts_)
            snap.count += c;

        snap.p50_ms = percentile(50);
        snap.p95_ms = percentile(95);
        snap.p99_ms = percentile(99);
        return snap;
    }

private:
    double percentile(int pct) const
    {
        std::uint64_t total = 0;
        for (auto c : counts_)
            total += c;
        if (total == 0)
            return 0.0;

        std::uint64_t target = (total * pct + 99) / 100; // Round up to the next count.
        std::uint64_t cumulative = 0;
        for (std::size_t i = 0; i < counts_.size(); ++i)
        {
            cumulative += counts_[i];
            if (cumulative >= target)
            {
                std::int64_t upper = (i < bounds_.size()) ? bounds_[i] : bounds_.back();
                return static_cast<double>(upper) / 1000.0; // Convert micros to ms.
            }
        }
        return static_cast<double>(bounds_.back()) / 1000.0;
    }

    std::vector<std::int64_t> bounds_;
    std::vector<std::uint64_t> counts_;
    mutable std::mutex mutex_;
};

// Counters and latency histograms for scale task traffic.
class Metrics
{
public:
    void inc_submitted() { submitted_.fetch_add(1, std::memory_order_relaxed); }
    void inc_completed() { completed_.fetch_add(1, std::memory_order_relaxed); }
    void inc_failed() { failed_.fetch_add(1, std::memory_order_relaxed); }
    void inc_cancelled() { cancelled_.fetch_add(1, std::memory_order_relaxed); }
    void inc_rejected() { rejected_.fetch_add(1, std::memory_order_relaxed); }
    void inc_pools_created() { pools_created_.fetch_add(1, std::memory_order_relaxed); }

    // Time between admission and a worker picking the task up.
    void observe_queue_wait(std::chrono::microseconds duration) { queue_wait_.observe(duration.count()); }
    // Time spent inside the scaling routine.
    void observe_run_time(std::chrono::microseconds duration) { run_time_.observe(duration.count()); }

    std::uint64_t submitted() const { return submitted_.load(std::memory_order_relaxed); }
    std::uint64_t completed() const { return completed_.load(std::memory_order_relaxed); }
    std::uint64_t failed() const { return failed_.load(std::memory_order_relaxed); }
    std::uint64_t cancelled() const { return cancelled_.load(std::memory_order_relaxed); }
    std::uint64_t rejected() const { return rejected_.load(std::memory_order_relaxed); }
    std::uint64_t pools_created() const { return pools_created_.load(std::memory_order_relaxed); }

    // Produces a JSON snapshot of all counters and histograms.
    nlohmann::json snapshot() const
    {
        nlohmann::json root;
        root["submitted"] = submitted();
        root["completed"] = completed();
        root["failed"] = failed();
        root["cancelled"] = cancelled();
        root["rejected"] = rejected();
        root["pools_created"] = pools_created();
        root["queue_wait"] = to_json(queue_wait_.snapshot());
        root["run_time"] = to_json(run_time_.snapshot());
        return root;
    }

private:
    static nlohmann::json to_json(const Histogram::Snapshot &snap)
    {
        return {{"count", snap.count}, {"p50_ms", snap.p50_ms}, {"p95_ms", snap.p95_ms}, {"p99_ms", snap.p99_ms}};
    }

    std::atomic<std::uint64_t> submitted_{0};
    std::atomic<std::uint64_t> completed_{0};
    std::atomic<std::uint64_t> failed_{0};
    std::atomic<std::uint64_t> cancelled_{0};
    std::atomic<std::uint64_t> rejected_{0};
    std::atomic<std::uint64_t> pools_created_{0};

    Histogram queue_wait_;
    Histogram run_time_;
};
