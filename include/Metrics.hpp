#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

#include <nlohmann/json.hpp>

// Fixed-bucket histogram of datagram sizes in bytes.
class Histogram
{
public:
    Histogram()
    {
        // Bucket upper bounds in bytes.
        bounds_ = {64, 128, 256, 512, 1024, 1200, 1500, 4096, 9000, 16384, 65537};
        counts_.assign(bounds_.size() + 1, 0);
    }

    // Adds one observation.
    void observe(std::size_t bytes)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t idx = 0;
        while (idx < bounds_.size() && bytes > bounds_[idx])
        {
            ++idx;
        }
        ++counts_[idx];
    }

    struct Snapshot
    {
        std::uint64_t count = 0;
        std::size_t p50 = 0;
        std::size_t p95 = 0;
        std::size_t p99 = 0;
    };

    // Returns a snapshot with count and bucket-bound percentile estimates.
    Snapshot snapshot() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Snapshot snap;
        for (auto c : counts_)
            snap.count += c;

        snap.p50 = percentile(snap.count, 50);
        snap.p95 = percentile(snap.count, 95);
        snap.p99 = percentile(snap.count, 99);
        return snap;
    }

private:
    std::size_t percentile(std::uint64_t total, int pct) const
    {
        if (total == 0)
            return 0;

        std::uint64_t target = (total * pct + 99) / 100; // Round up to the next count.
        std::uint64_t cumulative = 0;
        for (std::size_t i = 0; i < counts_.size(); ++i)
        {
            cumulative += counts_[i];
            if (cumulative >= target)
                return (i < bounds_.size()) ? bounds_[i] : bounds_.back();
        }
        return bounds_.back();
    }

    std::vector<std::size_t> bounds_;
    std::vector<std::uint64_t> counts_;
    mutable std::mutex mutex_;
};

// Counters for one chunking or dechunking session; safe to share across threads.
class ChunkMetrics
{
public:
    void on_message(std::size_t payload_bytes)
    {
        messages_.fetch_add(1, std::memory_order_relaxed);
        payload_bytes_.fetch_add(payload_bytes, std::memory_order_relaxed);
    }

    void on_datagram(std::size_t wire_bytes)
    {
        datagrams_.fetch_add(1, std::memory_order_relaxed);
        wire_bytes_.fetch_add(wire_bytes, std::memory_order_relaxed);
        sizes_.observe(wire_bytes);
    }

    void on_error() { errors_.fetch_add(1, std::memory_order_relaxed); }

    std::uint64_t messages() const { return messages_.load(std::memory_order_relaxed); }
    std::uint64_t datagrams() const { return datagrams_.load(std::memory_order_relaxed); }
    std::uint64_t payload_bytes() const { return payload_bytes_.load(std::memory_order_relaxed); }
    std::uint64_t wire_bytes() const { return wire_bytes_.load(std::memory_order_relaxed); }
    std::uint64_t errors() const { return errors_.load(std::memory_order_relaxed); }

    // Average datagram fill against the configured maximum, 0 when nothing was sent.
    double fill_ratio(std::size_t max_datagram_size) const
    {
        std::uint64_t count = datagrams();
        if (count == 0 || max_datagram_size == 0)
            return 0.0;
        return static_cast<double>(wire_bytes()) / (static_cast<double>(count) * max_datagram_size);
    }

    nlohmann::json snapshot(std::size_t max_datagram_size) const
    {
        auto sizes = sizes_.snapshot();
        nlohmann::json root;
        root["messages"] = messages();
        root["datagrams"] = datagrams();
        root["payload_bytes"] = payload_bytes();
        root["wire_bytes"] = wire_bytes();
        root["errors"] = errors();
        root["fill_ratio"] = fill_ratio(max_datagram_size);
        root["datagram_bytes"] = {{"p50", sizes.p50}, {"p95", sizes.p95}, {"p99", sizes.p99}};
        return root;
    }

private:
    std::atomic<std::uint64_t> messages_{0};
    std::atomic<std::uint64_t> datagrams_{0};
    std::atomic<std::uint64_t> payload_bytes_{0};
    std::atomic<std::uint64_t> wire_bytes_{0};
    std::atomic<std::uint64_t> errors_{0};
    Histogram sizes_;
};
