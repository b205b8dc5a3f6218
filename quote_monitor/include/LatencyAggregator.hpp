#pragma once
#include "QuoteTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

struct LatencySample {
    double value_ms = 0.0;
    Instant captured_at{};
};

// Fixed-capacity FIFO window of the most recent latency samples.
// push() comes from the ingest thread, stats() from the render path.
class LatencyAggregator {
public:
    explicit LatencyAggregator(std::size_t capacity = 50);

    void push(LatencySample s);

    // Over the whole window
    LatencyStats stats() const;

    // Over the newest k samples of the window
    LatencyStats recent_stats(std::size_t k) const;

    // Oldest first
    std::vector<LatencySample> samples() const;

    std::size_t capacity() const { return capacity_; }
    std::size_t size() const;
    std::uint64_t total_pushed() const;

    void reset();

private:
    template <typename It>
    static LatencyStats summarize(It first, It last);

private:
    std::size_t capacity_;

    mutable std::mutex mtx_;
    std::deque<LatencySample> window_;
    std::uint64_t total_pushed_ = 0;
};
