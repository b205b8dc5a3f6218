#include "LatencyAggregator.hpp"
#include <algorithm>
#include <iterator>

LatencyAggregator::LatencyAggregator(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity)
{}

void LatencyAggregator::push(LatencySample s) {
    std::lock_guard<std::mutex> lk(mtx_);

    // Evict oldest before retaining the new one
    if (window_.size() >= capacity_) {
        window_.pop_front();
    }
    window_.push_back(s);
    ++total_pushed_;
}

template <typename It>
LatencyStats LatencyAggregator::summarize(It first, It last) {
    LatencyStats out;
    if (first == last)
        return out;

    double sum = 0.0;
    out.min_ms = first->value_ms;
    out.max_ms = first->value_ms;
    for (auto it = first; it != last; ++it) {
        sum += it->value_ms;
        out.min_ms = std::min(out.min_ms, it->value_ms);
        out.max_ms = std::max(out.max_ms, it->value_ms);
        ++out.count;
    }
    out.mean_ms = sum / static_cast<double>(out.count);
    return out;
}

LatencyStats LatencyAggregator::stats() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return summarize(window_.begin(), window_.end());
}

LatencyStats LatencyAggregator::recent_stats(std::size_t k) const {
    std::lock_guard<std::mutex> lk(mtx_);
    const std::size_t n = std::min(k, window_.size());
    auto first = window_.end();
    std::advance(first, -static_cast<std::ptrdiff_t>(n));
    return summarize(first, window_.end());
}

std::vector<LatencySample> LatencyAggregator::samples() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return std::vector<LatencySample>(window_.begin(), window_.end());
}

std::size_t LatencyAggregator::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return window_.size();
}

std::uint64_t LatencyAggregator::total_pushed() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return total_pushed_;
}

void LatencyAggregator::reset() {
    std::lock_guard<std::mutex> lk(mtx_);
    window_.clear();
    total_pushed_ = 0;
}
