#pragma once
#include "QuoteTypes.hpp"
#include <cstdint>
#include <optional>
#include <string>

enum class LatencyGrade {
    Fast,     // < 100 ms
    Normal,   // < 200 ms
    Slow
};

enum class ActivityTier {
    Hot,
    Active,
    Normal,
    Quiet
};

LatencyGrade grade_latency(double latency_ms);
const char* latency_grade_label(LatencyGrade g);

// Live table: by update count (> 50, > 20, > 5)
ActivityTier activity_by_count(std::uint64_t update_count);
// Session report: by updates per second (> 2, > 1, > 0.5)
ActivityTier activity_by_rate(double updates_per_sec);
const char* activity_label(ActivityTier t);

// "HH:MM:SS.mmm" (UTC)
std::string format_clock(Instant t);

// "101.50" or "N/A"
std::string format_price(const std::optional<double>& px, int precision = 2);
