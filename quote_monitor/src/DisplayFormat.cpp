#include "DisplayFormat.hpp"
#include <cstdio>

LatencyGrade grade_latency(double latency_ms) {
    if (latency_ms < 100.0) return LatencyGrade::Fast;
    if (latency_ms < 200.0) return LatencyGrade::Normal;
    return LatencyGrade::Slow;
}

const char* latency_grade_label(LatencyGrade g) {
    switch (g) {
        case LatencyGrade::Fast:   return "fast";
        case LatencyGrade::Normal: return "normal";
        case LatencyGrade::Slow:
        default:                   return "slow";
    }
}

ActivityTier activity_by_count(std::uint64_t update_count) {
    if (update_count > 50) return ActivityTier::Hot;
    if (update_count > 20) return ActivityTier::Active;
    if (update_count > 5)  return ActivityTier::Normal;
    return ActivityTier::Quiet;
}

ActivityTier activity_by_rate(double updates_per_sec) {
    if (updates_per_sec > 2.0) return ActivityTier::Hot;
    if (updates_per_sec > 1.0) return ActivityTier::Active;
    if (updates_per_sec > 0.5) return ActivityTier::Normal;
    return ActivityTier::Quiet;
}

const char* activity_label(ActivityTier t) {
    switch (t) {
        case ActivityTier::Hot:    return "hot";
        case ActivityTier::Active: return "active";
        case ActivityTier::Normal: return "normal";
        case ActivityTier::Quiet:
        default:                   return "quiet";
    }
}

std::string format_clock(Instant t) {
    std::int64_t us = to_epoch_us(t);
    std::int64_t day_us = us % (86400LL * 1000000LL);
    if (day_us < 0) day_us += 86400LL * 1000000LL;

    const int ms  = static_cast<int>((day_us / 1000) % 1000);
    const int sec = static_cast<int>((day_us / 1000000) % 60);
    const int min = static_cast<int>((day_us / 60000000) % 60);
    const int hr  = static_cast<int>(day_us / 3600000000LL);

    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03d", hr, min, sec, ms);
    return buf;
}

std::string format_price(const std::optional<double>& px, int precision) {
    if (!px) return "N/A";
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", precision, *px);
    return buf;
}
