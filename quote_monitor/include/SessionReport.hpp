#pragma once
#include "DisplayFormat.hpp"
#include "QuoteTypes.hpp"
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

struct InstrumentActivity {
    std::string symbol;
    std::uint64_t updates = 0;
    double rate_per_sec = 0.0;
    ActivityTier tier = ActivityTier::Quiet;
    std::optional<double> last_latency_ms;
};

// End-of-session summary printed on shutdown
struct SessionReport {
    double uptime_sec = 0.0;
    std::uint64_t total_updates = 0;
    std::uint64_t total_dropped = 0;
    double updates_per_sec = 0.0;

    LatencyStats latency;
    std::optional<LatencyGrade> latency_grade;   // from the window mean

    std::vector<InstrumentActivity> instruments; // sorted by symbol
};

SessionReport build_session_report(const RenderSnapshot& snap, Instant now);

void print_session_report(std::ostream& out, const SessionReport& r);
