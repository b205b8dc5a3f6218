#pragma once
#include "InstrumentStateStore.hpp"
#include "LatencyAggregator.hpp"
#include "QuoteTypes.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>

/* ================= Result of one event ================= */

enum class IngestStatus {
    Accepted,
    Dropped
};

struct IngestResult {
    IngestStatus status = IngestStatus::Accepted;
    std::string reason;   // set when dropped: "empty-symbol", "no-book-data"

    bool accepted() const { return status == IngestStatus::Accepted; }

    static IngestResult accept() { return {IngestStatus::Accepted, {}}; }
    static IngestResult drop(std::string why) { return {IngestStatus::Dropped, std::move(why)}; }
};

inline constexpr const char* kDropEmptySymbol = "empty-symbol";
inline constexpr const char* kDropNoBookData  = "no-book-data";

struct IngestCounters {
    std::uint64_t accepted             = 0;
    std::uint64_t dropped_empty_symbol = 0;
    std::uint64_t dropped_no_book_data = 0;
    std::uint64_t discarded_levels     = 0;  // non-finite price/volume
    std::uint64_t missing_timestamp    = 0;
    std::uint64_t invalid_timestamp    = 0;
    std::uint64_t latency_rejected     = 0;  // outside the sample band

    std::uint64_t dropped() const { return dropped_empty_symbol + dropped_no_book_data; }
};

// Latency samples outside [min, max] still reach the instrument state,
// but are kept out of the LatencyAggregator window.
struct IngestLimits {
    double latency_sample_min_ms = -1000.0;
    double latency_sample_max_ms = 2000.0;
};

/* ================= EventIngest ================= */

// Single producer: the transport delivers one UpdateEvent at a time.
// Never blocks on rendering or I/O.
class EventIngest {
public:
    EventIngest(InstrumentStateStore& store,
                LatencyAggregator& latency,
                IngestLimits limits = {});

    IngestResult on_event(UpdateEvent ev);

    IngestCounters counters() const;
    void reset_counters();

    const IngestLimits& limits() const { return limits_; }

    // Called after every accepted event (RenderScheduler burst counter)
    std::function<void()> on_accepted;

private:
    bool sanitize_level(std::optional<BookLevel>& lvl);

private:
    InstrumentStateStore& store_;
    LatencyAggregator&    latency_;
    IngestLimits          limits_;

    std::atomic<std::uint64_t> accepted_{0};
    std::atomic<std::uint64_t> dropped_empty_symbol_{0};
    std::atomic<std::uint64_t> dropped_no_book_data_{0};
    std::atomic<std::uint64_t> discarded_levels_{0};
    std::atomic<std::uint64_t> missing_timestamp_{0};
    std::atomic<std::uint64_t> invalid_timestamp_{0};
    std::atomic<std::uint64_t> latency_rejected_{0};
};
