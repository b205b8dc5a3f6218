#pragma once

#include "EventIngest.hpp"
#include "IRenderer.hpp"
#include "InstrumentStateStore.hpp"
#include "LatencyAggregator.hpp"
#include "QuoteTypes.hpp"
#include "RenderScheduler.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>

/* ================= Options ================= */

struct AggregatorOptions {
    std::chrono::milliseconds refresh_cadence{1000};
    std::size_t burst_threshold      = 5;
    std::size_t latency_window_size  = 50;
    std::size_t recent_latency_window = 10;
    IngestLimits limits;
};

/* ================= AggregatorContext ================= */

// Owns one monitoring session: state store, latency window, ingest and
// render scheduler, wired together. Constructed by the caller and passed
// where needed; there is no process-wide instance.
class AggregatorContext {
public:
    AggregatorContext(const AggregatorOptions& opts, IRenderer& renderer);
    ~AggregatorContext();

    AggregatorContext(const AggregatorContext&) = delete;
    AggregatorContext& operator=(const AggregatorContext&) = delete;

    // Transport side (single producer)
    IngestResult on_event(UpdateEvent ev);

    void start();
    void stop();

    // Feed gone / unsubscribe-all: clear state, latency window, counters
    void reset();

    std::shared_ptr<const RenderSnapshot> build_snapshot();

    Instant session_started() const { return session_started_; }
    const AggregatorOptions& options() const { return opts_; }

    InstrumentStateStore& store()     { return store_; }
    LatencyAggregator&    latency()   { return latency_; }
    EventIngest&          ingest()    { return ingest_; }
    RenderScheduler&      scheduler() { return scheduler_; }

private:
    AggregatorOptions opts_;

    InstrumentStateStore store_;
    LatencyAggregator    latency_;
    EventIngest          ingest_;

    Instant session_started_;
    std::atomic<std::uint64_t> sequence_{0};

    // Last member: destroyed (and stopped) before the state it reads
    RenderScheduler scheduler_;
};
