#pragma once
#include "QuoteTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

/* ================= Fields applied by one accepted event ================= */

struct StateUpdate {
    std::optional<BookLevel> bid;     // absent side keeps its last known value
    std::optional<BookLevel> ask;
    std::optional<double> last;

    // Both set together; absent when the timestamp was missing or invalid
    std::optional<Instant> exchange_instant;
    std::optional<double> latency_ms;

    Instant receive_instant{};
};

/* ================= InstrumentStateStore ================= */

// Keyed per-symbol state. apply() is the only mutation entry point;
// apply() and snapshot() share one mutex so readers never see a
// partially updated InstrumentState.
class InstrumentStateStore {
public:
    InstrumentStateStore() = default;

    InstrumentStateStore(const InstrumentStateStore&) = delete;
    InstrumentStateStore& operator=(const InstrumentStateStore&) = delete;

    // Create-or-update; returns a copy of the post-update state
    InstrumentState apply(const std::string& symbol, const StateUpdate& u);

    // Deep copy, sorted by symbol
    std::map<std::string, InstrumentState> snapshot() const;

    std::optional<InstrumentState> find(const std::string& symbol) const;

    std::size_t size() const;
    std::uint64_t total_updates() const;

    // Unsubscribe-all: drop every symbol
    void reset();

private:
    mutable std::mutex state_mtx_;
    std::unordered_map<std::string, InstrumentState> state_;
};
