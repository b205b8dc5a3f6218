#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

// Wall-clock instant with microsecond resolution.
// Epoch seconds up to 1e12 still fit (1e18 us < INT64_MAX).
using Instant = std::chrono::time_point<std::chrono::system_clock,
                                        std::chrono::microseconds>;

inline Instant now_instant() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now());
}

inline std::int64_t to_epoch_us(Instant t) {
    return t.time_since_epoch().count();
}

inline Instant from_epoch_us(std::int64_t us) {
    return Instant(std::chrono::microseconds(us));
}

/* ================= Book level ================= */

struct BookLevel {
    double price  = 0.0;
    double volume = 0.0;
};

/* ================= Ingest input ================= */

// Exchange timestamp as delivered: integer, floating or text, encoding unknown.
using RawTimestamp = std::variant<std::int64_t, double, std::string>;

struct UpdateEvent {
    std::string symbol;                     // "SiU5", "ETHUSDT"
    std::optional<BookLevel> bid;           // best bid, absent for partial book
    std::optional<BookLevel> ask;           // best ask, absent for partial book
    std::optional<double> last;             // last traded price
    std::optional<RawTimestamp> raw_timestamp;
    std::optional<Instant> receive_instant; // local clock at transport delivery
};

/* ================= Per-symbol state ================= */

enum class Direction {
    FirstObservation,
    Up,
    Down,
    Unchanged
};

struct InstrumentState {
    std::string symbol;

    std::optional<BookLevel> bid;
    std::optional<BookLevel> ask;
    std::optional<double> last;

    // ask - bid, only when both sides are known
    std::optional<double> spread;
    bool crossed = false;    // spread < 0

    std::optional<BookLevel> previous_bid;
    std::optional<BookLevel> previous_ask;
    std::optional<double> previous_last;

    Direction bid_direction  = Direction::FirstObservation;
    Direction ask_direction  = Direction::FirstObservation;
    Direction last_direction = Direction::FirstObservation;

    std::optional<Instant> last_exchange_instant;
    Instant last_receive_instant{};
    std::optional<double> last_latency_ms;

    std::uint64_t update_count = 0;
};

/* ================= Render output ================= */

struct LatencyStats {
    std::size_t count = 0;
    double mean_ms = 0.0;
    double min_ms  = 0.0;
    double max_ms  = 0.0;
};

// Immutable point-in-time view handed to renderers.
// Carried around as shared_ptr<const RenderSnapshot>.
struct RenderSnapshot {
    std::map<std::string, InstrumentState> instruments;  // sorted by symbol

    LatencyStats latency;         // whole window
    LatencyStats recent_latency;  // most recent K samples

    Instant as_of{};
    Instant session_started{};

    std::uint64_t sequence       = 0;
    std::uint64_t total_accepted = 0;
    std::uint64_t total_dropped  = 0;
};
