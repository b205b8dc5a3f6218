#include "EventIngest.hpp"
#include "Log.hpp"
#include "TimestampNormalizer.hpp"
#include <cctype>
#include <cmath>
#include <sstream>

static std::string trim_symbol(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

EventIngest::EventIngest(InstrumentStateStore& store,
                         LatencyAggregator& latency,
                         IngestLimits limits)
    : store_(store), latency_(latency), limits_(limits)
{}

bool EventIngest::sanitize_level(std::optional<BookLevel>& lvl) {
    if (!lvl) return false;
    if (std::isfinite(lvl->price) && std::isfinite(lvl->volume))
        return true;
    lvl.reset();
    ++discarded_levels_;
    return false;
}

IngestResult EventIngest::on_event(UpdateEvent ev) {
    // ---- VALIDATION (no state touched before this passes) ----
    const std::string symbol = trim_symbol(ev.symbol);
    if (symbol.empty()) {
        auto n = ++dropped_empty_symbol_;
        if (should_log_occurrence(n))
            log_warn("EventIngest", "dropped event: empty-symbol (total " + std::to_string(n) + ")");
        return IngestResult::drop(kDropEmptySymbol);
    }

    sanitize_level(ev.bid);
    sanitize_level(ev.ask);
    if (ev.last && !std::isfinite(*ev.last))
        ev.last.reset();

    if (!ev.bid && !ev.ask) {
        auto n = ++dropped_no_book_data_;
        if (should_log_occurrence(n))
            log_warn("EventIngest", "dropped " + symbol + ": no-book-data (total " + std::to_string(n) + ")");
        return IngestResult::drop(kDropNoBookData);
    }

    const Instant received = ev.receive_instant ? *ev.receive_instant : now_instant();

    StateUpdate u;
    u.bid  = ev.bid;
    u.ask  = ev.ask;
    u.last = ev.last;
    u.receive_instant = received;

    // ---- TIMESTAMP + LATENCY ----
    if (!ev.raw_timestamp) {
        ++missing_timestamp_;
    } else if (auto exch = TimestampNormalizer::normalize(*ev.raw_timestamp)) {
        u.exchange_instant = exch;
        u.latency_ms = TimestampNormalizer::latency_ms(received, *exch);
    } else {
        auto n = ++invalid_timestamp_;
        if (should_log_occurrence(n))
            log_warn("EventIngest", "invalid timestamp for " + symbol + " (total " + std::to_string(n) + ")");
    }

    store_.apply(symbol, u);

    if (u.latency_ms) {
        const double l = *u.latency_ms;
        if (l >= limits_.latency_sample_min_ms && l <= limits_.latency_sample_max_ms) {
            latency_.push(LatencySample{l, received});
        } else {
            auto n = ++latency_rejected_;
            if (should_log_occurrence(n)) {
                std::ostringstream oss;
                oss << "latency " << l << "ms for " << symbol
                    << " outside sample band, not recorded (total " << n << ")";
                log_warn("EventIngest", oss.str());
            }
        }
    }

    ++accepted_;
    if (on_accepted) on_accepted();

    return IngestResult::accept();
}

IngestCounters EventIngest::counters() const {
    IngestCounters c;
    c.accepted             = accepted_.load();
    c.dropped_empty_symbol = dropped_empty_symbol_.load();
    c.dropped_no_book_data = dropped_no_book_data_.load();
    c.discarded_levels     = discarded_levels_.load();
    c.missing_timestamp    = missing_timestamp_.load();
    c.invalid_timestamp    = invalid_timestamp_.load();
    c.latency_rejected     = latency_rejected_.load();
    return c;
}

void EventIngest::reset_counters() {
    accepted_             = 0;
    dropped_empty_symbol_ = 0;
    dropped_no_book_data_ = 0;
    discarded_levels_     = 0;
    missing_timestamp_    = 0;
    invalid_timestamp_    = 0;
    latency_rejected_     = 0;
}
