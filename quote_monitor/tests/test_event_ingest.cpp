// tests/test_event_ingest.cpp
#include "test_assert.hpp"

#include "EventIngest.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <string>

static UpdateEvent make_event(const std::string& sym, double bid, double ask) {
  UpdateEvent ev;
  ev.symbol = sym;
  ev.bid = BookLevel{bid, 1.0};
  ev.ask = BookLevel{ask, 1.0};
  ev.receive_instant = from_epoch_us(1690000000100000LL);
  return ev;
}

int main() {
  // --- accepted event updates state and records latency ---
  {
    InstrumentStateStore store;
    LatencyAggregator lat(50);
    EventIngest ingest(store, lat);
    int accepted_calls = 0;
    ingest.on_accepted = [&] { ++accepted_calls; };

    UpdateEvent ev = make_event("SiU5", 100.0, 101.0);
    ev.raw_timestamp = RawTimestamp(std::int64_t{1690000000000});   // 100 ms before receive
    auto r = ingest.on_event(ev);

    ASSERT_TRUE(r.accepted());
    ASSERT_EQ(accepted_calls, 1);
    auto st = store.find("SiU5");
    ASSERT_TRUE(st.has_value());
    ASSERT_NEAR(*st->last_latency_ms, 100.0, 1e-9);
    ASSERT_EQ(lat.size(), 1u);
    ASSERT_NEAR(lat.stats().mean_ms, 100.0, 1e-9);
    ASSERT_EQ(ingest.counters().accepted, 1u);
  }

  // --- drops: empty symbol first, then no book data; state untouched ---
  {
    InstrumentStateStore store;
    LatencyAggregator lat(50);
    EventIngest ingest(store, lat);
    int accepted_calls = 0;
    ingest.on_accepted = [&] { ++accepted_calls; };

    UpdateEvent blank;
    blank.symbol = "   ";
    auto r1 = ingest.on_event(blank);        // no symbol and no book
    ASSERT_FALSE(r1.accepted());
    ASSERT_STR_EQ(r1.reason, kDropEmptySymbol);

    UpdateEvent nobook;
    nobook.symbol = "SiU5";
    nobook.last = 100.0;
    nobook.raw_timestamp = RawTimestamp(std::int64_t{1690000000000});
    auto r2 = ingest.on_event(nobook);
    ASSERT_FALSE(r2.accepted());
    ASSERT_STR_EQ(r2.reason, kDropNoBookData);

    UpdateEvent nan_book = make_event("SiU5", std::numeric_limits<double>::quiet_NaN(), 0.0);
    nan_book.ask->price = std::numeric_limits<double>::infinity();
    auto r3 = ingest.on_event(nan_book);
    ASSERT_FALSE(r3.accepted());
    ASSERT_STR_EQ(r3.reason, kDropNoBookData);

    ASSERT_EQ(store.size(), 0u);
    ASSERT_EQ(lat.size(), 0u);
    ASSERT_EQ(accepted_calls, 0);

    auto c = ingest.counters();
    ASSERT_EQ(c.dropped_empty_symbol, 1u);
    ASSERT_EQ(c.dropped_no_book_data, 2u);
    ASSERT_EQ(c.discarded_levels, 2u);
    ASSERT_EQ(c.dropped(), 3u);
    ASSERT_EQ(c.accepted, 0u);
  }

  // --- symbol is trimmed ---
  {
    InstrumentStateStore store;
    LatencyAggregator lat(50);
    EventIngest ingest(store, lat);
    ASSERT_TRUE(ingest.on_event(make_event("  ETHUSDT ", 1.0, 2.0)).accepted());
    ASSERT_TRUE(store.find("ETHUSDT").has_value());
  }

  // --- one non-finite side is discarded, the other side accepted ---
  {
    InstrumentStateStore store;
    LatencyAggregator lat(50);
    EventIngest ingest(store, lat);
    UpdateEvent ev = make_event("S", 10.0, 11.0);
    ev.ask->volume = std::numeric_limits<double>::quiet_NaN();
    ASSERT_TRUE(ingest.on_event(ev).accepted());
    auto st = store.find("S");
    ASSERT_TRUE(st->bid.has_value());
    ASSERT_FALSE(st->ask.has_value());
    ASSERT_EQ(ingest.counters().discarded_levels, 1u);
  }

  // --- missing / invalid timestamp: accepted, no latency sample ---
  {
    InstrumentStateStore store;
    LatencyAggregator lat(50);
    EventIngest ingest(store, lat);

    auto r1 = ingest.on_event(make_event("A", 1.0, 2.0));
    UpdateEvent bad = make_event("B", 1.0, 2.0);
    bad.raw_timestamp = RawTimestamp(std::string("yesterday"));
    auto r2 = ingest.on_event(bad);

    ASSERT_TRUE(r1.accepted());
    ASSERT_TRUE(r2.accepted());
    ASSERT_FALSE(store.find("A")->last_exchange_instant.has_value());
    ASSERT_FALSE(store.find("B")->last_latency_ms.has_value());
    ASSERT_EQ(lat.size(), 0u);
    auto c = ingest.counters();
    ASSERT_EQ(c.missing_timestamp, 1u);
    ASSERT_EQ(c.invalid_timestamp, 1u);
  }

  // --- negative latency recorded as-is; out-of-band latency kept out of the window ---
  {
    InstrumentStateStore store;
    LatencyAggregator lat(50);
    EventIngest ingest(store, lat);

    UpdateEvent ahead = make_event("A", 1.0, 2.0);
    ahead.raw_timestamp = RawTimestamp(std::int64_t{1690000000150});   // 50 ms in the future
    ASSERT_TRUE(ingest.on_event(ahead).accepted());
    ASSERT_NEAR(*store.find("A")->last_latency_ms, -50.0, 1e-9);
    ASSERT_EQ(lat.size(), 1u);

    UpdateEvent stale = make_event("B", 1.0, 2.0);
    stale.raw_timestamp = RawTimestamp(std::int64_t{1689999990000});   // ~10 s old
    ASSERT_TRUE(ingest.on_event(stale).accepted());
    ASSERT_TRUE(store.find("B")->last_latency_ms.has_value());
    ASSERT_EQ(lat.size(), 1u);
    ASSERT_EQ(ingest.counters().latency_rejected, 1u);
  }

  // --- seconds and ISO timestamps land on the same latency ---
  {
    InstrumentStateStore store;
    LatencyAggregator lat(50);
    EventIngest ingest(store, lat);

    UpdateEvent s = make_event("S", 1.0, 2.0);
    s.raw_timestamp = RawTimestamp(std::int64_t{1690000000});
    UpdateEvent iso = make_event("I", 1.0, 2.0);
    iso.raw_timestamp = RawTimestamp(std::string("2023-07-22T04:26:40Z"));
    ingest.on_event(s);
    ingest.on_event(iso);
    ASSERT_NEAR(*store.find("S")->last_latency_ms, 100.0, 1e-9);
    ASSERT_NEAR(*store.find("I")->last_latency_ms, 100.0, 1e-9);

    ingest.reset_counters();
    ASSERT_EQ(ingest.counters().accepted, 0u);
  }

  std::cout << "All event_ingest tests passed.\n";
  return 0;
}
