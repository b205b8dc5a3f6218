// tests/test_aggregator_context.cpp
#include "test_assert.hpp"

#include "AggregatorContext.hpp"
#include "MessageAdapter.hpp"

#include <chrono>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

class CapturingRenderer : public IRenderer {
public:
  void render(const RenderSnapshot& snap) override {
    std::lock_guard<std::mutex> lk(mtx_);
    frames_.push_back(snap);
  }
  std::vector<RenderSnapshot> frames() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return frames_;
  }
private:
  mutable std::mutex mtx_;
  std::vector<RenderSnapshot> frames_;
};

int main() {
  // --- transport JSON -> adapter -> ingest -> store -> burst render ---
  {
    CapturingRenderer r;
    AggregatorOptions opts;
    opts.refresh_cadence = 5000ms;
    opts.burst_threshold = 3;
    opts.latency_window_size = 4;
    opts.recent_latency_window = 2;

    AggregatorContext ctx(opts, r);
    MessageAdapter adapter;
    ctx.start();

    const std::int64_t now_ms = to_epoch_us(now_instant()) / 1000;
    const char* lines[] = {
      R"({"symbol":"SiU5","bid":91500,"ask":91502})",
      R"({"symbol":"SiU5","bid":91501,"ask":91502})",
      R"({"symbol":"","bid":1,"ask":2})",
      R"({"symbol":"RIU5","last_price":110000})",
    };
    for (const char* line : lines) {
      auto ev = adapter.adapt(std::string(line), now_instant());
      ASSERT_TRUE(ev.has_value());
      ctx.on_event(*ev);
    }

    UpdateEvent timed;
    timed.symbol = "RIU5";
    timed.bid = BookLevel{109990.0, 1.0};
    timed.ask = BookLevel{110010.0, 1.0};
    timed.raw_timestamp = RawTimestamp(now_ms);
    ctx.on_event(timed);                    // third accepted -> burst

    std::this_thread::sleep_for(200ms);
    auto frames = r.frames();
    ASSERT_EQ(frames.size(), 1u);
    const RenderSnapshot& f = frames.back();
    ASSERT_EQ(f.sequence, 1u);
    ASSERT_EQ(f.total_accepted, 3u);
    ASSERT_EQ(f.total_dropped, 2u);
    ASSERT_EQ(f.instruments.size(), 2u);
    ASSERT_TRUE(f.instruments.at("SiU5").bid_direction == Direction::Up);
    ASSERT_EQ(f.instruments.at("SiU5").update_count, 2u);
    ASSERT_EQ(f.latency.count, 1u);
    ASSERT_TRUE(f.latency.mean_ms > -1000.0 && f.latency.mean_ms < 2000.0);
    ASSERT_TRUE(f.as_of >= f.session_started);

    ctx.stop();
    ctx.stop();
    ASSERT_TRUE(ctx.scheduler().state() == SchedulerState::Idle);
  }

  // --- snapshots taken directly; reset clears the session ---
  {
    CapturingRenderer r;
    AggregatorContext ctx(AggregatorOptions{}, r);

    UpdateEvent ev;
    ev.symbol = "ETHUSDT";
    ev.bid = BookLevel{1850.0, 1.0};
    ev.ask = BookLevel{1850.5, 1.0};
    ASSERT_TRUE(ctx.on_event(ev).accepted());

    auto s1 = ctx.build_snapshot();
    auto s2 = ctx.build_snapshot();
    ASSERT_TRUE(s2->sequence > s1->sequence);
    ASSERT_EQ(s1->instruments.size(), 1u);

    ctx.reset();
    auto s3 = ctx.build_snapshot();
    ASSERT_EQ(s3->instruments.size(), 0u);
    ASSERT_EQ(s3->total_accepted, 0u);
    ASSERT_EQ(s3->latency.count, 0u);
    ASSERT_EQ(s1->instruments.size(), 1u);  // earlier snapshot unaffected
  }

  // --- reset() also clears events counted toward the next burst ---
  {
    CapturingRenderer r;
    AggregatorOptions opts;
    opts.refresh_cadence = 5000ms;
    opts.burst_threshold = 3;
    AggregatorContext ctx(opts, r);
    ctx.start();

    UpdateEvent ev;
    ev.symbol = "SiU5";
    ev.bid = BookLevel{91500.0, 1.0};
    ev.ask = BookLevel{91502.0, 1.0};

    ctx.on_event(ev);
    ctx.on_event(ev);
    ctx.reset();
    ASSERT_EQ(ctx.scheduler().events_since_render(), 0u);

    ctx.on_event(ev);                       // first event of the new session
    std::this_thread::sleep_for(150ms);
    ASSERT_EQ(r.frames().size(), 0u);
    ASSERT_EQ(ctx.scheduler().events_since_render(), 1u);

    ctx.on_event(ev);
    ctx.on_event(ev);
    std::this_thread::sleep_for(150ms);
    auto frames = r.frames();
    ASSERT_EQ(frames.size(), 1u);
    ASSERT_EQ(frames.back().total_accepted, 3u);
    ctx.stop();
  }

  std::cout << "All aggregator_context tests passed.\n";
  return 0;
}
