#pragma once
#include "IRenderer.hpp"
#include "QuoteTypes.hpp"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

enum class SchedulerState {
    Idle,
    Armed,
    Rendering
};

enum class RenderTrigger {
    Timer,
    Burst,
    Manual
};

struct SchedulerOptions {
    std::chrono::milliseconds refresh_cadence{1000};
    std::size_t burst_threshold = 5;
};

// Decouples update arrival rate from render rate.
//
//   Idle --start()--> Armed --(timer | burst)--> Rendering --> Armed
//   any  --stop()---> Idle
//
// The timer lives on a private io_context thread. Snapshots go to a
// dedicated render thread through a single slot: a newer snapshot
// replaces one the renderer has not picked up yet (latest-wins).
class RenderScheduler {
public:
    using SnapshotSource = std::function<std::shared_ptr<const RenderSnapshot>()>;

    RenderScheduler(SchedulerOptions opts, SnapshotSource source, IRenderer& renderer);
    ~RenderScheduler();

    RenderScheduler(const RenderScheduler&) = delete;
    RenderScheduler& operator=(const RenderScheduler&) = delete;

    void start();

    // Idempotent, valid from any state. Must not be called from inside
    // IRenderer::render().
    void stop();

    // Ingest side: one accepted event. Non-blocking.
    void notify_event();

    // Render as soon as the timer thread gets to it
    void request_render();

    // Session reset: forget events counted toward the next burst
    void reset_event_count();

    SchedulerState state() const { return state_.load(); }
    const SchedulerOptions& options() const { return opts_; }

    std::size_t   events_since_render() const { return events_since_render_.load(); }
    std::uint64_t renders() const          { return renders_.load(); }          // snapshots handed off
    std::uint64_t frames_rendered() const  { return frames_rendered_.load(); }  // renderer calls completed
    std::uint64_t dropped_frames() const   { return dropped_frames_.load(); }   // replaced in the slot
    std::uint64_t burst_renders() const    { return burst_renders_.load(); }
    std::uint64_t timer_renders() const    { return timer_renders_.load(); }

private:
    void arm_timer();
    void on_timer(const boost::system::error_code& ec, std::uint64_t generation);
    void render_now(RenderTrigger trigger, std::uint64_t session);

    void handoff(std::shared_ptr<const RenderSnapshot> snap);
    void render_loop();

private:
    SchedulerOptions opts_;
    SnapshotSource   source_;
    IRenderer&       renderer_;

    // ---- timer context ----
    boost::asio::io_context ioc_;
    boost::asio::steady_timer timer_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    std::thread io_thread_;
    std::uint64_t timer_generation_ = 0;   // io thread only

    std::mutex lifecycle_mtx_;             // start/stop
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> session_{0};   // bumped by every stop()
    std::atomic<SchedulerState> state_{SchedulerState::Idle};

    std::atomic<std::size_t> events_since_render_{0};
    std::atomic<bool> burst_pending_{false};

    // ---- latest-wins handoff ----
    std::mutex slot_mtx_;
    std::condition_variable slot_cv_;
    std::shared_ptr<const RenderSnapshot> slot_;
    bool render_stop_ = false;
    std::thread render_thread_;

    std::atomic<std::uint64_t> renders_{0};
    std::atomic<std::uint64_t> frames_rendered_{0};
    std::atomic<std::uint64_t> dropped_frames_{0};
    std::atomic<std::uint64_t> burst_renders_{0};
    std::atomic<std::uint64_t> timer_renders_{0};
};
