#include "RenderScheduler.hpp"
#include "Log.hpp"
#include <boost/asio/post.hpp>
#include <exception>
#include <string>

namespace net = boost::asio;

RenderScheduler::RenderScheduler(SchedulerOptions opts,
                                 SnapshotSource source,
                                 IRenderer& renderer)
    : opts_(opts)
    , source_(std::move(source))
    , renderer_(renderer)
    , timer_(ioc_)
{
    if (opts_.burst_threshold == 0)
        opts_.burst_threshold = 1;
    if (opts_.refresh_cadence <= std::chrono::milliseconds::zero())
        opts_.refresh_cadence = std::chrono::milliseconds(1);
}

RenderScheduler::~RenderScheduler() {
    stop();
}

void RenderScheduler::start() {
    std::lock_guard<std::mutex> lk(lifecycle_mtx_);
    if (running_.load())
        return;

    events_since_render_ = 0;
    burst_pending_       = false;
    {
        std::lock_guard<std::mutex> slot_lk(slot_mtx_);
        render_stop_ = false;
        slot_.reset();
    }
    render_thread_ = std::thread(&RenderScheduler::render_loop, this);

    ioc_.restart();
    work_.emplace(net::make_work_guard(ioc_));
    running_ = true;
    state_   = SchedulerState::Armed;

    net::post(ioc_, [this] { arm_timer(); });
    io_thread_ = std::thread([this] { ioc_.run(); });

    log_info("RenderScheduler", "armed: cadence=" + std::to_string(opts_.refresh_cadence.count()) +
             "ms burst=" + std::to_string(opts_.burst_threshold));
}

void RenderScheduler::stop() {
    std::lock_guard<std::mutex> lk(lifecycle_mtx_);
    if (std::this_thread::get_id() == render_thread_.get_id()) {
        // Joining ourselves would deadlock; leave the threads to a later stop()
        log_error("RenderScheduler", "stop() called from inside render(), ignored");
        return;
    }
    if (!running_.exchange(false))
        return;
    // Renders posted by notify_event()/request_render() that raced this
    // stop() carry the old session and are discarded whenever they run
    ++session_;

    // ---- timer context ----
    work_.reset();
    ioc_.stop();
    if (io_thread_.joinable())
        io_thread_.join();

    // Drain what was queued: the cancelled wait and any posted renders
    // see running_ == false and return.
    timer_.cancel();
    ioc_.restart();
    ioc_.poll();

    // ---- render thread: abandon a pending frame, let an in-flight one finish ----
    {
        std::lock_guard<std::mutex> slot_lk(slot_mtx_);
        render_stop_ = true;
        slot_.reset();
    }
    slot_cv_.notify_all();
    if (render_thread_.joinable())
        render_thread_.join();

    state_ = SchedulerState::Idle;
    log_info("RenderScheduler", "stopped after " + std::to_string(renders_.load()) + " renders");
}

void RenderScheduler::notify_event() {
    // session first: a stop() between the two loads makes this post stale
    const std::uint64_t session = session_.load();
    if (!running_.load())
        return;

    const std::size_t n = events_since_render_.fetch_add(1) + 1;
    if (n >= opts_.burst_threshold && !burst_pending_.exchange(true)) {
        net::post(ioc_, [this, session] { render_now(RenderTrigger::Burst, session); });
    }
}

void RenderScheduler::request_render() {
    const std::uint64_t session = session_.load();
    if (!running_.load())
        return;
    net::post(ioc_, [this, session] { render_now(RenderTrigger::Manual, session); });
}

void RenderScheduler::reset_event_count() {
    events_since_render_ = 0;
}

void RenderScheduler::arm_timer() {
    if (!running_.load())
        return;

    // expires_after() cancels a pending wait; the generation check also
    // discards a completion that was already queued before the re-arm.
    const std::uint64_t gen = ++timer_generation_;
    timer_.expires_after(opts_.refresh_cadence);
    timer_.async_wait([this, gen](const boost::system::error_code& ec) {
        on_timer(ec, gen);
    });
}

void RenderScheduler::on_timer(const boost::system::error_code& ec, std::uint64_t generation) {
    if (ec == net::error::operation_aborted || generation != timer_generation_)
        return;
    if (ec) {
        log_error("RenderScheduler", "timer error: " + ec.message());
        arm_timer();
        return;
    }
    render_now(RenderTrigger::Timer, session_.load());
}

void RenderScheduler::render_now(RenderTrigger trigger, std::uint64_t session) {
    if (!running_.load() || session != session_.load()) {
        // a stale burst must not keep the next session's bursts blocked
        if (trigger == RenderTrigger::Burst)
            burst_pending_ = false;
        return;
    }

    state_ = SchedulerState::Rendering;

    events_since_render_ = 0;
    burst_pending_       = false;

    try {
        auto snap = source_ ? source_() : nullptr;
        if (snap) {
            handoff(std::move(snap));
            ++renders_;
            if (trigger == RenderTrigger::Burst) ++burst_renders_;
            if (trigger == RenderTrigger::Timer) ++timer_renders_;
        }
    } catch (const std::exception& ex) {
        log_error("RenderScheduler", std::string("snapshot failed: ") + ex.what());
    }

    state_ = SchedulerState::Armed;
    arm_timer();
}

void RenderScheduler::handoff(std::shared_ptr<const RenderSnapshot> snap) {
    {
        std::lock_guard<std::mutex> lk(slot_mtx_);
        if (slot_) ++dropped_frames_;
        slot_ = std::move(snap);
    }
    slot_cv_.notify_one();
}

void RenderScheduler::render_loop() {
    for (;;) {
        std::shared_ptr<const RenderSnapshot> snap;
        {
            std::unique_lock<std::mutex> lk(slot_mtx_);
            slot_cv_.wait(lk, [this] { return render_stop_ || slot_ != nullptr; });
            if (render_stop_)
                break;
            snap = std::move(slot_);
            slot_.reset();
        }

        try {
            renderer_.render(*snap);
            ++frames_rendered_;
        } catch (const std::exception& ex) {
            log_error("RenderScheduler", std::string("renderer failed: ") + ex.what());
        }
    }
}
