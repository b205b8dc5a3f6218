#include "AggregatorContext.hpp"
#include "Log.hpp"

static SchedulerOptions scheduler_options(const AggregatorOptions& o) {
    SchedulerOptions s;
    s.refresh_cadence = o.refresh_cadence;
    s.burst_threshold = o.burst_threshold;
    return s;
}

AggregatorContext::AggregatorContext(const AggregatorOptions& opts, IRenderer& renderer)
    : opts_(opts)
    , latency_(opts.latency_window_size)
    , ingest_(store_, latency_, opts.limits)
    , session_started_(now_instant())
    , scheduler_(scheduler_options(opts), [this] { return build_snapshot(); }, renderer)
{
    ingest_.on_accepted = [this] { scheduler_.notify_event(); };
}

AggregatorContext::~AggregatorContext() {
    stop();
}

IngestResult AggregatorContext::on_event(UpdateEvent ev) {
    return ingest_.on_event(std::move(ev));
}

void AggregatorContext::start() {
    session_started_ = now_instant();
    scheduler_.start();
}

void AggregatorContext::stop() {
    scheduler_.stop();
}

void AggregatorContext::reset() {
    store_.reset();
    latency_.reset();
    ingest_.reset_counters();
    scheduler_.reset_event_count();
    log_info("AggregatorContext", "state cleared");
}

std::shared_ptr<const RenderSnapshot> AggregatorContext::build_snapshot() {
    auto snap = std::make_shared<RenderSnapshot>();

    snap->instruments    = store_.snapshot();
    snap->latency        = latency_.stats();
    snap->recent_latency = latency_.recent_stats(opts_.recent_latency_window);

    const IngestCounters c = ingest_.counters();
    snap->total_accepted = c.accepted;
    snap->total_dropped  = c.dropped();

    snap->session_started = session_started_;
    snap->sequence        = ++sequence_;
    snap->as_of           = now_instant();

    return snap;
}
