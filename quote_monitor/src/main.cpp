#include "AggregatorContext.hpp"
#include "Log.hpp"
#include "MessageAdapter.hpp"
#include "MonitorConfig.hpp"
#include "ReplayFeed.hpp"
#include "Renderers.hpp"
#include "SessionReport.hpp"
#include "WsJsonFeed.hpp"
#include "ZmqSnapshotRenderer.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace net = boost::asio;

static std::unique_ptr<IFeed> make_feed(const MonitorConfig& cfg, MessageAdapter& adapter) {
    // Captures recorded from a subscribed session carry the same guids
    std::vector<std::string> frames;
    for (const auto& sub : build_subscriptions(cfg.feed)) {
        adapter.bind_subscription(sub.id, sub.symbol);
        frames.push_back(sub.message);
    }

    if (cfg.feed.type == FeedType::Replay) {
        return std::make_unique<ReplayFeed>(
            cfg.feed.replay_file,
            std::chrono::milliseconds(cfg.feed.replay_interval_ms));
    }

    WsEndpoint ep;
    ep.host = cfg.feed.host;
    ep.port = cfg.feed.port;
    ep.path = cfg.feed.path;
    ep.tls  = cfg.feed.tls;
    return std::make_unique<WsJsonFeed>(std::move(ep), std::move(frames));
}

static std::unique_ptr<RendererFanout> make_renderers(const MonitorConfig& cfg) {
    auto fanout = std::make_unique<RendererFanout>();
    for (const auto& name : cfg.renderers) {
        if (name == "console")
            fanout->add(std::make_unique<ConsoleRenderer>());
        else if (name == "zmq")
            fanout->add(std::make_unique<ZmqSnapshotRenderer>(cfg.zmq_endpoint));
    }
    return fanout;
}

int main(int argc, char** argv) {
    // ---------- Config ----------
    const std::string cfg_path = argc > 1 ? argv[1] : "../config.json";

    MonitorConfig cfg;
    try {
        cfg = load_monitor_config(cfg_path);
    } catch (const std::exception& ex) {
        std::cerr << "[Config] " << ex.what() << "\n";
        return 1;
    }

    // ---------- Wiring ----------
    std::unique_ptr<RendererFanout> renderer;
    try {
        renderer = make_renderers(cfg);
    } catch (const std::exception& ex) {
        std::cerr << "[Renderer] " << ex.what() << "\n";
        return 1;
    }

    MessageAdapter adapter(cfg.field_mapping);
    AggregatorContext ctx(cfg.aggregator, *renderer);
    std::unique_ptr<IFeed> feed = make_feed(cfg, adapter);

    std::uint64_t malformed = 0;
    feed->on_message = [&](const std::string& raw, Instant received) {
        auto ev = adapter.adapt(raw, received);
        if (!ev) {
            if (should_log_occurrence(++malformed))
                log_warn("main", "malformed message skipped (total " + std::to_string(malformed) + ")");
            return;
        }
        ctx.on_event(std::move(*ev));
    };

    // ---------- Run until SIGINT/SIGTERM or the feed ends ----------
    net::io_context main_ioc;
    net::signal_set signals(main_ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int) {
        if (ec) return;
        log_info("main", "stopping...");
        feed->stop();
    });

    ctx.start();

    std::thread feed_thread([&] {
        feed->run();
        net::post(main_ioc, [&] { signals.cancel(); });
    });

    main_ioc.run();

    feed->stop();
    if (feed_thread.joinable())
        feed_thread.join();

    ctx.stop();

    // Final frame with everything ingested, then the session summary
    auto last = ctx.build_snapshot();
    try {
        renderer->render(*last);
    } catch (const std::exception& ex) {
        log_error("main", std::string("final render failed: ") + ex.what());
    }
    print_session_report(std::cout, build_session_report(*last, now_instant()));

    return 0;
}
