#include "MonitorConfig.hpp"
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

static void replace_all(std::string& s, const std::string& from, const std::string& to) {
    std::size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

static json substitute(const json& tmpl, const std::string& symbol, const std::string& guid) {
    if (tmpl.is_string()) {
        std::string s = tmpl.get<std::string>();
        replace_all(s, "{symbol}", symbol);
        replace_all(s, "{guid}", guid);
        return s;
    }
    if (tmpl.is_array()) {
        json out = json::array();
        for (const auto& v : tmpl) out.push_back(substitute(v, symbol, guid));
        return out;
    }
    if (tmpl.is_object()) {
        json out = json::object();
        for (const auto& [k, v] : tmpl.items()) out[k] = substitute(v, symbol, guid);
        return out;
    }
    return tmpl;
}

static FeedType parse_feed_type(const std::string& s) {
    if (s == "ws" || s == "websocket") return FeedType::WebSocket;
    if (s == "replay")                 return FeedType::Replay;
    throw std::runtime_error("feed.type must be \"ws\" or \"replay\", got \"" + s + "\"");
}

MonitorConfig parse_monitor_config(const json& j) {
    if (!j.is_object())
        throw std::runtime_error("config root must be an object");

    MonitorConfig cfg;
    try {
        // ---------- Aggregator ----------
        const int cadence_ms = j.value("refreshCadenceMs", 1000);
        const int burst      = j.value("burstThreshold", 5);
        const int window     = j.value("latencyWindowSize", 50);
        const int recent     = j.value("recentLatencyWindow", 10);

        if (cadence_ms <= 0) throw std::runtime_error("refreshCadenceMs must be > 0");
        if (burst < 1)       throw std::runtime_error("burstThreshold must be >= 1");
        if (window < 1)      throw std::runtime_error("latencyWindowSize must be >= 1");
        if (recent < 1)      throw std::runtime_error("recentLatencyWindow must be >= 1");

        cfg.aggregator.refresh_cadence       = std::chrono::milliseconds(cadence_ms);
        cfg.aggregator.burst_threshold       = static_cast<std::size_t>(burst);
        cfg.aggregator.latency_window_size   = static_cast<std::size_t>(window);
        cfg.aggregator.recent_latency_window = static_cast<std::size_t>(recent);

        cfg.aggregator.limits.latency_sample_min_ms =
            j.value("latencySampleMinMs", cfg.aggregator.limits.latency_sample_min_ms);
        cfg.aggregator.limits.latency_sample_max_ms =
            j.value("latencySampleMaxMs", cfg.aggregator.limits.latency_sample_max_ms);
        if (cfg.aggregator.limits.latency_sample_min_ms > cfg.aggregator.limits.latency_sample_max_ms)
            throw std::runtime_error("latencySampleMinMs must not exceed latencySampleMaxMs");

        // ---------- Feed ----------
        if (j.contains("feed")) {
            const json& f = j.at("feed");
            if (!f.is_object())
                throw std::runtime_error("feed must be an object");

            cfg.feed.type = parse_feed_type(f.value("type", std::string("replay")));
            cfg.feed.host = f.value("host", std::string());
            cfg.feed.port = f.value("port", cfg.feed.port);
            cfg.feed.path = f.value("path", cfg.feed.path);
            cfg.feed.tls  = f.value("tls", cfg.feed.tls);

            if (f.contains("instruments")) {
                for (const auto& ins : f.at("instruments"))
                    cfg.feed.instruments.push_back(ins.get<std::string>());
            }
            if (f.contains("subscribeTemplate"))
                cfg.feed.subscribe_template = f.at("subscribeTemplate");

            cfg.feed.replay_file        = f.value("replayFile", std::string());
            cfg.feed.replay_interval_ms = f.value("replayIntervalMs", 0);
            if (cfg.feed.replay_interval_ms < 0)
                throw std::runtime_error("feed.replayIntervalMs must be >= 0");
        }

        if (cfg.feed.type == FeedType::WebSocket && cfg.feed.host.empty())
            throw std::runtime_error("feed.host is required for a websocket feed");
        if (cfg.feed.type == FeedType::Replay && cfg.feed.replay_file.empty())
            throw std::runtime_error("feed.replayFile is required for a replay feed");

        // ---------- Renderers ----------
        if (j.contains("renderers")) {
            cfg.renderers.clear();
            for (const auto& r : j.at("renderers")) {
                auto name = r.get<std::string>();
                if (name != "console" && name != "zmq")
                    throw std::runtime_error("unknown renderer \"" + name + "\"");
                cfg.renderers.push_back(std::move(name));
            }
        }
        cfg.zmq_endpoint = j.value("zmqEndpoint", cfg.zmq_endpoint);

        // ---------- Field mapping ----------
        if (j.contains("fieldMapping"))
            cfg.field_mapping.apply_overrides(j.at("fieldMapping"));

    } catch (const json::exception& ex) {
        throw std::runtime_error(std::string("config: ") + ex.what());
    }
    return cfg;
}

MonitorConfig load_monitor_config(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open())
        throw std::runtime_error("failed to open " + path);

    json j = json::parse(in, nullptr, false);
    if (j.is_discarded())
        throw std::runtime_error(path + " is not valid JSON");

    return parse_monitor_config(j);
}

std::vector<Subscription> build_subscriptions(const FeedConfig& feed) {
    std::vector<Subscription> out;
    if (feed.subscribe_template.is_null())
        return out;

    for (const auto& symbol : feed.instruments) {
        Subscription s;
        s.symbol  = symbol;
        s.id      = "qm-" + symbol;
        s.message = substitute(feed.subscribe_template, s.symbol, s.id).dump();
        out.push_back(std::move(s));
    }
    return out;
}
