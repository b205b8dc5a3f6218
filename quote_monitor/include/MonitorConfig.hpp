#pragma once
#include "AggregatorContext.hpp"
#include "MessageAdapter.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

enum class FeedType {
    WebSocket,
    Replay
};

struct FeedConfig {
    FeedType type = FeedType::Replay;

    // WebSocket
    std::string host;
    std::string port = "443";
    std::string path = "/";
    bool tls = true;
    std::vector<std::string> instruments;
    nlohmann::json subscribe_template;   // null: no subscribe messages

    // Replay
    std::string replay_file;
    int replay_interval_ms = 0;
};

struct MonitorConfig {
    AggregatorOptions aggregator;
    FeedConfig feed;
    std::vector<std::string> renderers{"console"};
    std::string zmq_endpoint = "tcp://*:5556";
    FieldMapping field_mapping;
};

// Throws std::runtime_error on invalid or out-of-range values
MonitorConfig parse_monitor_config(const nlohmann::json& j);
MonitorConfig load_monitor_config(const std::string& path);

struct Subscription {
    std::string id;        // bound in MessageAdapter
    std::string symbol;
    std::string message;   // serialized JSON frame
};

// One frame per instrument: string values "{symbol}" / "{guid}" inside the
// template are substituted (also as substrings).
std::vector<Subscription> build_subscriptions(const FeedConfig& feed);
