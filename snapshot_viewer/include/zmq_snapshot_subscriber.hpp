#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <zmq.hpp>
#include <nlohmann/json.hpp>

#include "QuoteTypes.hpp"

// connect -> subscribe -> recv -> parse -> return RenderSnapshot
class ZmqSnapshotSubscriber {
public:
    ZmqSnapshotSubscriber(std::string endpoint, std::string topic_filter, int recv_timeout_ms = 500);

    // Blocking up to recv_timeout_ms.
    // std::nullopt on timeout or a malformed payload (keeps running).
    std::optional<RenderSnapshot> recv_one(std::string* out_topic = nullptr);

    std::uint64_t malformed() const { return malformed_; }

private:
    std::optional<RenderSnapshot> parse_snapshot_json(const std::string& payload);

private:
    std::string endpoint_;
    std::string topic_filter_;
    std::uint64_t malformed_ = 0;

    zmq::context_t ctx_;
    zmq::socket_t  sub_;
};
