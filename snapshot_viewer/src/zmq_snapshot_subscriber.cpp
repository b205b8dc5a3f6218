#include "zmq_snapshot_subscriber.hpp"
#include "SnapshotSerializer.hpp"
#include <utility>

using json = nlohmann::json;

ZmqSnapshotSubscriber::ZmqSnapshotSubscriber(std::string endpoint, std::string topic_filter, int recv_timeout_ms)
    : endpoint_(std::move(endpoint)),
      topic_filter_(std::move(topic_filter)),
      ctx_(1),
      sub_(ctx_, zmq::socket_type::sub)
{
    // Only the newest frames matter to a viewer
    sub_.set(zmq::sockopt::rcvhwm, 16);
    sub_.set(zmq::sockopt::linger, 0);
    sub_.set(zmq::sockopt::rcvtimeo, recv_timeout_ms);

    sub_.connect(endpoint_);
    sub_.set(zmq::sockopt::subscribe, topic_filter_);
}

std::optional<RenderSnapshot> ZmqSnapshotSubscriber::recv_one(std::string* out_topic) {
    zmq::message_t topic_msg;
    zmq::message_t payload_msg;

    auto res = sub_.recv(topic_msg, zmq::recv_flags::none);
    if (!res.has_value()) return std::nullopt;   // timeout

    std::string topic(static_cast<char*>(topic_msg.data()), topic_msg.size());

    bool more = sub_.get(zmq::sockopt::rcvmore);

    std::string payload;
    if (more) {
        if (!sub_.recv(payload_msg, zmq::recv_flags::none)) return std::nullopt;
        payload.assign(static_cast<char*>(payload_msg.data()), payload_msg.size());
    } else {
        // fallback: single-frame message
        payload = topic;
        topic.clear();
    }

    if (out_topic) *out_topic = topic;

    return parse_snapshot_json(payload);
}

std::optional<RenderSnapshot> ZmqSnapshotSubscriber::parse_snapshot_json(const std::string& payload) {
    json j = json::parse(payload, nullptr, false);
    if (j.is_discarded()) {
        ++malformed_;
        return std::nullopt;
    }
    auto snap = snapshot_from_json(j);
    if (!snap) ++malformed_;
    return snap;
}
