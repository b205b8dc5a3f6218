#pragma once
#include <zmq.hpp>
#include <string>

// Two-frame PUB: [topic][payload]
class ZmqPublisher {
public:
    explicit ZmqPublisher(const std::string& bind_addr, int sndhwm = 16)
        : ctx_(1), pub_(ctx_, zmq::socket_type::pub)
    {
        // Snapshots are latest-wins: a slow subscriber loses old frames
        pub_.set(zmq::sockopt::sndhwm, sndhwm);
        pub_.set(zmq::sockopt::linger, 0);
        pub_.bind(bind_addr);
    }

    // false when the frame was dropped (HWM reached)
    bool publish(const std::string& topic,
                 const std::string& payload)
    {
        zmq::message_t t(topic.data(), topic.size());
        zmq::message_t p(payload.data(), payload.size());

        if (!pub_.send(t, zmq::send_flags::sndmore | zmq::send_flags::dontwait))
            return false;
        return pub_.send(p, zmq::send_flags::dontwait).has_value();
    }

private:
    zmq::context_t ctx_;
    zmq::socket_t  pub_;
};
