#pragma once
#include "IFeed.hpp"
#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

struct WsEndpoint {
    std::string host;          // "api.alor.ru"
    std::string port = "443";
    std::string path = "/ws";
    bool tls = true;
};

// Text-frame WebSocket client (Boost.Beast, sync). Sends the subscribe
// messages after the handshake, then hands every frame to on_message.
class WsJsonFeed : public IFeed {
public:
    WsJsonFeed(WsEndpoint endpoint, std::vector<std::string> subscribe_messages);

    void run() override;
    void stop() override;

private:
    template <typename WsStream>
    void session(WsStream& ws);

private:
    WsEndpoint endpoint_;
    std::vector<std::string> subscribe_messages_;

    std::atomic<bool> running_{true};   // one-shot: stop() is final

    // Shuts the socket down from stop() to unblock a pending read
    std::mutex closer_mtx_;
    std::function<void()> closer_;
};
