#pragma once
#include "QuoteTypes.hpp"
#include <functional>
#include <string>

class IFeed {
public:
    virtual ~IFeed() = default;

    // Blocking loop: connect, deliver raw messages until stop() or a
    // transport failure. Reconnecting is the caller's business.
    virtual void run() = 0;

    // Safe from any thread; makes run() return
    virtual void stop() = 0;

    // Called on the run() thread for every raw message, with the local
    // receive instant taken as soon as the frame was read
    std::function<void(const std::string& raw, Instant received)> on_message;
};
