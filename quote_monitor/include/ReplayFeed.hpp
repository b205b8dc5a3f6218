#pragma once
#include "IFeed.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>

// Replays a JSON-lines capture: one raw transport message per line.
// Empty lines and lines starting with '#' are skipped.
class ReplayFeed : public IFeed {
public:
    explicit ReplayFeed(std::string path,
                        std::chrono::milliseconds interval = std::chrono::milliseconds(0));

    void run() override;
    void stop() override;

    std::uint64_t lines_delivered() const { return delivered_.load(); }

private:
    std::string path_;
    std::chrono::milliseconds interval_;

    std::mutex mtx_;
    std::condition_variable cv_;
    bool stop_requested_ = false;

    std::atomic<std::uint64_t> delivered_{0};
};
