#include "ReplayFeed.hpp"
#include "Log.hpp"
#include <fstream>
#include <utility>

ReplayFeed::ReplayFeed(std::string path, std::chrono::milliseconds interval)
    : path_(std::move(path)), interval_(interval)
{}

void ReplayFeed::run() {
    std::ifstream in(path_);
    if (!in.is_open()) {
        log_error("ReplayFeed", "failed to open " + path_);
        return;
    }

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty() || line[0] == '#')
            continue;

        if (on_message)
            on_message(line, now_instant());
        ++delivered_;

        // Pacing between lines; stop() cuts the wait short
        std::unique_lock<std::mutex> lk(mtx_);
        if (interval_.count() > 0) {
            cv_.wait_for(lk, interval_, [this] { return stop_requested_; });
        }
        if (stop_requested_)
            break;
    }

    log_info("ReplayFeed", "replayed " + std::to_string(delivered_.load()) + " messages from " + path_);
}

void ReplayFeed::stop() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stop_requested_ = true;
    }
    cv_.notify_all();
}
