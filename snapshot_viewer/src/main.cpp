#include <csignal>
#include <cstdint>
#include <iostream>
#include <string>

#include <zmq.hpp>

#include "Log.hpp"
#include "Renderers.hpp"
#include "zmq_snapshot_subscriber.hpp"

// ------------------- shutdown -------------------
static volatile std::sig_atomic_t g_stop = 0;
static void on_sigint(int) { g_stop = 1; }

// ------------------- main -------------------
int main(int argc, char** argv) {
    std::signal(SIGINT, on_sigint);
    std::signal(SIGTERM, on_sigint);

    const std::string endpoint = argc > 1 ? argv[1] : "tcp://localhost:5556";

    try {
        ZmqSnapshotSubscriber sub(endpoint, "snapshot");
        ConsoleRenderer console;

        log_info("snapshot_viewer", "listening on " + endpoint);

        std::uint64_t shown = 0;
        while (!g_stop) {
            auto snap = sub.recv_one();
            if (!snap) continue;   // timeout or malformed frame

            console.render(*snap);
            ++shown;
        }

        log_info("snapshot_viewer", "shown " + std::to_string(shown) + " snapshots, "
                 + std::to_string(sub.malformed()) + " malformed");
    } catch (const zmq::error_t& ex) {
        // EINTR from Ctrl+C during recv lands here too
        if (!g_stop) {
            log_error("snapshot_viewer", ex.what());
            return 1;
        }
    }
    return 0;
}
