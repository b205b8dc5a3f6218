#pragma once
#include "IRenderer.hpp"
#include <cstdint>
#include <memory>
#include <string>

class ZmqPublisher;

/* ================= ZeroMQ publisher ================= */

// Publishes snapshot_to_json() on topic "snapshot"
class ZmqSnapshotRenderer : public IRenderer {
public:
    explicit ZmqSnapshotRenderer(const std::string& bind_addr);
    ~ZmqSnapshotRenderer() override;

    void render(const RenderSnapshot& snap) override;

    std::uint64_t published() const { return published_; }
    std::uint64_t dropped() const { return dropped_; }

private:
    std::unique_ptr<ZmqPublisher> pub_;
    std::uint64_t published_ = 0;
    std::uint64_t dropped_   = 0;
};
