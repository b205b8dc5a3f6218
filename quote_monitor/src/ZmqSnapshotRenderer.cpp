#include "ZmqSnapshotRenderer.hpp"
#include "Log.hpp"
#include "SnapshotSerializer.hpp"
#include "core/ZmqPublisher.hpp"

/* ================= ZmqSnapshotRenderer ================= */

ZmqSnapshotRenderer::ZmqSnapshotRenderer(const std::string& bind_addr)
    : pub_(std::make_unique<ZmqPublisher>(bind_addr))
{
    log_info("ZmqSnapshotRenderer", "publishing snapshots on " + bind_addr);
}

ZmqSnapshotRenderer::~ZmqSnapshotRenderer() = default;

void ZmqSnapshotRenderer::render(const RenderSnapshot& snap) {
    const std::string payload = snapshot_to_json(snap).dump();
    if (pub_->publish("snapshot", payload)) {
        ++published_;
    } else {
        ++dropped_;
    }
}
