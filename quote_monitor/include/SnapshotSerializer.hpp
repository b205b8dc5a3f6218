#pragma once
#include "QuoteTypes.hpp"
#include <nlohmann/json.hpp>
#include <optional>

inline constexpr const char* kSnapshotSchema = "quote_snapshot_v1";

// Wire form of RenderSnapshot, published on the "snapshot" topic.
// Instants travel as integer epoch microseconds (*_us).
nlohmann::json snapshot_to_json(const RenderSnapshot& snap);

// nullopt on schema mismatch or missing/mistyped fields
std::optional<RenderSnapshot> snapshot_from_json(const nlohmann::json& j);
