#pragma once
#include "QuoteTypes.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

/* ================= Field-mapping table ================= */

// Candidate source keys per canonical field, first match wins.
// Consulted by MessageAdapter only; the core sees UpdateEvent.
struct FieldMapping {
    std::vector<std::string> envelope     {"data"};
    std::vector<std::string> symbol       {"symbol", "code", "s", "instrument", "ticker"};
    std::vector<std::string> subscription {"guid"};

    std::vector<std::string> bid_levels   {"bids"};
    std::vector<std::string> ask_levels   {"asks"};
    std::vector<std::string> bid_price    {"bid", "bestBid", "b"};
    std::vector<std::string> ask_price    {"ask", "bestAsk", "a"};
    std::vector<std::string> bid_volume   {"bidSize", "bidVolume", "B"};
    std::vector<std::string> ask_volume   {"askSize", "askVolume", "A"};

    std::vector<std::string> level_price  {"price", "p", "px"};
    std::vector<std::string> level_volume {"volume", "qty", "size", "q", "v"};

    std::vector<std::string> last         {"last_price", "lastPrice", "lp", "last"};
    std::vector<std::string> timestamp    {"ms_timestamp", "timestamp", "exchange_time",
                                           "server_time", "time", "ts", "E", "T"};

    // Replace the listed fields, e.g. {"symbol": ["sym"], "timestamp": ["t"]}.
    // Throws std::runtime_error on unknown field names or non-string keys.
    void apply_overrides(const nlohmann::json& j);
};

/* ================= MessageAdapter ================= */

// Raw transport JSON -> canonical UpdateEvent. Only the best level of
// each side is read. Levels may be {price, volume} objects or
// [price, volume] arrays; numbers may arrive as numeric strings.
class MessageAdapter {
public:
    explicit MessageAdapter(FieldMapping mapping = {});

    // nullopt when the text is not a JSON object
    std::optional<UpdateEvent> adapt(const std::string& raw, Instant received) const;
    std::optional<UpdateEvent> adapt(const nlohmann::json& msg, Instant received) const;

    // For feeds that tag messages with a subscription id instead of the symbol
    void bind_subscription(const std::string& id, const std::string& symbol);
    void unbind_all();

    const FieldMapping& mapping() const { return mapping_; }

private:
    std::optional<std::string> resolve_symbol(const nlohmann::json& top,
                                              const nlohmann::json& body) const;
    std::optional<BookLevel> read_side(const nlohmann::json& body,
                                       const std::vector<std::string>& level_keys,
                                       const std::vector<std::string>& price_keys,
                                       const std::vector<std::string>& volume_keys) const;
    std::optional<BookLevel> parse_level(const nlohmann::json& v) const;

private:
    FieldMapping mapping_;

    mutable std::mutex subs_mtx_;
    std::unordered_map<std::string, std::string> subscriptions_;
};
