#include "SnapshotSerializer.hpp"
#include "ChangeClassifier.hpp"

using json = nlohmann::json;

static json level_json(const std::optional<BookLevel>& lvl) {
    if (!lvl) return nullptr;
    return json{{"price", lvl->price}, {"volume", lvl->volume}};
}

static std::optional<BookLevel> level_from(const json& v) {
    if (v.is_null()) return std::nullopt;
    BookLevel lvl;
    lvl.price  = v.at("price").get<double>();
    lvl.volume = v.at("volume").get<double>();
    return lvl;
}

template <typename T>
static json opt_json(const std::optional<T>& v) {
    if (!v) return nullptr;
    return json(*v);
}

static std::optional<double> opt_double(const json& v) {
    if (v.is_null()) return std::nullopt;
    return v.get<double>();
}

static json stats_json(const LatencyStats& s) {
    return json{
        {"count", s.count},
        {"mean_ms", s.mean_ms},
        {"min_ms", s.min_ms},
        {"max_ms", s.max_ms}
    };
}

static LatencyStats stats_from(const json& v) {
    LatencyStats s;
    s.count   = v.at("count").get<std::size_t>();
    s.mean_ms = v.at("mean_ms").get<double>();
    s.min_ms  = v.at("min_ms").get<double>();
    s.max_ms  = v.at("max_ms").get<double>();
    return s;
}

static Direction direction_from(const json& v) {
    return ChangeClassifier::from_name(v.get<std::string>())
        .value_or(Direction::FirstObservation);
}

json snapshot_to_json(const RenderSnapshot& snap) {
    json instruments = json::array();
    for (const auto& [sym, st] : snap.instruments) {
        json row = {
            {"symbol", st.symbol},
            {"bid", level_json(st.bid)},
            {"ask", level_json(st.ask)},
            {"last", opt_json(st.last)},
            {"spread", opt_json(st.spread)},
            {"crossed", st.crossed},
            {"previous_bid", level_json(st.previous_bid)},
            {"previous_ask", level_json(st.previous_ask)},
            {"previous_last", opt_json(st.previous_last)},
            {"bid_direction", ChangeClassifier::name(st.bid_direction)},
            {"ask_direction", ChangeClassifier::name(st.ask_direction)},
            {"last_direction", ChangeClassifier::name(st.last_direction)},
            {"last_exchange_us", st.last_exchange_instant
                                     ? json(to_epoch_us(*st.last_exchange_instant))
                                     : json(nullptr)},
            {"last_receive_us", to_epoch_us(st.last_receive_instant)},
            {"last_latency_ms", opt_json(st.last_latency_ms)},
            {"update_count", st.update_count}
        };
        instruments.push_back(std::move(row));
    }

    return json{
        {"schema", kSnapshotSchema},
        {"sequence", snap.sequence},
        {"as_of_us", to_epoch_us(snap.as_of)},
        {"session_started_us", to_epoch_us(snap.session_started)},
        {"total_accepted", snap.total_accepted},
        {"total_dropped", snap.total_dropped},
        {"latency", stats_json(snap.latency)},
        {"recent_latency", stats_json(snap.recent_latency)},
        {"instruments", std::move(instruments)}
    };
}

std::optional<RenderSnapshot> snapshot_from_json(const json& j) {
    try {
        if (j.value("schema", "") != kSnapshotSchema)
            return std::nullopt;

        RenderSnapshot snap;
        snap.sequence        = j.at("sequence").get<std::uint64_t>();
        snap.as_of           = from_epoch_us(j.at("as_of_us").get<std::int64_t>());
        snap.session_started = from_epoch_us(j.at("session_started_us").get<std::int64_t>());
        snap.total_accepted  = j.at("total_accepted").get<std::uint64_t>();
        snap.total_dropped   = j.at("total_dropped").get<std::uint64_t>();
        snap.latency         = stats_from(j.at("latency"));
        snap.recent_latency  = stats_from(j.at("recent_latency"));

        for (const auto& row : j.at("instruments")) {
            InstrumentState st;
            st.symbol         = row.at("symbol").get<std::string>();
            st.bid            = level_from(row.at("bid"));
            st.ask            = level_from(row.at("ask"));
            st.last           = opt_double(row.at("last"));
            st.spread         = opt_double(row.at("spread"));
            st.crossed        = row.at("crossed").get<bool>();
            st.previous_bid   = level_from(row.at("previous_bid"));
            st.previous_ask   = level_from(row.at("previous_ask"));
            st.previous_last  = opt_double(row.at("previous_last"));
            st.bid_direction  = direction_from(row.at("bid_direction"));
            st.ask_direction  = direction_from(row.at("ask_direction"));
            st.last_direction = direction_from(row.at("last_direction"));

            const json& exch = row.at("last_exchange_us");
            if (!exch.is_null())
                st.last_exchange_instant = from_epoch_us(exch.get<std::int64_t>());
            st.last_receive_instant = from_epoch_us(row.at("last_receive_us").get<std::int64_t>());
            st.last_latency_ms      = opt_double(row.at("last_latency_ms"));
            st.update_count         = row.at("update_count").get<std::uint64_t>();

            snap.instruments.emplace(st.symbol, std::move(st));
        }
        return snap;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}
