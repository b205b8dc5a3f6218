#include "MessageAdapter.hpp"
#include <cerrno>
#include <cstdlib>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

// number or numeric string -> double
static std::optional<double> j_to_double(const json& v) {
    if (v.is_number())
        return v.get<double>();
    if (v.is_string()) {
        const std::string& s = v.get_ref<const std::string&>();
        if (s.empty()) return std::nullopt;
        char* end = nullptr;
        errno = 0;
        double d = std::strtod(s.c_str(), &end);
        if (errno != 0 || end != s.c_str() + s.size())
            return std::nullopt;
        return d;
    }
    return std::nullopt;
}

static const json* find_first(const json& obj, const std::vector<std::string>& keys) {
    if (!obj.is_object()) return nullptr;
    for (const auto& k : keys) {
        auto it = obj.find(k);
        if (it != obj.end() && !it->is_null())
            return &(*it);
    }
    return nullptr;
}

/* ================= FieldMapping ================= */

void FieldMapping::apply_overrides(const json& j) {
    if (j.is_null()) return;
    if (!j.is_object())
        throw std::runtime_error("fieldMapping must be an object");

    const std::pair<const char*, std::vector<std::string>*> fields[] = {
        {"envelope", &envelope},       {"symbol", &symbol},
        {"subscription", &subscription},
        {"bidLevels", &bid_levels},    {"askLevels", &ask_levels},
        {"bidPrice", &bid_price},      {"askPrice", &ask_price},
        {"bidVolume", &bid_volume},    {"askVolume", &ask_volume},
        {"levelPrice", &level_price},  {"levelVolume", &level_volume},
        {"last", &last},               {"timestamp", &timestamp},
    };

    for (const auto& [name, keys] : j.items()) {
        std::vector<std::string>* target = nullptr;
        for (const auto& f : fields) {
            if (name == f.first) { target = f.second; break; }
        }
        if (!target)
            throw std::runtime_error("fieldMapping: unknown field '" + name + "'");
        if (!keys.is_array())
            throw std::runtime_error("fieldMapping." + name + " must be an array of keys");

        std::vector<std::string> parsed;
        for (const auto& k : keys) {
            if (!k.is_string())
                throw std::runtime_error("fieldMapping." + name + " must contain strings");
            parsed.push_back(k.get<std::string>());
        }
        *target = std::move(parsed);
    }
}

/* ================= MessageAdapter ================= */

MessageAdapter::MessageAdapter(FieldMapping mapping)
    : mapping_(std::move(mapping))
{}

void MessageAdapter::bind_subscription(const std::string& id, const std::string& symbol) {
    std::lock_guard<std::mutex> lk(subs_mtx_);
    subscriptions_[id] = symbol;
}

void MessageAdapter::unbind_all() {
    std::lock_guard<std::mutex> lk(subs_mtx_);
    subscriptions_.clear();
}

std::optional<UpdateEvent> MessageAdapter::adapt(const std::string& raw, Instant received) const {
    json msg = json::parse(raw, nullptr, false);
    if (msg.is_discarded())
        return std::nullopt;
    return adapt(msg, received);
}

std::optional<BookLevel> MessageAdapter::parse_level(const json& v) const {
    BookLevel lvl;
    if (v.is_object()) {
        const json* px = find_first(v, mapping_.level_price);
        if (!px) return std::nullopt;
        auto p = j_to_double(*px);
        if (!p) return std::nullopt;
        lvl.price = *p;
        if (const json* qty = find_first(v, mapping_.level_volume)) {
            lvl.volume = j_to_double(*qty).value_or(0.0);
        }
        return lvl;
    }
    if (v.is_array() && !v.empty()) {
        auto p = j_to_double(v[0]);
        if (!p) return std::nullopt;
        lvl.price = *p;
        if (v.size() >= 2) {
            lvl.volume = j_to_double(v[1]).value_or(0.0);
        }
        return lvl;
    }
    return std::nullopt;
}

std::optional<BookLevel> MessageAdapter::read_side(const json& body,
                                                   const std::vector<std::string>& level_keys,
                                                   const std::vector<std::string>& price_keys,
                                                   const std::vector<std::string>& volume_keys) const
{
    // 1) level list, best first: "bids": [{"price":..,"volume":..}, ...]
    if (const json* lvls = find_first(body, level_keys)) {
        if (lvls->is_array() && !lvls->empty())
            return parse_level(lvls->front());
        return std::nullopt;
    }

    // 2) flat best price: "bid": 101.5 / "b": "101.5"
    //    some venues reuse the short key for a level list: "b": [["101.5","3"], ...]
    const json* px = find_first(body, price_keys);
    if (!px) return std::nullopt;

    if (px->is_array()) {
        if (px->empty()) return std::nullopt;
        const json& first = px->front();
        if (first.is_array() || first.is_object())
            return parse_level(first);
        return parse_level(*px);  // single [price, volume]
    }
    if (px->is_object())
        return parse_level(*px);

    auto p = j_to_double(*px);
    if (!p) return std::nullopt;

    BookLevel lvl;
    lvl.price = *p;
    if (const json* qty = find_first(body, volume_keys)) {
        lvl.volume = j_to_double(*qty).value_or(0.0);
    }
    return lvl;
}

std::optional<std::string> MessageAdapter::resolve_symbol(const json& top, const json& body) const {
    for (const json* obj : {&body, &top}) {
        if (const json* s = find_first(*obj, mapping_.symbol)) {
            if (s->is_string()) return s->get<std::string>();
        }
    }
    for (const json* obj : {&top, &body}) {
        if (const json* id = find_first(*obj, mapping_.subscription)) {
            if (!id->is_string()) continue;
            std::lock_guard<std::mutex> lk(subs_mtx_);
            auto it = subscriptions_.find(id->get<std::string>());
            if (it != subscriptions_.end()) return it->second;
        }
    }
    return std::nullopt;
}

std::optional<UpdateEvent> MessageAdapter::adapt(const json& msg, Instant received) const {
    if (!msg.is_object())
        return std::nullopt;

    // ALOR-style envelope: {"data": {...}, "guid": "..."}
    const json* body = &msg;
    if (const json* inner = find_first(msg, mapping_.envelope)) {
        if (inner->is_object()) body = inner;
    }

    UpdateEvent ev;
    ev.receive_instant = received;
    ev.symbol = resolve_symbol(msg, *body).value_or("");

    ev.bid = read_side(*body, mapping_.bid_levels, mapping_.bid_price, mapping_.bid_volume);
    ev.ask = read_side(*body, mapping_.ask_levels, mapping_.ask_price, mapping_.ask_volume);

    if (const json* lp = find_first(*body, mapping_.last)) {
        ev.last = j_to_double(*lp);
    }

    const json* ts = find_first(*body, mapping_.timestamp);
    if (!ts) ts = find_first(msg, mapping_.timestamp);
    if (ts) {
        if (ts->is_number_integer())
            ev.raw_timestamp = RawTimestamp(ts->get<std::int64_t>());
        else if (ts->is_number_float())
            ev.raw_timestamp = RawTimestamp(ts->get<double>());
        else if (ts->is_string())
            ev.raw_timestamp = RawTimestamp(ts->get<std::string>());
    }

    return ev;
}
