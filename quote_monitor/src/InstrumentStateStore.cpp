#include "InstrumentStateStore.hpp"
#include "ChangeClassifier.hpp"

static std::optional<double> price_of(const std::optional<BookLevel>& lvl) {
    if (!lvl) return std::nullopt;
    return lvl->price;
}

InstrumentState InstrumentStateStore::apply(const std::string& symbol,
                                            const StateUpdate& u)
{
    std::lock_guard<std::mutex> lock(state_mtx_);

    auto [it, inserted] = state_.try_emplace(symbol);
    InstrumentState& st = it->second;
    if (inserted) {
        st.symbol = symbol;
    }

    // ---- PREVIOUS <- CURRENT, then overwrite ----
    if (u.bid) {
        st.bid_direction = ChangeClassifier::classify(u.bid->price, price_of(st.bid));
        st.previous_bid  = st.bid;
        st.bid           = u.bid;
    }
    if (u.ask) {
        st.ask_direction = ChangeClassifier::classify(u.ask->price, price_of(st.ask));
        st.previous_ask  = st.ask;
        st.ask           = u.ask;
    }
    if (u.last) {
        st.last_direction = ChangeClassifier::classify(*u.last, st.last);
        st.previous_last  = st.last;
        st.last           = u.last;
    }

    // ---- TIMESTAMPS ----
    // Invalid/missing exchange time keeps the previous instant and latency
    if (u.exchange_instant) {
        st.last_exchange_instant = u.exchange_instant;
        st.last_latency_ms       = u.latency_ms;
    }
    st.last_receive_instant = u.receive_instant;

    ++st.update_count;

    // ---- SPREAD ----
    if (st.bid && st.ask) {
        st.spread  = st.ask->price - st.bid->price;
        st.crossed = *st.spread < 0.0;
    } else {
        st.spread.reset();
        st.crossed = false;
    }

    return st;
}

std::map<std::string, InstrumentState> InstrumentStateStore::snapshot() const {
    std::lock_guard<std::mutex> lock(state_mtx_);
    return std::map<std::string, InstrumentState>(state_.begin(), state_.end());
}

std::optional<InstrumentState> InstrumentStateStore::find(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(state_mtx_);
    auto it = state_.find(symbol);
    if (it == state_.end())
        return std::nullopt;
    return it->second;
}

std::size_t InstrumentStateStore::size() const {
    std::lock_guard<std::mutex> lock(state_mtx_);
    return state_.size();
}

std::uint64_t InstrumentStateStore::total_updates() const {
    std::lock_guard<std::mutex> lock(state_mtx_);
    std::uint64_t total = 0;
    for (const auto& [sym, st] : state_) total += st.update_count;
    return total;
}

void InstrumentStateStore::reset() {
    std::lock_guard<std::mutex> lock(state_mtx_);
    state_.clear();
}
