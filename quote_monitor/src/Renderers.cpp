#include "Renderers.hpp"
#include "ChangeClassifier.hpp"
#include "DisplayFormat.hpp"
#include "Log.hpp"
#include <exception>
#include <iomanip>
#include <sstream>

/* ================= ConsoleRenderer ================= */

ConsoleRenderer::ConsoleRenderer(std::ostream& out, bool clear_screen)
    : out_(out), clear_screen_(clear_screen)
{}

static std::string side_cell(const std::optional<BookLevel>& lvl, Direction d) {
    std::optional<double> px;
    if (lvl) px = lvl->price;
    return std::string(ChangeClassifier::indicator(d)) + format_price(px);
}

static std::string latency_cell(const std::optional<double>& ms) {
    if (!ms) return "N/A";
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss << std::setprecision(0) << *ms << "ms " << latency_grade_label(grade_latency(*ms));
    return oss.str();
}

std::string ConsoleRenderer::format_frame(const RenderSnapshot& snap) {
    std::ostringstream oss;
    const std::string rule(100, '=');
    const std::string thin(100, '-');

    const double uptime_s =
        static_cast<double>((snap.as_of - snap.session_started).count()) / 1e6;

    oss << rule << "\n";
    oss << "REAL-TIME QUOTE MONITOR  #" << snap.sequence << "\n";
    oss << rule << "\n";

    oss.setf(std::ios::fixed);
    oss << "uptime " << std::setprecision(0) << uptime_s << "s"
        << " | updates " << snap.total_accepted
        << " | dropped " << snap.total_dropped
        << " | avg latency ";
    if (snap.latency.count > 0)
        oss << std::setprecision(0) << snap.latency.mean_ms << "ms";
    else
        oss << "N/A";
    oss << "\n";

    oss << std::left
        << std::setw(10) << "Symbol"
        << std::setw(13) << "Bid"
        << std::setw(13) << "Ask"
        << std::setw(13) << "Last"
        << std::setw(10) << "Spread"
        << std::setw(16) << "Latency"
        << std::setw(14) << "Updates"
        << std::setw(12) << "Exch time"
        << "\n";
    oss << thin << "\n";

    for (const auto& [sym, st] : snap.instruments) {
        std::string spread = format_price(st.spread);
        if (st.crossed) spread += " X";

        const std::string updates = std::string(activity_label(activity_by_count(st.update_count)))
                                  + " " + std::to_string(st.update_count);
        const std::string exch = st.last_exchange_instant
                               ? format_clock(*st.last_exchange_instant)
                               : "N/A";

        oss << std::left
            << std::setw(10) << sym
            << std::setw(13) << side_cell(st.bid, st.bid_direction)
            << std::setw(13) << side_cell(st.ask, st.ask_direction)
            << std::setw(13) << (std::string(ChangeClassifier::indicator(st.last_direction)) + format_price(st.last))
            << std::setw(10) << spread
            << std::setw(16) << latency_cell(st.last_latency_ms)
            << std::setw(14) << updates
            << std::setw(12) << exch
            << "\n";
    }
    oss << thin << "\n";

    if (snap.recent_latency.count > 0) {
        oss << std::setprecision(0)
            << "latency (last " << snap.recent_latency.count << "): avg "
            << snap.recent_latency.mean_ms << "ms | range "
            << snap.recent_latency.min_ms << "-" << snap.recent_latency.max_ms << "ms\n";
    }
    oss << "refreshed " << format_clock(snap.as_of) << " UTC | Ctrl+C to exit\n";
    oss << rule << "\n";
    return oss.str();
}

void ConsoleRenderer::render(const RenderSnapshot& snap) {
    const std::string frame = format_frame(snap);

    std::lock_guard<std::mutex> lk(log_mutex());
    if (clear_screen_)
        out_ << "\x1b[2J\x1b[H";
    out_ << frame << std::flush;
}

/* ================= RendererFanout ================= */

void RendererFanout::render(const RenderSnapshot& snap) {
    for (auto& r : renderers_) {
        try {
            r->render(snap);
        } catch (const std::exception& ex) {
            log_error("RendererFanout", std::string("renderer failed: ") + ex.what());
        }
    }
}
