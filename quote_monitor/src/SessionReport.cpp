#include "SessionReport.hpp"
#include <iomanip>
#include <ios>

SessionReport build_session_report(const RenderSnapshot& snap, Instant now) {
    SessionReport r;
    r.uptime_sec = static_cast<double>((now - snap.session_started).count()) / 1e6;
    if (r.uptime_sec < 0.0) r.uptime_sec = 0.0;

    r.total_dropped = snap.total_dropped;
    r.latency       = snap.latency;
    if (snap.latency.count > 0)
        r.latency_grade = grade_latency(snap.latency.mean_ms);

    for (const auto& [sym, st] : snap.instruments) {
        InstrumentActivity a;
        a.symbol          = sym;
        a.updates         = st.update_count;
        a.rate_per_sec    = r.uptime_sec > 0.0 ? st.update_count / r.uptime_sec : 0.0;
        a.tier            = activity_by_rate(a.rate_per_sec);
        a.last_latency_ms = st.last_latency_ms;

        r.total_updates += st.update_count;
        r.instruments.push_back(std::move(a));
    }

    if (r.uptime_sec > 0.0)
        r.updates_per_sec = r.total_updates / r.uptime_sec;
    return r;
}

void print_session_report(std::ostream& out, const SessionReport& r) {
    const std::string rule(60, '=');

    // caller's stream (usually std::cout) gets its format back on return
    const std::ios::fmtflags saved_flags = out.flags();
    const std::streamsize saved_precision = out.precision();

    out << "\nSESSION STATISTICS\n" << rule << "\n";
    out.setf(std::ios::fixed);
    out << "uptime:          " << std::setprecision(0) << r.uptime_sec << " s\n";
    out << "total updates:   " << r.total_updates << "\n";
    out << "dropped events:  " << r.total_dropped << "\n";
    out << "update rate:     " << std::setprecision(1) << r.updates_per_sec << " /s\n";

    if (r.latency.count > 0) {
        out << "\nLATENCY\n";
        out << "   samples:      " << r.latency.count << "\n";
        out << "   mean:         " << std::setw(6) << r.latency.mean_ms << " ms\n";
        out << "   min:          " << std::setw(6) << r.latency.min_ms << " ms\n";
        out << "   max:          " << std::setw(6) << r.latency.max_ms << " ms\n";
        if (r.latency_grade)
            out << "   grade:        " << latency_grade_label(*r.latency_grade) << "\n";
    }

    if (!r.instruments.empty()) {
        out << "\nACTIVITY BY INSTRUMENT\n";
        for (const auto& a : r.instruments) {
            out << "   [" << std::left << std::setw(6) << activity_label(a.tier) << std::right << "] "
                << a.symbol << ": " << a.updates << " updates ("
                << std::setprecision(1) << a.rate_per_sec << "/s) | latency ";
            if (a.last_latency_ms)
                out << std::setprecision(0) << *a.last_latency_ms << " ms";
            else
                out << "N/A";
            out << "\n";
        }
    }
    out << rule << "\n";

    out.flags(saved_flags);
    out.precision(saved_precision);
}
