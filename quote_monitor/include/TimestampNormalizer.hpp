#pragma once
#include "QuoteTypes.hpp"
#include <optional>
#include <string>

enum class TimestampEncoding {
    EpochMilliseconds,
    EpochSeconds,
    Iso8601,
    Invalid
};

class TimestampNormalizer {
public:
    // numeric > 1e12        -> epoch milliseconds
    // numeric in (1e9,1e12] -> epoch seconds
    // text                  -> ISO-8601, zone-naive read as local time
    static constexpr double kMillisThreshold  = 1e12;
    static constexpr double kSecondsThreshold = 1e9;

    static TimestampEncoding detect_encoding(const RawTimestamp& raw);

    // Empty result == InvalidTimestamp
    static std::optional<Instant> normalize(const RawTimestamp& raw);

    static std::optional<Instant> parse_iso8601(const std::string& text);

    // receive - exchange, may be negative (local clock behind exchange)
    static double latency_ms(Instant receive, Instant exchange) {
        return static_cast<double>((receive - exchange).count()) / 1000.0;
    }

    static const char* encoding_name(TimestampEncoding e);
};
