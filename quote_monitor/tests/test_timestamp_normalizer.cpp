// tests/test_timestamp_normalizer.cpp
#include "test_assert.hpp"

#include "TimestampNormalizer.hpp"

#include <cmath>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <limits>
#include <string>

int main() {
  using TN = TimestampNormalizer;

  // zone-naive cases below depend on the local zone
  setenv("TZ", "UTC0", 1);
  tzset();

  // --- 13 digits = ms, 10 digits = s, same instant ---
  RawTimestamp ms = std::int64_t{1690000000000};
  RawTimestamp s  = std::int64_t{1690000000};
  ASSERT_TRUE(TN::detect_encoding(ms) == TimestampEncoding::EpochMilliseconds);
  ASSERT_TRUE(TN::detect_encoding(s) == TimestampEncoding::EpochSeconds);

  auto a = TN::normalize(ms);
  auto b = TN::normalize(s);
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  ASSERT_TRUE(*a == *b);
  ASSERT_EQ(to_epoch_us(*a), 1690000000000000LL);

  // --- floating forms keep sub-unit precision ---
  auto f = TN::normalize(RawTimestamp(1690000000.25));
  ASSERT_TRUE(f.has_value());
  ASSERT_EQ(to_epoch_us(*f), 1690000000250000LL);

  auto fm = TN::normalize(RawTimestamp(1690000000123.0));
  ASSERT_TRUE(fm.has_value());
  ASSERT_EQ(to_epoch_us(*fm), 1690000000123000LL);

  // --- boundaries: exactly 1e12 is seconds, exactly 1e9 is invalid ---
  ASSERT_TRUE(TN::detect_encoding(RawTimestamp(std::int64_t{1000000000000})) == TimestampEncoding::EpochSeconds);
  ASSERT_TRUE(TN::detect_encoding(RawTimestamp(std::int64_t{1000000000001})) == TimestampEncoding::EpochMilliseconds);
  ASSERT_FALSE(TN::normalize(RawTimestamp(std::int64_t{1000000000})).has_value());
  ASSERT_FALSE(TN::normalize(RawTimestamp(std::int64_t{0})).has_value());
  ASSERT_FALSE(TN::normalize(RawTimestamp(std::int64_t{-1690000000})).has_value());

  // --- non-finite and unrepresentable numbers ---
  ASSERT_FALSE(TN::normalize(RawTimestamp(std::numeric_limits<double>::quiet_NaN())).has_value());
  ASSERT_FALSE(TN::normalize(RawTimestamp(std::numeric_limits<double>::infinity())).has_value());
  ASSERT_FALSE(TN::normalize(RawTimestamp(std::numeric_limits<std::int64_t>::max())).has_value());
  ASSERT_FALSE(TN::normalize(RawTimestamp(1e300)).has_value());

  // --- ISO-8601 ---
  auto z = TN::normalize(RawTimestamp(std::string("2023-07-22T04:26:40Z")));
  ASSERT_TRUE(z.has_value());
  ASSERT_EQ(to_epoch_us(*z), 1690000000000000LL);

  // --- zone-naive text is local wall time ---
  setenv("TZ", "MSK-3", 1);    // Moscow, UTC+3, no DST
  tzset();

  auto naive = TN::normalize(RawTimestamp(std::string("2023-07-22T07:26:40")));
  ASSERT_TRUE(naive.has_value());
  ASSERT_TRUE(*naive == *z);

  auto hhmm = TN::parse_iso8601("2023-07-22T07:26");
  ASSERT_TRUE(hhmm.has_value());
  ASSERT_EQ(to_epoch_us(*hhmm), 1689999960000000LL);

  auto naive_frac = TN::parse_iso8601("2023-07-22T07:26:40.250");
  ASSERT_TRUE(naive_frac.has_value());
  ASSERT_EQ(to_epoch_us(*naive_frac), 1690000000250000LL);

  // an explicit zone ignores the local one
  ASSERT_TRUE(*TN::parse_iso8601("2023-07-22T04:26Z") == from_epoch_us(1689999960000000LL));
  ASSERT_FALSE(TN::parse_iso8601("2023-07-22T07:26.5").has_value());
  ASSERT_FALSE(TN::parse_iso8601("2023-07-22T07").has_value());

  setenv("TZ", "UTC0", 1);
  tzset();
  ASSERT_TRUE(*TN::normalize(RawTimestamp(std::string("2023-07-22T04:26:40"))) == *z);

  auto frac = TN::parse_iso8601("2023-07-22 04:26:40.123456789");
  ASSERT_TRUE(frac.has_value());
  ASSERT_EQ(to_epoch_us(*frac), 1690000000123456LL);

  auto ms3 = TN::parse_iso8601("2023-07-22T04:26:40.5Z");
  ASSERT_TRUE(ms3.has_value());
  ASSERT_EQ(to_epoch_us(*ms3), 1690000000500000LL);

  // +03:00 (Moscow) is three hours ahead of UTC
  auto msk = TN::parse_iso8601("2023-07-22T07:26:40+03:00");
  ASSERT_TRUE(msk.has_value());
  ASSERT_TRUE(*msk == *z);

  auto compact = TN::parse_iso8601("2023-07-22T01:26:40-0300");
  ASSERT_TRUE(compact.has_value());
  ASSERT_TRUE(*compact == *z);

  ASSERT_TRUE(TN::parse_iso8601("2024-02-29T00:00:00Z").has_value());

  // --- malformed text ---
  ASSERT_FALSE(TN::parse_iso8601("").has_value());
  ASSERT_FALSE(TN::parse_iso8601("not a time").has_value());
  ASSERT_FALSE(TN::parse_iso8601("2023-07-22").has_value());
  ASSERT_FALSE(TN::parse_iso8601("2023-13-01T00:00:00").has_value());
  ASSERT_FALSE(TN::parse_iso8601("2023-02-29T00:00:00").has_value());
  ASSERT_FALSE(TN::parse_iso8601("2023-07-22T24:00:00").has_value());
  ASSERT_FALSE(TN::parse_iso8601("2023-07-22T04:26:40.").has_value());
  ASSERT_FALSE(TN::parse_iso8601("2023-07-22T04:26:40 UTC").has_value());
  ASSERT_FALSE(TN::parse_iso8601("1690000000000").has_value());
  ASSERT_TRUE(TN::detect_encoding(RawTimestamp(std::string("garbage"))) == TimestampEncoding::Invalid);

  // --- latency: receive - exchange, negative allowed ---
  Instant exch = from_epoch_us(1690000000000000LL);
  ASSERT_NEAR(TN::latency_ms(from_epoch_us(1690000000125000LL), exch), 125.0, 1e-9);
  ASSERT_NEAR(TN::latency_ms(from_epoch_us(1689999999960000LL), exch), -40.0, 1e-9);
  ASSERT_NEAR(TN::latency_ms(from_epoch_us(1690000000000500LL), exch), 0.5, 1e-9);

  std::cout << "All timestamp_normalizer tests passed.\n";
  return 0;
}
