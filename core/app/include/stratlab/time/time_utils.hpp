#pragma once

#include "stratlab/domain/price_bar.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace stratlab {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Free functions converting between Timestamp, epoch milliseconds,
//         civil dates and ISO-8601 text.
//
// @details
// Market data arrives timezone-naive. Every conversion here treats such
// values as UTC so that results never depend on the host's TZ setting.
// Civil-date arithmetic uses the proleptic Gregorian calendar and does not
// go through std::mktime / timegm.
//
// Thread-safety: Stateless — safe to call from any thread.
// -----------------------------------------------------------------------------

// -------------------------------------------------------------------------
// ms_to_timestamp
// -------------------------------------------------------------------------
// @brief  Converts epoch milliseconds to a Timestamp.
// @param  ms  Milliseconds since 1970-01-01 00:00:00 UTC.
// -------------------------------------------------------------------------
inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

// -------------------------------------------------------------------------
// timestamp_to_ms
// -------------------------------------------------------------------------
// @brief  Converts a Timestamp to epoch milliseconds (truncating).
// -------------------------------------------------------------------------
inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// Days since 1970-01-01 for a proleptic Gregorian date. month is 1-12.
std::int64_t days_from_civil(int year, unsigned month, unsigned day);

// Builds a UTC Timestamp from calendar fields.
Timestamp make_timestamp(int year, unsigned month, unsigned day,
                         unsigned hour = 0, unsigned minute = 0,
                         unsigned second = 0);

// -------------------------------------------------------------------------
// parse_timestamp
// -------------------------------------------------------------------------
// @brief  Parses "YYYY-MM-DD", "YYYY-MM-DDTHH:MM[:SS]" or
//         "YYYY-MM-DD HH:MM[:SS]" (fractional seconds and a trailing 'Z'
//         are ignored).
//
// @return The UTC Timestamp, or std::nullopt if the text is not a date in
//         one of those shapes or a field is out of range.
// -------------------------------------------------------------------------
std::optional<Timestamp> parse_timestamp(const std::string& text);

// "YYYY-MM-DDTHH:MM:SS", UTC, whole seconds.
std::string to_iso8601(Timestamp tp);

// -------------------------------------------------------------------------
// calendar_days_between
// -------------------------------------------------------------------------
// @brief  Whole days elapsed from `from` to `to`, truncated toward zero.
//
// @details
// Two bars on the same calendar day, or less than 24h apart, yield 0. The
// annualised-return formula uses this as its exponent denominator and
// must guard the zero case itself.
// -------------------------------------------------------------------------
std::int64_t calendar_days_between(Timestamp from, Timestamp to);

}  // namespace stratlab
