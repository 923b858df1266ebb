/**
 * @file CalendarDate.hpp
 * @brief Proleptic Gregorian calendar date used to identify analysis sessions.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace notedrift::domain {

/**
 * @struct CalendarDate
 * @brief A UTC calendar day. Sessions are keyed by this value.
 */
struct CalendarDate {
    int year = 1970;
    int month = 1;
    int day = 1;

    /** @brief Parses "YYYY-MM-DD". Returns nullopt for malformed or impossible dates. */
    static std::optional<CalendarDate> parse(const std::string& text);

    /** @brief UTC day containing the given epoch second. */
    static CalendarDate fromEpochSeconds(std::int64_t seconds);

    static CalendarDate fromDays(std::int64_t daysSinceEpoch);

    /** @brief Days since 1970-01-01. */
    std::int64_t toDays() const;

    /** @brief Epoch second of 00:00:00 UTC on this day. */
    std::int64_t toEpochSeconds() const { return toDays() * 86400; }

    /** @brief 1-based ordinal day within the year (1..366). */
    int dayOfYear() const;

    /** @brief YYYYMMDD as an integer; used as the per-session random seed. */
    std::uint32_t toSeed() const;

    std::string toString() const;

    bool operator==(const CalendarDate& o) const { return year == o.year && month == o.month && day == o.day; }
    bool operator!=(const CalendarDate& o) const { return !(*this == o); }
    bool operator<(const CalendarDate& o) const { return toDays() < o.toDays(); }
    bool operator<=(const CalendarDate& o) const { return !(o < *this); }
    bool operator>(const CalendarDate& o) const { return o < *this; }
    bool operator>=(const CalendarDate& o) const { return !(*this < o); }
};

} // namespace notedrift::domain
