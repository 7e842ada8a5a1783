#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "domain/Types.hpp"

namespace domain {

namespace time {
constexpr TimestampMs kMillisPerSecond = 1000;
constexpr TimestampMs kMillisPerMinute = 60 * kMillisPerSecond;
constexpr TimestampMs kMillisPerHour = 60 * kMillisPerMinute;
constexpr TimestampMs kMillisPerDay = 24 * kMillisPerHour;
}  // namespace time

inline TimestampMs floorToMinuteMs(TimestampMs ms) { return timeframes::kOneMinute.alignDown(ms); }
inline TimestampMs floorToHourMs(TimestampMs ms) { return timeframes::kOneHour.alignDown(ms); }
inline TimestampMs floorToDayMs(TimestampMs ms) { return timeframes::kOneDay.alignDown(ms); }

struct CivilDate {
    int year{1970};
    unsigned month{1};  // 1..12
    unsigned day{1};    // 1..31
};

// Proleptic Gregorian conversions (UTC, no leap seconds).
std::int64_t daysFromCivil(int year, unsigned month, unsigned day) noexcept;
CivilDate civilFromDays(std::int64_t days) noexcept;
CivilDate civilDateOf(TimestampMs ms) noexcept;

TimestampMs monthStartMs(int year, unsigned month) noexcept;
// First millisecond of the month after (year, month).
TimestampMs nextMonthStartMs(int year, unsigned month) noexcept;

// "YYYY-MM-DD" or "YYYY-MM-DDTHH:MM:SS" (optional trailing 'Z'), interpreted as UTC.
std::optional<TimestampMs> parseUtc(const std::string& text);

// "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::string formatUtc(TimestampMs ms);

TimestampMs nowMs();

}  // namespace domain
