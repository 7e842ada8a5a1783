#include "domain/TimeUtils.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace domain {
namespace {

#if defined(_WIN32)
std::time_t timegm_compat(std::tm* tm) {
    return _mkgmtime(tm);
}
#else
std::time_t timegm_compat(std::tm* tm) {
    return timegm(tm);
}
#endif

std::int64_t floorDiv(std::int64_t value, std::int64_t divisor) noexcept {
    const auto q = value / divisor;
    return (value % divisor != 0 && value < 0) ? q - 1 : q;
}

}  // namespace

// Howard Hinnant's days_from_civil / civil_from_days.
std::int64_t daysFromCivil(int year, unsigned month, unsigned day) noexcept {
    const std::int64_t y = static_cast<std::int64_t>(year) - (month <= 2 ? 1 : 0);
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const auto yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

CivilDate civilFromDays(std::int64_t days) noexcept {
    days += 719468;
    const std::int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const auto doe = static_cast<unsigned>(days - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return CivilDate{static_cast<int>(y + (m <= 2 ? 1 : 0)), m, d};
}

CivilDate civilDateOf(TimestampMs ms) noexcept {
    return civilFromDays(floorDiv(ms, time::kMillisPerDay));
}

TimestampMs monthStartMs(int year, unsigned month) noexcept {
    return daysFromCivil(year, month, 1) * time::kMillisPerDay;
}

TimestampMs nextMonthStartMs(int year, unsigned month) noexcept {
    if (month >= 12) {
        return monthStartMs(year + 1, 1);
    }
    return monthStartMs(year, month + 1);
}

std::optional<TimestampMs> parseUtc(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }

    std::string value = text;
    if (!value.empty() && (value.back() == 'Z' || value.back() == 'z')) {
        value.pop_back();
    }

    std::tm tm{};
    std::istringstream input(value);
    if (value.size() > 10) {
        input >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    } else {
        input >> std::get_time(&tm, "%Y-%m-%d");
    }
    if (input.fail()) {
        return std::nullopt;
    }
    char trailing = 0;
    if (input >> trailing) {
        return std::nullopt;
    }

    tm.tm_isdst = 0;
    const std::tm parsed = tm;
    const auto raw = timegm_compat(&tm);
    if (raw == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    const auto result = static_cast<TimestampMs>(raw) * time::kMillisPerSecond;

    // timegm normalizes out-of-range fields (2024-02-30 becomes 2024-03-01); reject instead.
    const auto date = civilDateOf(result);
    const auto secondOfDay = (result - floorDiv(result, time::kMillisPerDay) * time::kMillisPerDay) /
                             time::kMillisPerSecond;
    if (date.year != parsed.tm_year + 1900 || date.month != static_cast<unsigned>(parsed.tm_mon + 1) ||
        date.day != static_cast<unsigned>(parsed.tm_mday) ||
        secondOfDay != parsed.tm_hour * 3600 + parsed.tm_min * 60 + parsed.tm_sec) {
        return std::nullopt;
    }
    return result;
}

std::string formatUtc(TimestampMs ms) {
    const auto days = floorDiv(ms, time::kMillisPerDay);
    const auto date = civilFromDays(days);
    auto rem = ms - days * time::kMillisPerDay;
    const auto hours = rem / time::kMillisPerHour;
    rem %= time::kMillisPerHour;
    const auto minutes = rem / time::kMillisPerMinute;
    rem %= time::kMillisPerMinute;
    const auto seconds = rem / time::kMillisPerSecond;
    const auto millis = rem % time::kMillisPerSecond;

    char buffer[32];
    std::snprintf(buffer,
                  sizeof(buffer),
                  "%04d-%02u-%02uT%02lld:%02lld:%02lld.%03lldZ",
                  date.year,
                  date.month,
                  date.day,
                  static_cast<long long>(hours),
                  static_cast<long long>(minutes),
                  static_cast<long long>(seconds),
                  static_cast<long long>(millis));
    return buffer;
}

TimestampMs nowMs() {
    const auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

}  // namespace domain
