#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace domain {

// Milliseconds since the Unix epoch, UTC.
using TimestampMs = std::int64_t;
using Asset = std::string;

struct Tick {
    TimestampMs ts{0};
    double bid{0.0};
    std::optional<double> ask;
    std::optional<double> volume;

    double price() const noexcept { return bid; }
};

struct Bar {
    TimestampMs ts{0};
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double close{0.0};
    double volume{0.0};
};

inline bool operator==(const Bar& lhs, const Bar& rhs) {
    return lhs.ts == rhs.ts && lhs.open == rhs.open && lhs.high == rhs.high && lhs.low == rhs.low &&
           lhs.close == rhs.close && lhs.volume == rhs.volume;
}

inline bool operator!=(const Bar& lhs, const Bar& rhs) { return !(lhs == rhs); }

using BarSeries = std::vector<Bar>;

// Fixed calendar granularity of a bar series. Every supported timeframe divides a UTC day,
// so its grid is anchored at the epoch.
struct Timeframe {
    TimestampMs ms{0};

    constexpr bool valid() const noexcept { return ms > 0; }
    constexpr TimestampMs alignDown(TimestampMs t) const noexcept {
        if (ms <= 0) {
            return t;
        }
        const auto q = t / ms;
        return (t % ms != 0 && t < 0) ? (q - 1) * ms : q * ms;
    }
    constexpr bool isAligned(TimestampMs t) const noexcept { return valid() && alignDown(t) == t; }
};

inline bool operator==(const Timeframe& lhs, const Timeframe& rhs) { return lhs.ms == rhs.ms; }
inline bool operator!=(const Timeframe& lhs, const Timeframe& rhs) { return lhs.ms != rhs.ms; }
inline bool operator<(const Timeframe& lhs, const Timeframe& rhs) { return lhs.ms < rhs.ms; }

namespace timeframes {
constexpr Timeframe kOneMinute{60'000};
constexpr Timeframe kFiveMinutes{5 * 60'000};
constexpr Timeframe kFifteenMinutes{15 * 60'000};
constexpr Timeframe kThirtyMinutes{30 * 60'000};
constexpr Timeframe kOneHour{3'600'000};
constexpr Timeframe kFourHours{4 * 3'600'000};
constexpr Timeframe kOneDay{86'400'000};
}  // namespace timeframes

const std::vector<Timeframe>& supportedTimeframes();

// Canonical on-disk label ("1m", "1h", "1D"); empty for unsupported values.
std::string timeframeLabel(const Timeframe& timeframe);

// Case-insensitive; accepts aliases such as "60m" or "24h". Returns an invalid
// Timeframe for anything outside the supported set.
Timeframe timeframeFromLabel(std::string_view label);

// Same as timeframeFromLabel but throws fxb::ConfigurationError.
Timeframe parseTimeframe(std::string_view label);

}  // namespace domain
