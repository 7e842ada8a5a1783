#include "domain/PartitionKey.hpp"

#include <cstdio>

#include "domain/TimeUtils.hpp"

namespace domain {

TimestampMs PartitionKey::startMs() const noexcept { return monthStartMs(year, month); }

TimestampMs PartitionKey::endMs() const noexcept { return nextMonthStartMs(year, month); }

std::string PartitionKey::toString() const {
    char period[16];
    std::snprintf(period, sizeof(period), "%04d-%02u", year, month);
    return asset + "/" + timeframe + "/" + period;
}

PartitionKey partitionKeyFor(const Asset& asset, const Timeframe& timeframe, TimestampMs ts) {
    const auto date = civilDateOf(ts);
    return PartitionKey{asset, timeframeLabel(timeframe), date.year, date.month};
}

}  // namespace domain
