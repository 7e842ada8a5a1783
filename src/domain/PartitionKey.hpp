#pragma once

#include <string>
#include <tuple>

#include "domain/Types.hpp"

namespace domain {

// Identifies one physical partition: all bars of (asset, timeframe) in one UTC calendar month.
struct PartitionKey {
    Asset asset;
    std::string timeframe;  // canonical label, e.g. "1h"
    int year{1970};
    unsigned month{1};

    TimestampMs startMs() const noexcept;
    // Exclusive upper bound.
    TimestampMs endMs() const noexcept;
    std::string toString() const;
};

inline bool operator==(const PartitionKey& lhs, const PartitionKey& rhs) {
    return std::tie(lhs.asset, lhs.timeframe, lhs.year, lhs.month) ==
           std::tie(rhs.asset, rhs.timeframe, rhs.year, rhs.month);
}

inline bool operator<(const PartitionKey& lhs, const PartitionKey& rhs) {
    return std::tie(lhs.asset, lhs.timeframe, lhs.year, lhs.month) <
           std::tie(rhs.asset, rhs.timeframe, rhs.year, rhs.month);
}

PartitionKey partitionKeyFor(const Asset& asset, const Timeframe& timeframe, TimestampMs ts);

}  // namespace domain
