#pragma once

#include <string>
#include <utility>
#include <vector>

#include "domain/Types.hpp"

namespace core {

// One hour of raw ticks as delivered by the acquisition side.
struct TickHour {
    domain::TimestampMs hourStart{0};
    std::string source;        // file path or URL the ticks came from
    bool available{true};      // false when the hour could not be obtained
    std::string failureReason; // set when !available
    std::vector<domain::Tick> ticks;

    static TickHour unavailable(domain::TimestampMs hourStart, std::string source, std::string reason) {
        TickHour hour;
        hour.hourStart = hourStart;
        hour.source = std::move(source);
        hour.available = false;
        hour.failureReason = std::move(reason);
        return hour;
    }
};

class ITickSource {
public:
    virtual ~ITickSource() = default;

    // Must not throw for a missing or unreadable hour; report it through TickHour::available.
    virtual TickHour fetchHour(const domain::Asset& asset, domain::TimestampMs hourStart) = 0;
};

}  // namespace core
