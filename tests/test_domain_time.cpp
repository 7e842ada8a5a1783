#include <iostream>
#include <string>
#include <vector>

#include "common/Errors.hpp"
#include "domain/PartitionKey.hpp"
#include "domain/TimeUtils.hpp"
#include "domain/Types.hpp"

int main() {
    namespace tf = domain::timeframes;

    // Civil conversions around leap days and month ends.
    const auto leap = domain::parseUtc("2024-02-29T23:59:59Z");
    if (!leap || domain::formatUtc(*leap) != "2024-02-29T23:59:59.000Z") {
        std::cerr << "Round trip through 2024-02-29 failed\n";
        return 1;
    }
    const auto date = domain::civilDateOf(*leap + 1'000);
    if (date.year != 2024 || date.month != 3 || date.day != 1) {
        std::cerr << "Expected 2024-03-01 one second after the leap day\n";
        return 1;
    }
    if (domain::monthStartMs(2024, 12) != 1'733'011'200'000 || domain::nextMonthStartMs(2024, 12) != 1'735'689'600'000) {
        std::cerr << "December month bounds are wrong\n";
        return 1;
    }
    if (domain::parseUtc("2024-01-02") != 1'704'153'600'000 || domain::parseUtc("2024-13-40") ||
        domain::parseUtc("yesterday") || domain::parseUtc("2024-01-02 trailing")) {
        std::cerr << "parseUtc accepted or rejected the wrong inputs\n";
        return 1;
    }
    if (domain::floorToHourMs(1'704'164'459'999) != 1'704'164'400'000 ||
        domain::floorToMinuteMs(-1) != -60'000) {
        std::cerr << "Floor helpers are wrong\n";
        return 1;
    }

    // Labels.
    if (domain::timeframeLabel(tf::kOneDay) != "1D" || domain::timeframeLabel(tf::kFourHours) != "4h" ||
        domain::timeframeLabel(domain::Timeframe{7 * 60'000}) != "") {
        std::cerr << "Unexpected canonical labels\n";
        return 1;
    }
    if (domain::timeframeFromLabel("1d") != tf::kOneDay || domain::timeframeFromLabel("60M") != tf::kOneHour ||
        domain::timeframeFromLabel("15m") != tf::kFifteenMinutes || domain::timeframeFromLabel("2h").valid()) {
        std::cerr << "Label parsing is wrong\n";
        return 1;
    }
    bool threw = false;
    try {
        domain::parseTimeframe("1w");
    } catch (const fxb::ConfigurationError&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "Expected ConfigurationError for 1w\n";
        return 1;
    }
    if (domain::supportedTimeframes().size() != 7) {
        std::cerr << "Expected seven supported timeframes\n";
        return 1;
    }

    // Partition keys.
    const auto key = domain::partitionKeyFor("EURUSD", tf::kOneHour, *leap);
    if (key.year != 2024 || key.month != 2 || key.timeframe != "1h" || key.toString() != "EURUSD/1h/2024-02" ||
        key.startMs() != domain::monthStartMs(2024, 2) || key.endMs() != domain::monthStartMs(2024, 3)) {
        std::cerr << "Unexpected key for the leap day\n";
        return 1;
    }

    // Calendar-invalid dates are rejected rather than rolled into the next month.
    for (const std::string bad : {"2024-02-30", "2023-02-29", "2024-04-31", "2024-01-02T24:00:00Z", "2024-13-01"}) {
        if (domain::parseUtc(bad)) {
            std::cerr << "Expected " << bad << " to be rejected\n";
            return 1;
        }
    }
    const auto leapDay = domain::parseUtc("2024-02-29");
    if (!leapDay || *leapDay != domain::monthStartMs(2024, 2) + 28 * domain::time::kMillisPerDay) {
        std::cerr << "2024-02-29 is a valid leap day\n";
        return 1;
    }

    return 0;
}
