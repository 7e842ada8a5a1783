#include "domain/Types.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include "common/Errors.hpp"

namespace domain {
namespace {

std::string normalizeLabel(std::string_view value) {
    std::string normalized;
    normalized.reserve(value.size());
    for (char ch : value) {
        if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
            continue;
        }
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return normalized;
}

}  // namespace

const std::vector<Timeframe>& supportedTimeframes() {
    static const std::vector<Timeframe> kSupported{
        timeframes::kOneMinute,
        timeframes::kFiveMinutes,
        timeframes::kFifteenMinutes,
        timeframes::kThirtyMinutes,
        timeframes::kOneHour,
        timeframes::kFourHours,
        timeframes::kOneDay,
    };
    return kSupported;
}

std::string timeframeLabel(const Timeframe& timeframe) {
    switch (timeframe.ms) {
    case timeframes::kOneMinute.ms:
        return "1m";
    case timeframes::kFiveMinutes.ms:
        return "5m";
    case timeframes::kFifteenMinutes.ms:
        return "15m";
    case timeframes::kThirtyMinutes.ms:
        return "30m";
    case timeframes::kOneHour.ms:
        return "1h";
    case timeframes::kFourHours.ms:
        return "4h";
    case timeframes::kOneDay.ms:
        return "1D";
    default:
        break;
    }
    return "";
}

Timeframe timeframeFromLabel(std::string_view label) {
    const auto normalized = normalizeLabel(label);

    if (normalized == "1m" || normalized == "1min" || normalized == "1minute") {
        return timeframes::kOneMinute;
    }
    if (normalized == "5m" || normalized == "5min") {
        return timeframes::kFiveMinutes;
    }
    if (normalized == "15m" || normalized == "15min") {
        return timeframes::kFifteenMinutes;
    }
    if (normalized == "30m" || normalized == "30min") {
        return timeframes::kThirtyMinutes;
    }
    if (normalized == "1h" || normalized == "60m" || normalized == "1hour") {
        return timeframes::kOneHour;
    }
    if (normalized == "4h" || normalized == "240m") {
        return timeframes::kFourHours;
    }
    if (normalized == "1d" || normalized == "1day" || normalized == "24h") {
        return timeframes::kOneDay;
    }
    return Timeframe{};
}

Timeframe parseTimeframe(std::string_view label) {
    const auto timeframe = timeframeFromLabel(label);
    if (!timeframe.valid()) {
        throw fxb::ConfigurationError("Unsupported timeframe: '" + std::string{label} + "'");
    }
    return timeframe;
}

}  // namespace domain
