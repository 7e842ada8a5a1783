#pragma once

#include <string>
#include <utility>
#include <vector>

#include "common/Log.hpp"
#include "domain/Types.hpp"

namespace fxb::common {

struct Config {
    fxb::log::Level logLevel = fxb::log::Level::Info;
    std::string dataRoot = "data_parquet";
    std::string ticksRoot = "download";
    std::vector<std::string> assets{"EURUSD"};
    std::vector<std::string> timeframes{"1m"};  // canonical labels
    std::string from;
    std::string to = "now";
    std::string volume = "count";
    std::string compression = "zstd";
    bool refresh = false;
    std::string diagnosticsPath;

    // Environment first, then flags. Throws fxb::ConfigurationError on invalid values.
    static Config fromArgs(int argc, char** argv);

    // [from, to] in UTC milliseconds; a date-only --to covers that whole day.
    // Throws fxb::ConfigurationError for unparsable dates and fxb::InvalidRangeError if to < from.
    std::pair<domain::TimestampMs, domain::TimestampMs> range() const;

    std::vector<domain::Timeframe> parsedTimeframes() const;
};

}  // namespace fxb::common
