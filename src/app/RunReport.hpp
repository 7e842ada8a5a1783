#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include <boost/json/object.hpp>

#include "core/ports/IDiagnosticSink.hpp"
#include "domain/Types.hpp"

namespace app {

struct TimeframeStats {
    std::size_t barsWritten{0};
    std::size_t partitionsWritten{0};
    std::size_t partitionsFailed{0};
};

// Outcome of one asset run. Per-hour and per-partition failures end up in `warnings`;
// structural errors never produce a report (they are thrown).
struct RunReport {
    domain::Asset asset;
    domain::TimestampMs requestedStart{0};
    domain::TimestampMs requestedEnd{0};
    domain::TimestampMs effectiveStart{0};
    std::size_t hoursProcessed{0};
    std::size_t hoursSkipped{0};
    std::size_t minuteBarsBuilt{0};
    std::map<std::string, TimeframeStats> timeframes;  // keyed by canonical label
    std::vector<core::Diagnostic> warnings;
    bool completed{false};

    bool ok() const noexcept { return completed; }
    bool hasWarnings() const noexcept { return !warnings.empty(); }
};

boost::json::object toJson(const RunReport& report);

}  // namespace app
