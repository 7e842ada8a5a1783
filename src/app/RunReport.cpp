#include "app/RunReport.hpp"

#include <cstdint>
#include <utility>

#include <boost/json/array.hpp>

#include "adapters/diag/JsonLinesDiagnosticSink.hpp"
#include "domain/TimeUtils.hpp"

namespace app {

boost::json::object toJson(const RunReport& report) {
    boost::json::object payload;
    payload["asset"] = report.asset;
    payload["status"] = report.ok() ? (report.hasWarnings() ? "completed_with_warnings" : "ok") : "incomplete";
    payload["from"] = domain::formatUtc(report.requestedStart);
    payload["to"] = domain::formatUtc(report.requestedEnd);
    payload["effective_from"] = domain::formatUtc(report.effectiveStart);
    payload["hours_processed"] = static_cast<std::uint64_t>(report.hoursProcessed);
    payload["hours_skipped"] = static_cast<std::uint64_t>(report.hoursSkipped);
    payload["minute_bars_built"] = static_cast<std::uint64_t>(report.minuteBarsBuilt);

    boost::json::object timeframes;
    for (const auto& [label, stats] : report.timeframes) {
        boost::json::object entry;
        entry["bars_written"] = static_cast<std::uint64_t>(stats.barsWritten);
        entry["partitions_written"] = static_cast<std::uint64_t>(stats.partitionsWritten);
        entry["partitions_failed"] = static_cast<std::uint64_t>(stats.partitionsFailed);
        timeframes[label] = std::move(entry);
    }
    payload["timeframes"] = std::move(timeframes);

    boost::json::array warnings;
    for (const auto& warning : report.warnings) {
        warnings.push_back(adapters::diag::toJson(warning));
    }
    payload["warnings"] = std::move(warnings);
    return payload;
}

}  // namespace app
