#include "app/IncrementalUpdateCoordinator.hpp"

#include <algorithm>
#include <exception>
#include <optional>
#include <string>
#include <utility>

#include "common/Errors.hpp"
#include "common/Log.hpp"
#include "core/TimeframeResampler.hpp"
#include "domain/TimeUtils.hpp"

namespace app {
namespace {

std::vector<domain::Timeframe> normalizeTimeframes(std::vector<domain::Timeframe> timeframes) {
    std::sort(timeframes.begin(), timeframes.end());
    timeframes.erase(std::unique(timeframes.begin(), timeframes.end()), timeframes.end());
    return timeframes;
}

bool containsMinutes(const std::vector<domain::Timeframe>& timeframes) {
    return std::find(timeframes.begin(), timeframes.end(), domain::timeframes::kOneMinute) != timeframes.end();
}

}  // namespace

IncrementalUpdateCoordinator::IncrementalUpdateCoordinator(core::ITickSource& ticks,
                                                           core::PartitionStore& store,
                                                           core::MinuteBarBuilder builder,
                                                           core::IDiagnosticSink* diagnostics)
    : ticks_(ticks), store_(store), builder_(builder), diagnostics_(diagnostics) {}

void IncrementalUpdateCoordinator::validate(const UpdateRequest& request) {
    core::validateAssetName(request.asset);
    if (request.end < request.start) {
        throw fxb::InvalidRangeError("end (" + domain::formatUtc(request.end) + ") is before start (" +
                                     domain::formatUtc(request.start) + ")");
    }
    if (request.timeframes.empty()) {
        throw fxb::ConfigurationError("at least one timeframe is required");
    }
    for (const auto& timeframe : request.timeframes) {
        if (domain::timeframeLabel(timeframe).empty()) {
            throw fxb::ConfigurationError("unsupported timeframe of " + std::to_string(timeframe.ms) + " ms");
        }
    }
}

RunReport IncrementalUpdateCoordinator::run(const UpdateRequest& request) {
    validate(request);

    RunReport report;
    report.asset = request.asset;
    report.requestedStart = request.start;
    report.requestedEnd = request.end;

    const auto timeframes = normalizeTimeframes(request.timeframes);
    for (const auto& timeframe : timeframes) {
        report.timeframes[domain::timeframeLabel(timeframe)];
    }
    const bool storesMinutes = containsMinutes(timeframes);
    const auto& widest = timeframes.back();

    const auto effectiveStart = resolveStart(request);
    report.effectiveStart = effectiveStart;

    LOG_INFO("Update started asset=" << request.asset << " from=" << domain::formatUtc(effectiveStart)
                                     << " to=" << domain::formatUtc(request.end)
                                     << " timeframes=" << timeframes.size());

    auto cursor = effectiveStart;
    while (cursor <= request.end) {
        const auto date = domain::civilDateOf(cursor);
        Chunk chunk;
        chunk.monthStart = domain::monthStartMs(date.year, date.month);
        chunk.monthEnd = domain::nextMonthStartMs(date.year, date.month) - 1;
        chunk.start = cursor;
        chunk.end = std::min(request.end, chunk.monthEnd);

        auto minuteBars = buildMinuteBars(request.asset, chunk, report);
        report.minuteBarsBuilt += minuteBars.size();

        if (storesMinutes) {
            store(request.asset, domain::timeframes::kOneMinute, minuteBars, report);
        }

        if (widest != domain::timeframes::kOneMinute) {
            const auto input = resampleInput(request.asset, chunk, widest, minuteBars);
            for (const auto& timeframe : timeframes) {
                if (timeframe == domain::timeframes::kOneMinute) {
                    continue;
                }
                auto bars = core::resample(input, timeframe);
                // Edge-completion bars only feed the windows cut by the chunk.
                bars.erase(std::remove_if(bars.begin(), bars.end(),
                                          [&](const domain::Bar& bar) {
                                              return bar.ts + timeframe.ms - 1 < chunk.start || bar.ts > chunk.end;
                                          }),
                           bars.end());
                store(request.asset, timeframe, bars, report);
            }
        }

        LOG_INFO("Update progress asset=" << request.asset << " month=" << date.year << '-'
                                          << (date.month < 10 ? "0" : "") << date.month
                                          << " minuteBars=" << minuteBars.size()
                                          << " hoursSkipped=" << report.hoursSkipped);

        if (chunk.monthEnd >= request.end) {
            break;
        }
        cursor = chunk.monthEnd + 1;
    }

    report.completed = true;
    LOG_INFO("Update finished asset=" << request.asset << " hours=" << report.hoursProcessed
                                      << " skipped=" << report.hoursSkipped
                                      << " warnings=" << report.warnings.size());
    return report;
}

std::vector<RunReport> IncrementalUpdateCoordinator::runAll(const std::vector<UpdateRequest>& requests) {
    for (const auto& request : requests) {
        validate(request);
    }

    std::vector<RunReport> reports;
    reports.reserve(requests.size());
    for (const auto& request : requests) {
        reports.push_back(run(request));
    }
    return reports;
}

domain::TimestampMs IncrementalUpdateCoordinator::resolveStart(const UpdateRequest& request) {
    if (!request.refresh) {
        return request.start;
    }

    std::optional<domain::TimestampMs> last;
    try {
        last = store_.lastTimestamp(request.asset, domain::timeframes::kOneMinute);
    } catch (const fxb::CorruptPartitionError& ex) {
        LOG_WARN("Refresh: unable to read last stored 1m bar for " << request.asset << ": " << ex.what()
                                                                    << "; keeping requested start");
        return request.start;
    }

    if (!last) {
        LOG_INFO("Refresh: no stored 1m data for " << request.asset << ", starting at requested start");
        return request.start;
    }

    const auto resumeAt = std::min(std::max(request.start, domain::floorToHourMs(*last)), request.end);
    LOG_INFO("Refresh: resuming " << request.asset << " at " << domain::formatUtc(resumeAt));
    return resumeAt;
}

std::vector<domain::Bar> IncrementalUpdateCoordinator::buildMinuteBars(const domain::Asset& asset,
                                                                       const Chunk& chunk,
                                                                       RunReport& report) {
    std::vector<domain::Bar> minuteBars;

    const auto lastHour = domain::floorToHourMs(chunk.end);
    for (auto hour = domain::floorToHourMs(chunk.start); hour <= lastHour; hour += domain::time::kMillisPerHour) {
        core::TickHour tickHour;
        try {
            tickHour = ticks_.fetchHour(asset, hour);
        } catch (const std::exception& ex) {
            tickHour = core::TickHour::unavailable(hour, {}, std::string{"tick source error: "} + ex.what());
        }

        const auto outcome = builder_.consume(tickHour);
        if (outcome.skipped()) {
            ++report.hoursSkipped;
            core::Diagnostic diagnostic;
            diagnostic.timestampUtc = outcome.hourStart;
            diagnostic.kind = core::DiagnosticKind::SkippedHour;
            diagnostic.asset = asset;
            diagnostic.source = outcome.source;
            diagnostic.reason = outcome.reason;
            warn(report, std::move(diagnostic));
            continue;
        }

        ++report.hoursProcessed;
        for (const auto& bar : outcome.bars) {
            // The first and last hour may straddle the requested range.
            if (bar.ts < domain::floorToMinuteMs(chunk.start) || bar.ts > chunk.end) {
                continue;
            }
            minuteBars.push_back(bar);
        }
    }

    return minuteBars;
}

std::vector<domain::Bar> IncrementalUpdateCoordinator::resampleInput(const domain::Asset& asset,
                                                                     const Chunk& chunk,
                                                                     const domain::Timeframe& widest,
                                                                     const std::vector<domain::Bar>& minuteBars) {
    const auto windowStart = std::max(widest.alignDown(chunk.start), chunk.monthStart);
    const auto windowEnd = std::min(widest.alignDown(chunk.end) + widest.ms - 1, chunk.monthEnd);
    const auto bufferStart = domain::floorToMinuteMs(chunk.start);

    std::vector<domain::Bar> left;
    std::vector<domain::Bar> right;
    try {
        if (windowStart < bufferStart) {
            left = store_.readBars(asset, domain::timeframes::kOneMinute, windowStart, bufferStart - 1);
        }
        if (windowEnd > chunk.end) {
            right = store_.readBars(asset, domain::timeframes::kOneMinute, chunk.end + 1, windowEnd);
        }
    } catch (const fxb::CorruptPartitionError& ex) {
        LOG_WARN("Update: cannot complete edge windows for " << asset << " from stored 1m data: " << ex.what());
        left.clear();
        right.clear();
    }

    if (left.empty() && right.empty()) {
        return minuteBars;
    }

    std::vector<domain::Bar> combined;
    combined.reserve(left.size() + minuteBars.size() + right.size());
    combined.insert(combined.end(), left.begin(), left.end());
    combined.insert(combined.end(), minuteBars.begin(), minuteBars.end());
    combined.insert(combined.end(), right.begin(), right.end());
    LOG_DEBUG("Update: completed edge windows with " << left.size() << " + " << right.size()
                                                     << " stored 1m bars");
    return combined;
}

void IncrementalUpdateCoordinator::store(const domain::Asset& asset,
                                         const domain::Timeframe& timeframe,
                                         const std::vector<domain::Bar>& bars,
                                         RunReport& report) {
    if (bars.empty()) {
        return;
    }

    const auto label = domain::timeframeLabel(timeframe);
    auto& stats = report.timeframes[label];
    const auto summary = store_.writeBars(asset, timeframe, bars);
    for (const auto& partition : summary.partitions) {
        if (partition.ok) {
            ++stats.partitionsWritten;
            stats.barsWritten += partition.incomingBars;
            continue;
        }

        ++stats.partitionsFailed;
        core::Diagnostic diagnostic;
        diagnostic.timestampUtc = partition.key.startMs();
        diagnostic.kind = core::DiagnosticKind::PartitionWriteFailed;
        diagnostic.asset = asset;
        diagnostic.timeframe = label;
        diagnostic.source = partition.path;
        diagnostic.reason = partition.failureReason;
        warn(report, std::move(diagnostic));
    }
}

void IncrementalUpdateCoordinator::warn(RunReport& report, core::Diagnostic diagnostic) {
    if (diagnostics_ != nullptr) {
        diagnostics_->emit(diagnostic);
    }
    report.warnings.push_back(std::move(diagnostic));
}

}  // namespace app
