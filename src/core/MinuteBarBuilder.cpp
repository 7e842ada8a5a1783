#include "core/MinuteBarBuilder.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>
#include <utility>

#include "common/Errors.hpp"
#include "common/Log.hpp"
#include "domain/TimeUtils.hpp"

namespace core {
namespace {

bool usablePrice(double price) {
    return std::isfinite(price) && price > 0.0;
}

bool byTimestamp(const domain::Tick* lhs, const domain::Tick* rhs) {
    return lhs->ts < rhs->ts;
}

}  // namespace

const char* volumeModeToString(VolumeMode mode) noexcept {
    switch (mode) {
    case VolumeMode::TickCount:
        return "count";
    case VolumeMode::SumField:
        return "sum";
    }
    return "count";
}

VolumeMode volumeModeFromString(std::string_view text) {
    std::string lower{text};
    for (auto& ch : lower) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    if (lower == "count" || lower == "ticks") {
        return VolumeMode::TickCount;
    }
    if (lower == "sum" || lower == "field") {
        return VolumeMode::SumField;
    }
    throw fxb::ConfigurationError("Unsupported volume mode: '" + std::string{text} + "'");
}

HourOutcome HourOutcome::withBars(domain::TimestampMs hourStart,
                                  std::string source,
                                  std::vector<domain::Bar> bars) {
    HourOutcome outcome;
    outcome.kind = Kind::Bars;
    outcome.hourStart = hourStart;
    outcome.source = std::move(source);
    outcome.bars = std::move(bars);
    return outcome;
}

HourOutcome HourOutcome::skippedHour(domain::TimestampMs hourStart, std::string source, std::string reason) {
    HourOutcome outcome;
    outcome.kind = Kind::SkippedHour;
    outcome.hourStart = hourStart;
    outcome.source = std::move(source);
    outcome.reason = std::move(reason);
    return outcome;
}

MinuteBarBuilder::MinuteBarBuilder(VolumeMode volumeMode) : volumeMode_(volumeMode) {}

HourOutcome MinuteBarBuilder::consume(const TickHour& hour) const {
    if (!hour.available) {
        LOG_WARN("MinuteBarBuilder: skipping hour " << domain::formatUtc(hour.hourStart) << " source="
                                                    << hour.source << " reason=" << hour.failureReason);
        return HourOutcome::skippedHour(hour.hourStart, hour.source, hour.failureReason);
    }

    const auto hourStart = domain::floorToHourMs(hour.hourStart);
    const auto hourEnd = hourStart + domain::time::kMillisPerHour;

    // Pointers keep the caller's order; stable_sort leaves equal timestamps in input order.
    std::vector<const domain::Tick*> ordered;
    ordered.reserve(hour.ticks.size());
    std::size_t dropped = 0;
    for (const auto& tick : hour.ticks) {
        if (tick.ts < hourStart || tick.ts >= hourEnd || !usablePrice(tick.price())) {
            ++dropped;
            continue;
        }
        ordered.push_back(&tick);
    }
    if (!std::is_sorted(ordered.begin(), ordered.end(), byTimestamp)) {
        LOG_DEBUG("MinuteBarBuilder: ticks out of order in " << hour.source << ", sorting");
        std::stable_sort(ordered.begin(), ordered.end(), byTimestamp);
    }
    if (dropped > 0) {
        LOG_WARN("MinuteBarBuilder: dropped " << dropped << " ticks outside hour "
                                              << domain::formatUtc(hourStart) << " or without usable price, source="
                                              << hour.source);
    }

    std::vector<domain::Bar> bars;
    bars.reserve(std::min<std::size_t>(ordered.size(), 60));

    Bucket bucket;
    for (const auto* tick : ordered) {
        const auto minute = domain::floorToMinuteMs(tick->ts);
        if (!bucket.active) {
            start(bucket, minute, *tick);
            continue;
        }
        if (minute != bucket.minute) {
            bars.push_back(finalize(bucket));
            start(bucket, minute, *tick);
            continue;
        }
        update(bucket, *tick);
    }
    if (bucket.active) {
        bars.push_back(finalize(bucket));
    }

    auto outcome = HourOutcome::withBars(hourStart, hour.source, std::move(bars));
    outcome.droppedTicks = dropped;
    return outcome;
}

double MinuteBarBuilder::volumeOf(const domain::Tick& tick) const noexcept {
    if (volumeMode_ == VolumeMode::TickCount) {
        return 1.0;
    }
    if (!tick.volume || !std::isfinite(*tick.volume) || *tick.volume < 0.0) {
        return 0.0;
    }
    return *tick.volume;
}

void MinuteBarBuilder::start(Bucket& bucket, domain::TimestampMs minute, const domain::Tick& tick) const {
    const auto price = tick.price();
    bucket.minute = minute;
    bucket.open = price;
    bucket.high = price;
    bucket.low = price;
    bucket.close = price;
    bucket.volume = volumeOf(tick);
    bucket.active = true;
}

void MinuteBarBuilder::update(Bucket& bucket, const domain::Tick& tick) const {
    const auto price = tick.price();
    bucket.high = std::max(bucket.high, price);
    bucket.low = std::min(bucket.low, price);
    bucket.close = price;
    bucket.volume += volumeOf(tick);
}

domain::Bar MinuteBarBuilder::finalize(const Bucket& bucket) {
    return domain::Bar{bucket.minute, bucket.open, bucket.high, bucket.low, bucket.close, bucket.volume};
}

}  // namespace core
