#include <cmath>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/MinuteBarBuilder.hpp"
#include "domain/TimeUtils.hpp"

namespace {

constexpr domain::TimestampMs kHour = 1'704'164'400'000;  // 2024-01-02T03:00:00Z
constexpr domain::TimestampMs kMinute = 60'000;

domain::Tick tick(domain::TimestampMs ts, double bid, std::optional<double> volume = std::nullopt) {
    domain::Tick t;
    t.ts = ts;
    t.bid = bid;
    t.ask = bid + 0.0002;
    t.volume = volume;
    return t;
}

core::TickHour hourOf(std::vector<domain::Tick> ticks) {
    core::TickHour hour;
    hour.hourStart = kHour;
    hour.source = "memory";
    hour.ticks = std::move(ticks);
    return hour;
}

bool sameBar(const domain::Bar& bar, domain::TimestampMs ts, double o, double h, double l, double c, double v) {
    return bar.ts == ts && bar.open == o && bar.high == h && bar.low == l && bar.close == c && bar.volume == v;
}

void printBar(const domain::Bar& bar) {
    std::cerr << "  got ts=" << domain::formatUtc(bar.ts) << " o=" << bar.open << " h=" << bar.high
              << " l=" << bar.low << " c=" << bar.close << " v=" << bar.volume << "\n";
}

}  // namespace

int main() {
    const core::MinuteBarBuilder builder;

    // Four ticks inside one minute.
    {
        const auto outcome = builder.consume(hourOf({tick(kHour + 1'000, 1.1000), tick(kHour + 15'000, 1.1020),
                                                     tick(kHour + 30'000, 1.0990), tick(kHour + 59'999, 1.1010)}));
        if (outcome.skipped() || outcome.bars.size() != 1) {
            std::cerr << "Expected one bar for a single populated minute\n";
            return 1;
        }
        if (!sameBar(outcome.bars.front(), kHour, 1.1000, 1.1020, 1.0990, 1.1010, 4.0)) {
            std::cerr << "Unexpected OHLCV for single minute\n";
            printBar(outcome.bars.front());
            return 1;
        }
    }

    // Identical timestamps keep input order: earlier opens, later closes.
    {
        const auto outcome = builder.consume(hourOf({tick(kHour + 5'000, 1.2000), tick(kHour + 5'000, 1.2500),
                                                     tick(kHour + 5'000, 1.2100)}));
        if (outcome.bars.size() != 1 || !sameBar(outcome.bars.front(), kHour, 1.2000, 1.2500, 1.2000, 1.2100, 3.0)) {
            std::cerr << "Tie-break on identical timestamps is not stable\n";
            if (!outcome.bars.empty()) {
                printBar(outcome.bars.front());
            }
            return 1;
        }
    }

    // Out-of-order input is sorted, ties still stable.
    {
        const auto outcome = builder.consume(hourOf({tick(kHour + 2 * kMinute + 10, 1.3000),
                                                     tick(kHour + 10, 1.1000), tick(kHour + 10, 1.1500)}));
        if (outcome.bars.size() != 2) {
            std::cerr << "Expected two bars from unsorted ticks, got " << outcome.bars.size() << "\n";
            return 1;
        }
        if (!sameBar(outcome.bars[0], kHour, 1.1000, 1.1500, 1.1000, 1.1500, 2.0) ||
            !sameBar(outcome.bars[1], kHour + 2 * kMinute, 1.3000, 1.3000, 1.3000, 1.3000, 1.0)) {
            std::cerr << "Unexpected bars from unsorted ticks\n";
            printBar(outcome.bars[0]);
            printBar(outcome.bars[1]);
            return 1;
        }
    }

    // Sparse: ticks in minutes 0 and 5 give exactly two bars.
    {
        const auto outcome = builder.consume(hourOf({tick(kHour + 100, 1.0), tick(kHour + 5 * kMinute + 100, 1.1)}));
        if (outcome.bars.size() != 2 || outcome.bars[0].ts != kHour || outcome.bars[1].ts != kHour + 5 * kMinute) {
            std::cerr << "Empty minutes must not produce bars\n";
            return 1;
        }
    }

    // An hour without ticks is not a skip; it simply yields nothing.
    {
        const auto outcome = builder.consume(hourOf({}));
        if (outcome.skipped() || !outcome.bars.empty()) {
            std::cerr << "Expected empty, non-skipped outcome for an hour without ticks\n";
            return 1;
        }
    }

    // Unavailable hour becomes SkippedHour with the source reason.
    {
        const auto outcome = builder.consume(core::TickHour::unavailable(kHour, "http://feed/03h", "HTTP 503"));
        if (!outcome.skipped() || outcome.reason != "HTTP 503" || outcome.source != "http://feed/03h" ||
            outcome.hourStart != kHour || !outcome.bars.empty()) {
            std::cerr << "Unavailable hour was not reported as SkippedHour\n";
            return 1;
        }
    }

    // Ticks outside the hour or without a usable price are dropped and counted.
    {
        const auto outcome =
            builder.consume(hourOf({tick(kHour - 1, 1.0), tick(kHour + 10, 1.5),
                                    tick(kHour + 20, std::numeric_limits<double>::quiet_NaN()), tick(kHour + 30, -1.0),
                                    tick(kHour + 3'600'000, 2.0)}));
        if (outcome.droppedTicks != 4 || outcome.bars.size() != 1 ||
            !sameBar(outcome.bars.front(), kHour, 1.5, 1.5, 1.5, 1.5, 1.0)) {
            std::cerr << "Expected 4 dropped ticks and one clean bar, dropped=" << outcome.droppedTicks << "\n";
            return 1;
        }
    }

    // Sum mode adds the volume field; missing volume counts as zero.
    {
        const core::MinuteBarBuilder summing(core::VolumeMode::SumField);
        const auto outcome =
            summing.consume(hourOf({tick(kHour + 1, 1.0, 2.5), tick(kHour + 2, 1.0), tick(kHour + 3, 1.0, 0.5)}));
        if (outcome.bars.size() != 1 || outcome.bars.front().volume != 3.0) {
            std::cerr << "Sum volume mode produced the wrong volume\n";
            return 1;
        }
        if (core::volumeModeFromString("SUM") != core::VolumeMode::SumField ||
            std::string{core::volumeModeToString(core::VolumeMode::TickCount)} != "count") {
            std::cerr << "Volume mode names do not round through\n";
            return 1;
        }
    }

    // Same input, same output.
    {
        std::vector<domain::Tick> ticks;
        for (int i = 0; i < 600; ++i) {
            ticks.push_back(tick(kHour + i * 5'000, 1.1 + 0.0001 * ((i * 7) % 13)));
        }
        const auto first = builder.consume(hourOf(ticks));
        const auto second = builder.consume(hourOf(ticks));
        if (first.bars != second.bars || first.bars.size() != 50) {
            std::cerr << "Builder is not deterministic or produced " << first.bars.size() << " bars\n";
            return 1;
        }
        for (std::size_t i = 1; i < first.bars.size(); ++i) {
            if (first.bars[i].ts <= first.bars[i - 1].ts) {
                std::cerr << "Bars are not in time order\n";
                return 1;
            }
        }
    }

    return 0;
}
