#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "core/ports/ITickSource.hpp"
#include "domain/Types.hpp"

namespace core {

enum class VolumeMode {
    TickCount,  // raw FX feeds carry no traded volume; count quotes instead
    SumField,   // sum Tick::volume, missing values count as 0
};

const char* volumeModeToString(VolumeMode mode) noexcept;
// Accepts "count" / "sum"; throws fxb::ConfigurationError otherwise.
VolumeMode volumeModeFromString(std::string_view text);

// Result of consuming one hour: either the hour's minute bars (possibly none) or a skip.
struct HourOutcome {
    enum class Kind {
        Bars,
        SkippedHour,
    };

    Kind kind{Kind::Bars};
    domain::TimestampMs hourStart{0};
    std::vector<domain::Bar> bars;
    std::string source;
    std::string reason;          // set for SkippedHour
    std::size_t droppedTicks{0}; // ticks outside the hour or with unusable prices

    bool skipped() const noexcept { return kind == Kind::SkippedHour; }

    static HourOutcome withBars(domain::TimestampMs hourStart, std::string source, std::vector<domain::Bar> bars);
    static HourOutcome skippedHour(domain::TimestampMs hourStart, std::string source, std::string reason);
};

// Turns one hour of ticks into sparse 1-minute bars. Holds no state between hours.
class MinuteBarBuilder {
public:
    explicit MinuteBarBuilder(VolumeMode volumeMode = VolumeMode::TickCount);

    HourOutcome consume(const TickHour& hour) const;

    VolumeMode volumeMode() const noexcept { return volumeMode_; }

private:
    struct Bucket {
        domain::TimestampMs minute{0};
        double open{0.0};
        double high{0.0};
        double low{0.0};
        double close{0.0};
        double volume{0.0};
        bool active{false};
    };

    double volumeOf(const domain::Tick& tick) const noexcept;
    void start(Bucket& bucket, domain::TimestampMs minute, const domain::Tick& tick) const;
    void update(Bucket& bucket, const domain::Tick& tick) const;
    static domain::Bar finalize(const Bucket& bucket);

    VolumeMode volumeMode_;
};

}  // namespace core
