#pragma once

#include <vector>

#include "app/RunReport.hpp"
#include "core/MinuteBarBuilder.hpp"
#include "core/PartitionStore.hpp"
#include "core/ports/IDiagnosticSink.hpp"
#include "core/ports/ITickSource.hpp"
#include "domain/Types.hpp"

namespace app {

struct UpdateRequest {
    domain::Asset asset;
    std::vector<domain::Timeframe> timeframes;
    domain::TimestampMs start{0};
    domain::TimestampMs end{0};
    // Resume from the hour of the newest stored 1m bar when it is later than `start`.
    bool refresh{false};
};

// Drives tick hours through the minute builder, resampler and partition store, one calendar
// month at a time. Holds one hour of ticks and one month of minute bars at most.
class IncrementalUpdateCoordinator {
public:
    IncrementalUpdateCoordinator(core::ITickSource& ticks,
                                 core::PartitionStore& store,
                                 core::MinuteBarBuilder builder = core::MinuteBarBuilder{},
                                 core::IDiagnosticSink* diagnostics = nullptr);

    // Throws fxb::InvalidRangeError / fxb::ConfigurationError before any I/O.
    RunReport run(const UpdateRequest& request);

    // Validates every request up front, then runs them in order.
    std::vector<RunReport> runAll(const std::vector<UpdateRequest>& requests);

private:
    struct Chunk {
        domain::TimestampMs start{0};
        domain::TimestampMs end{0};
        domain::TimestampMs monthStart{0};
        domain::TimestampMs monthEnd{0};  // inclusive
    };

    static void validate(const UpdateRequest& request);
    domain::TimestampMs resolveStart(const UpdateRequest& request);
    std::vector<domain::Bar> buildMinuteBars(const domain::Asset& asset, const Chunk& chunk, RunReport& report);
    std::vector<domain::Bar> resampleInput(const domain::Asset& asset,
                                           const Chunk& chunk,
                                           const domain::Timeframe& widest,
                                           const std::vector<domain::Bar>& minuteBars);
    void store(const domain::Asset& asset,
               const domain::Timeframe& timeframe,
               const std::vector<domain::Bar>& bars,
               RunReport& report);
    void warn(RunReport& report, core::Diagnostic diagnostic);

    core::ITickSource& ticks_;
    core::PartitionStore& store_;
    core::MinuteBarBuilder builder_;
    core::IDiagnosticSink* diagnostics_;
};

}  // namespace app
