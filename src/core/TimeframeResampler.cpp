#include "core/TimeframeResampler.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "common/Errors.hpp"
#include "domain/TimeUtils.hpp"

namespace core {

std::vector<domain::Bar> resample(const std::vector<domain::Bar>& minuteBars, const domain::Timeframe& target) {
    if (domain::timeframeLabel(target).empty()) {
        throw fxb::ConfigurationError("Unsupported resample target of " + std::to_string(target.ms) + " ms");
    }

    for (std::size_t i = 1; i < minuteBars.size(); ++i) {
        if (minuteBars[i].ts <= minuteBars[i - 1].ts) {
            throw std::invalid_argument("resample: minute bars must be strictly increasing, offending bar at " +
                                        domain::formatUtc(minuteBars[i].ts));
        }
    }

    if (target == domain::timeframes::kOneMinute) {
        return minuteBars;
    }

    std::vector<domain::Bar> out;
    out.reserve(minuteBars.size() / static_cast<std::size_t>(target.ms / domain::time::kMillisPerMinute) + 1);

    for (const auto& bar : minuteBars) {
        const auto window = target.alignDown(bar.ts);
        if (out.empty() || out.back().ts != window) {
            out.push_back(domain::Bar{window, bar.open, bar.high, bar.low, bar.close, bar.volume});
            continue;
        }
        auto& current = out.back();
        current.high = std::max(current.high, bar.high);
        current.low = std::min(current.low, bar.low);
        current.close = bar.close;
        current.volume += bar.volume;
    }
    return out;
}

}  // namespace core
