#include "core/PartitionStore.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <unistd.h>

#include "common/Errors.hpp"
#include "common/Log.hpp"
#include "domain/TimeUtils.hpp"

namespace fs = std::filesystem;

namespace core {
namespace {

constexpr const char* kAssetPrefix = "asset=";
constexpr const char* kTimeframePrefix = "tf=";
constexpr const char* kYearPrefix = "year=";
constexpr const char* kMonthPrefix = "month=";

std::string labelOrThrow(const domain::Timeframe& timeframe) {
    auto label = domain::timeframeLabel(timeframe);
    if (label.empty()) {
        throw fxb::ConfigurationError("Unsupported timeframe of " + std::to_string(timeframe.ms) + " ms");
    }
    return label;
}

void validateBar(const domain::Bar& bar, const domain::Timeframe& timeframe, const std::string& label) {
    const bool finite = std::isfinite(bar.open) && std::isfinite(bar.high) && std::isfinite(bar.low) &&
                        std::isfinite(bar.close) && std::isfinite(bar.volume);
    if (!finite) {
        throw fxb::InvalidBarError("Bar at " + domain::formatUtc(bar.ts) + " has non-finite fields");
    }
    if (bar.low > std::min(bar.open, bar.close) || bar.high < std::max(bar.open, bar.close)) {
        throw fxb::InvalidBarError("Bar at " + domain::formatUtc(bar.ts) + " violates low <= open,close <= high");
    }
    if (bar.volume < 0.0) {
        throw fxb::InvalidBarError("Bar at " + domain::formatUtc(bar.ts) + " has negative volume");
    }
    if (!timeframe.isAligned(bar.ts)) {
        throw fxb::InvalidBarError("Bar at " + domain::formatUtc(bar.ts) + " is not aligned to the " + label +
                                   " grid");
    }
}

std::optional<int> parseNumberAfter(const std::string& name, const std::string& prefix) {
    if (name.rfind(prefix, 0) != 0 || name.size() == prefix.size()) {
        return std::nullopt;
    }
    const auto digits = name.substr(prefix.size());
    if (!std::all_of(digits.begin(), digits.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
        return std::nullopt;
    }
    try {
        return std::stoi(digits);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

void removeQuietly(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        LOG_WARN("PartitionStore: unable to remove temporary file " << path << ": " << ec.message());
    }
}

}  // namespace

bool WriteSummary::allOk() const noexcept { return failedCount() == 0; }

std::size_t WriteSummary::rowsWritten() const noexcept {
    std::size_t total = 0;
    for (const auto& partition : partitions) {
        if (partition.ok) {
            total += partition.rowsWritten;
        }
    }
    return total;
}

std::size_t WriteSummary::failedCount() const noexcept {
    return static_cast<std::size_t>(std::count_if(partitions.begin(), partitions.end(), [](const auto& p) {
        return !p.ok;
    }));
}

void validateAssetName(const domain::Asset& asset) {
    if (asset.empty()) {
        throw fxb::ConfigurationError("Asset name must not be empty");
    }
    for (char ch : asset) {
        const auto uch = static_cast<unsigned char>(ch);
        if (!(std::isalnum(uch) != 0 || ch == '_' || ch == '-' || ch == '.')) {
            throw fxb::ConfigurationError("Invalid character in asset name: '" + asset + "'");
        }
    }
    if (asset == "." || asset == "..") {
        throw fxb::ConfigurationError("Invalid asset name: '" + asset + "'");
    }
}

PartitionStore::PartitionStore(std::string root, std::shared_ptr<IPartitionCodec> codec)
    : root_(std::move(root)), codec_(std::move(codec)) {
    if (!codec_) {
        throw std::invalid_argument("PartitionStore requires a codec");
    }
}

std::string PartitionStore::seriesDir(const domain::Asset& asset, const std::string& timeframeLabel) const {
    return (fs::path(root_) / (kAssetPrefix + asset) / (kTimeframePrefix + timeframeLabel)).string();
}

std::string PartitionStore::partitionPath(const domain::PartitionKey& key) const {
    char year[8];
    char month[4];
    std::snprintf(year, sizeof(year), "%04d", key.year);
    std::snprintf(month, sizeof(month), "%02u", key.month);
    return (fs::path(seriesDir(key.asset, key.timeframe)) / (std::string{kYearPrefix} + year) /
            (std::string{kMonthPrefix} + month) / kPartitionFileName)
        .string();
}

std::shared_ptr<std::mutex> PartitionStore::lockFor(const domain::PartitionKey& key) {
    std::lock_guard<std::mutex> lock(locksMutex_);
    auto& slot = keyLocks_[key];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

void PartitionStore::releaseLock(const domain::PartitionKey& key, std::shared_ptr<std::mutex> keyLock) {
    std::lock_guard<std::mutex> guard(locksMutex_);
    const auto it = keyLocks_.find(key);
    // Map entry plus ours: no other writer is waiting on this key.
    if (it != keyLocks_.end() && it->second == keyLock && keyLock.use_count() == 2) {
        keyLocks_.erase(it);
    }
}

std::size_t PartitionStore::trackedLockCount() const {
    std::lock_guard<std::mutex> guard(locksMutex_);
    return keyLocks_.size();
}

std::string PartitionStore::temporaryPathFor(const std::string& finalPath) {
    const auto sequence = tempCounter_.fetch_add(1, std::memory_order_relaxed);
    return finalPath + ".tmp-" + std::to_string(static_cast<long long>(::getpid())) + "-" +
           std::to_string(sequence);
}

WriteSummary PartitionStore::writeBars(const domain::Asset& asset,
                                       const domain::Timeframe& timeframe,
                                       const std::vector<domain::Bar>& newBars) {
    validateAssetName(asset);
    const auto label = labelOrThrow(timeframe);
    for (const auto& bar : newBars) {
        validateBar(bar, timeframe, label);
    }

    WriteSummary summary;
    if (newBars.empty()) {
        return summary;
    }

    // Keeps input order inside each key so the last duplicate wins during the merge.
    std::map<domain::PartitionKey, std::vector<domain::Bar>> byKey;
    for (const auto& bar : newBars) {
        byKey[domain::partitionKeyFor(asset, timeframe, bar.ts)].push_back(bar);
    }

    summary.partitions.reserve(byKey.size());
    for (const auto& [key, bars] : byKey) {
        auto keyLock = lockFor(key);
        {
            std::lock_guard<std::mutex> guard(*keyLock);
            summary.partitions.push_back(mergePartition(key, bars));
        }
        releaseLock(key, std::move(keyLock));
    }
    return summary;
}

PartitionWriteResult PartitionStore::mergePartition(const domain::PartitionKey& key,
                                                    const std::vector<domain::Bar>& incoming) {
    PartitionWriteResult result;
    result.key = key;
    result.path = partitionPath(key);
    result.incomingBars = incoming.size();

    std::map<domain::TimestampMs, domain::Bar> merged;

    std::error_code ec;
    if (fs::exists(result.path, ec)) {
        try {
            const auto existing = codec_->read(result.path);
            std::size_t outside = 0;
            for (const auto& bar : existing) {
                if (bar.ts < key.startMs() || bar.ts >= key.endMs()) {
                    ++outside;
                    continue;
                }
                merged[bar.ts] = bar;
            }
            if (outside > 0) {
                LOG_WARN("PartitionStore: dropped " << outside << " stored bars outside " << key.toString()
                                                    << " in " << result.path);
            }
        } catch (const fxb::CorruptPartitionError& ex) {
            result.failureReason = ex.what();
            LOG_WARN("PartitionStore: merge failed for " << key.toString() << ": " << ex.what());
            return result;
        } catch (const std::exception& ex) {
            result.failureReason = std::string{"read failed: "} + ex.what();
            LOG_WARN("PartitionStore: merge failed for " << key.toString() << ": " << ex.what());
            return result;
        }
    } else if (ec) {
        result.failureReason = "unable to stat " + result.path + ": " + ec.message();
        LOG_WARN("PartitionStore: " << result.failureReason);
        return result;
    }

    for (const auto& bar : incoming) {
        merged[bar.ts] = bar;
    }

    std::vector<domain::Bar> rows;
    rows.reserve(merged.size());
    for (const auto& entry : merged) {
        rows.push_back(entry.second);
    }

    const fs::path finalPath{result.path};
    fs::create_directories(finalPath.parent_path(), ec);
    if (ec) {
        result.failureReason = "unable to create " + finalPath.parent_path().string() + ": " + ec.message();
        LOG_WARN("PartitionStore: " << result.failureReason);
        return result;
    }

    const auto tempPath = temporaryPathFor(result.path);
    try {
        codec_->write(tempPath, rows);
    } catch (const std::exception& ex) {
        removeQuietly(tempPath);
        result.failureReason = std::string{"write failed: "} + ex.what();
        LOG_WARN("PartitionStore: " << key.toString() << " " << result.failureReason);
        return result;
    }

    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        removeQuietly(tempPath);
        result.failureReason = "rename to " + result.path + " failed: " + ec.message();
        LOG_WARN("PartitionStore: " << result.failureReason);
        return result;
    }

    result.ok = true;
    result.rowsWritten = rows.size();
    LOG_DEBUG("PartitionStore: wrote " << rows.size() << " rows (" << incoming.size() << " incoming) to "
                                       << result.path);
    return result;
}

std::vector<domain::Bar> PartitionStore::readBars(const domain::Asset& asset,
                                                  const domain::Timeframe& timeframe,
                                                  domain::TimestampMs start,
                                                  domain::TimestampMs end) const {
    if (end < start) {
        throw fxb::InvalidRangeError("readBars: end " + domain::formatUtc(end) + " is before start " +
                                     domain::formatUtc(start));
    }
    validateAssetName(asset);
    labelOrThrow(timeframe);

    // Bounded by the partitions on disk, so an open-ended range never walks empty months.
    std::vector<domain::Bar> bars;
    for (const auto& key : listPartitions(asset, timeframe)) {
        if (key.startMs() > end || key.endMs() <= start) {
            continue;
        }
        for (const auto& bar : codec_->read(partitionPath(key))) {
            if (bar.ts >= start && bar.ts <= end) {
                bars.push_back(bar);
            }
        }
    }

    std::stable_sort(bars.begin(), bars.end(), [](const domain::Bar& lhs, const domain::Bar& rhs) {
        return lhs.ts < rhs.ts;
    });
    // Keep the last of equal datetimes, matching the write-side rule.
    std::vector<domain::Bar> unique;
    unique.reserve(bars.size());
    for (const auto& bar : bars) {
        if (!unique.empty() && unique.back().ts == bar.ts) {
            unique.back() = bar;
        } else {
            unique.push_back(bar);
        }
    }
    return unique;
}

std::optional<domain::TimestampMs> PartitionStore::lastTimestamp(const domain::Asset& asset,
                                                                 const domain::Timeframe& timeframe) const {
    auto keys = listPartitions(asset, timeframe);
    for (auto it = keys.rbegin(); it != keys.rend(); ++it) {
        const auto bars = codec_->read(partitionPath(*it));
        if (bars.empty()) {
            continue;
        }
        const auto newest = std::max_element(bars.begin(), bars.end(), [](const auto& lhs, const auto& rhs) {
            return lhs.ts < rhs.ts;
        });
        return newest->ts;
    }
    return std::nullopt;
}

std::vector<domain::PartitionKey> PartitionStore::listPartitions(const domain::Asset& asset,
                                                                 const domain::Timeframe& timeframe) const {
    validateAssetName(asset);
    const auto label = labelOrThrow(timeframe);

    std::vector<domain::PartitionKey> keys;
    const fs::path base{seriesDir(asset, label)};
    std::error_code ec;
    if (!fs::is_directory(base, ec)) {
        return keys;
    }

    for (const auto& yearEntry : fs::directory_iterator(base, ec)) {
        if (!yearEntry.is_directory()) {
            continue;
        }
        const auto year = parseNumberAfter(yearEntry.path().filename().string(), kYearPrefix);
        if (!year) {
            continue;
        }
        std::error_code monthEc;
        for (const auto& monthEntry : fs::directory_iterator(yearEntry.path(), monthEc)) {
            if (!monthEntry.is_directory()) {
                continue;
            }
            const auto month = parseNumberAfter(monthEntry.path().filename().string(), kMonthPrefix);
            if (!month || *month < 1 || *month > 12) {
                continue;
            }
            if (!fs::is_regular_file(monthEntry.path() / kPartitionFileName, monthEc)) {
                continue;
            }
            keys.push_back(domain::PartitionKey{asset, label, *year, static_cast<unsigned>(*month)});
        }
        if (monthEc) {
            LOG_WARN("PartitionStore: unable to list " << yearEntry.path().string() << ": " << monthEc.message());
        }
    }
    if (ec) {
        LOG_WARN("PartitionStore: unable to list " << base.string() << ": " << ec.message());
    }

    std::sort(keys.begin(), keys.end());
    return keys;
}

}  // namespace core
