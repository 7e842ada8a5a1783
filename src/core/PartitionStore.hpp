#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/ports/IPartitionCodec.hpp"
#include "domain/PartitionKey.hpp"
#include "domain/Types.hpp"

namespace core {

struct PartitionWriteResult {
    domain::PartitionKey key;
    std::string path;
    bool ok{false};
    std::size_t incomingBars{0};
    std::size_t rowsWritten{0};
    std::string failureReason;
};

struct WriteSummary {
    std::vector<PartitionWriteResult> partitions;

    bool allOk() const noexcept;
    std::size_t rowsWritten() const noexcept;
    std::size_t failedCount() const noexcept;
};

// Owns the partition tree under `root`:
//   <root>/asset=<A>/tf=<T>/year=<YYYY>/month=<MM>/bars.parquet
// All access to partition files goes through this class. Merges into the same key are
// serialized by a per-key mutex; distinct keys never contend.
class PartitionStore {
public:
    static constexpr const char* kPartitionFileName = "bars.parquet";

    PartitionStore(std::string root, std::shared_ptr<IPartitionCodec> codec);

    PartitionStore(const PartitionStore&) = delete;
    PartitionStore& operator=(const PartitionStore&) = delete;

    // Merges bars into their month partitions (existing ∪ new, new wins on equal datetime,
    // sorted). Throws fxb::InvalidBarError / fxb::ConfigurationError before touching disk;
    // a partition that fails to merge is reported in the summary and does not stop the others.
    WriteSummary writeBars(const domain::Asset& asset,
                           const domain::Timeframe& timeframe,
                           const std::vector<domain::Bar>& newBars);

    // Bars with start <= ts <= end, ascending, from the months intersecting the range only.
    std::vector<domain::Bar> readBars(const domain::Asset& asset,
                                      const domain::Timeframe& timeframe,
                                      domain::TimestampMs start,
                                      domain::TimestampMs end) const;

    // Datetime of the newest stored bar; opens only the newest non-empty partition.
    std::optional<domain::TimestampMs> lastTimestamp(const domain::Asset& asset,
                                                     const domain::Timeframe& timeframe) const;

    // Existing partitions, ascending. Reads directory entries only.
    std::vector<domain::PartitionKey> listPartitions(const domain::Asset& asset,
                                                     const domain::Timeframe& timeframe) const;

    std::string partitionPath(const domain::PartitionKey& key) const;
    const std::string& root() const noexcept { return root_; }
    // Per-partition write locks currently held or awaited.
    std::size_t trackedLockCount() const;

private:
    std::string seriesDir(const domain::Asset& asset, const std::string& timeframeLabel) const;
    std::shared_ptr<std::mutex> lockFor(const domain::PartitionKey& key);
    void releaseLock(const domain::PartitionKey& key, std::shared_ptr<std::mutex> keyLock);
    PartitionWriteResult mergePartition(const domain::PartitionKey& key, const std::vector<domain::Bar>& incoming);
    std::string temporaryPathFor(const std::string& finalPath);

    std::string root_;
    std::shared_ptr<IPartitionCodec> codec_;

    mutable std::mutex locksMutex_;
    std::map<domain::PartitionKey, std::shared_ptr<std::mutex>> keyLocks_;
    std::atomic<std::uint64_t> tempCounter_{0};
};

// Rejects names that would escape or confuse the partition tree. Throws fxb::ConfigurationError.
void validateAssetName(const domain::Asset& asset);

}  // namespace core
