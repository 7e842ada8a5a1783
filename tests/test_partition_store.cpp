#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <ios>
#include <iostream>
#include <iterator>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "adapters/duckdb/DuckParquetCodec.hpp"
#include "common/Errors.hpp"
#include "core/PartitionStore.hpp"
#include "domain/TimeUtils.hpp"

namespace fs = std::filesystem;

namespace {

constexpr domain::TimestampMs kMinute = 60'000;
constexpr domain::TimestampMs kJan2 = 1'704'153'600'000;   // 2024-01-02T00:00:00Z
constexpr domain::TimestampMs kFeb10 = 1'707'523'200'000;  // 2024-02-10T00:00:00Z
constexpr domain::TimestampMs kMar5 = 1'709'596'800'000;   // 2024-03-05T00:00:00Z

// Forwards to the real codec and remembers which files were opened for reading.
class RecordingCodec : public core::IPartitionCodec {
public:
    explicit RecordingCodec(std::shared_ptr<core::IPartitionCodec> inner) : inner_(std::move(inner)) {}

    std::vector<domain::Bar> read(const std::string& path) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            reads_.push_back(path);
            if (!failOn_.empty() && path.find(failOn_) != std::string::npos) {
                throw std::ios_base::failure("simulated I/O error on " + path);
            }
        }
        return inner_->read(path);
    }

    void write(const std::string& path, const std::vector<domain::Bar>& bars) override {
        inner_->write(path, bars);
    }

    std::vector<std::string> reads() {
        std::lock_guard<std::mutex> lock(mutex_);
        return reads_;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        reads_.clear();
    }

    // Reads of paths containing fragment throw a plain I/O error; empty disables.
    void failReadsContaining(std::string fragment) {
        std::lock_guard<std::mutex> lock(mutex_);
        failOn_ = std::move(fragment);
    }

private:
    std::shared_ptr<core::IPartitionCodec> inner_;
    std::mutex mutex_;
    std::vector<std::string> reads_;
    std::string failOn_;
};

struct TempDir {
    TempDir() {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path = fs::temp_directory_path() / ("fxbars_store_" + std::to_string(stamp));
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    fs::path path;
};

domain::Bar bar(domain::TimestampMs ts, double price, double volume = 1.0) {
    return domain::Bar{ts, price, price + 0.001, price - 0.001, price, volume};
}

std::string slurp(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

template <typename Fn>
bool throwsInvalidRange(Fn&& fn) {
    try {
        fn();
    } catch (const fxb::InvalidRangeError&) {
        return true;
    }
    return false;
}

bool hasTemporaryFiles(const fs::path& root) {
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (entry.path().filename().string().find(".tmp-") != std::string::npos) {
            return true;
        }
    }
    return false;
}

}  // namespace

int main() {
    namespace tf = domain::timeframes;

    try {
        TempDir dir;
        auto recording = std::make_shared<RecordingCodec>(std::make_shared<adapters::duckdb::DuckParquetCodec>());
        core::PartitionStore store(dir.path.string(), recording);

        // Missing series directory reads as empty.
        if (!store.readBars("EURUSD", tf::kOneMinute, kJan2, kMar5).empty() ||
            store.lastTimestamp("EURUSD", tf::kOneMinute).has_value() ||
            !store.listPartitions("EURUSD", tf::kOneMinute).empty()) {
            std::cerr << "Expected empty results for a missing series\n";
            return 1;
        }

        // Three months in one call, deliberately out of order.
        auto summary = store.writeBars(
            "EURUSD", tf::kOneMinute,
            {bar(kFeb10 + kMinute, 1.2), bar(kJan2, 1.1), bar(kMar5, 1.3), bar(kJan2 + kMinute, 1.11)});
        if (!summary.allOk() || summary.partitions.size() != 3 || summary.rowsWritten() != 4) {
            std::cerr << "Expected three successful partition writes, got " << summary.partitions.size() << "\n";
            return 1;
        }
        const auto janPath = store.partitionPath(domain::PartitionKey{"EURUSD", "1m", 2024, 1});
        const auto febPath = store.partitionPath(domain::PartitionKey{"EURUSD", "1m", 2024, 2});
        const auto marPath = store.partitionPath(domain::PartitionKey{"EURUSD", "1m", 2024, 3});
        if (janPath != (dir.path / "asset=EURUSD" / "tf=1m" / "year=2024" / "month=01" / "bars.parquet").string()) {
            std::cerr << "Unexpected partition path " << janPath << "\n";
            return 1;
        }
        for (const auto& path : {janPath, febPath, marPath}) {
            if (!fs::exists(path)) {
                std::cerr << "Missing partition file " << path << "\n";
                return 1;
            }
        }

        // New bar wins on equal datetime; untouched months stay byte-identical.
        const auto janBefore = slurp(janPath);
        const auto marBefore = slurp(marPath);
        recording->reset();
        summary = store.writeBars("EURUSD", tf::kOneMinute,
                                  {bar(kFeb10 + kMinute, 1.25, 7.0), bar(kFeb10, 1.24), bar(kFeb10 + kMinute, 1.26, 9.0)});
        if (!summary.allOk() || summary.partitions.size() != 1) {
            std::cerr << "Expected a single February partition write\n";
            return 1;
        }
        if (slurp(janPath) != janBefore || slurp(marPath) != marBefore) {
            std::cerr << "Writing February modified another month\n";
            return 1;
        }
        for (const auto& path : recording->reads()) {
            if (path != febPath) {
                std::cerr << "Write opened unrelated partition " << path << "\n";
                return 1;
            }
        }

        const auto february = store.readBars("EURUSD", tf::kOneMinute, kFeb10, kFeb10 + kMinute);
        if (february.size() != 2 || february[0].ts != kFeb10 || february[1].ts != kFeb10 + kMinute ||
            february[1].close != 1.26 || february[1].volume != 9.0) {
            std::cerr << "Expected merged February bars with the newest duplicate winning\n";
            return 1;
        }

        // Closed interval, ordered, and only intersecting months are opened.
        recording->reset();
        const auto january = store.readBars("EURUSD", tf::kOneMinute, kJan2, kJan2 + kMinute);
        if (january.size() != 2 || january[0].close != 1.1 || january[1].close != 1.11) {
            std::cerr << "Closed-interval read over January returned " << january.size() << " bars\n";
            return 1;
        }
        const auto reads = recording->reads();
        if (reads.size() != 1 || reads.front() != janPath) {
            std::cerr << "Read over January opened " << reads.size() << " partitions\n";
            return 1;
        }

        const auto all = store.readBars("EURUSD", tf::kOneMinute, kJan2, kMar5);
        if (all.size() != 5 || !std::is_sorted(all.begin(), all.end(), [](const auto& a, const auto& b) {
                return a.ts < b.ts;
            })) {
            std::cerr << "Full-range read returned " << all.size() << " bars\n";
            return 1;
        }

        // Newest bar comes from the newest partition only.
        recording->reset();
        const auto last = store.lastTimestamp("EURUSD", tf::kOneMinute);
        if (!last || *last != kMar5 || recording->reads().size() != 1) {
            std::cerr << "lastTimestamp did not return the March bar from one read\n";
            return 1;
        }

        const auto keys = store.listPartitions("EURUSD", tf::kOneMinute);
        if (keys.size() != 3 || keys[0].month != 1 || keys[1].month != 2 || keys[2].month != 3) {
            std::cerr << "listPartitions returned " << keys.size() << " keys\n";
            return 1;
        }

        // An open-ended range opens only the partitions on disk.
        recording->reset();
        const auto everything = store.readBars("EURUSD", tf::kOneMinute, 0, std::numeric_limits<std::int64_t>::max());
        if (everything.size() != 5 || recording->reads().size() != 3) {
            std::cerr << "Open-ended read returned " << everything.size() << " bars from "
                      << recording->reads().size() << " partitions\n";
            return 1;
        }
        if (!store.readBars("EURUSD", tf::kOneMinute, std::numeric_limits<std::int64_t>::min(), kJan2 - 1).empty()) {
            std::cerr << "Range ending before the first bar must be empty\n";
            return 1;
        }

        // Finished writes leave no per-partition lock behind.
        if (store.trackedLockCount() != 0) {
            std::cerr << "Expected no tracked partition locks, got " << store.trackedLockCount() << "\n";
            return 1;
        }

        // Any read failure during a merge fails that partition only.
        summary = store.writeBars("USDJPY", tf::kOneMinute, {bar(kJan2, 140.1), bar(kMar5, 141.3)});
        if (!summary.allOk()) {
            std::cerr << "Initial USDJPY write failed\n";
            return 1;
        }
        recording->failReadsContaining("asset=USDJPY/tf=1m/year=2024/month=03");
        summary = store.writeBars("USDJPY", tf::kOneMinute, {bar(kJan2 + kMinute, 140.2), bar(kMar5 + kMinute, 141.4)});
        recording->failReadsContaining("");
        if (summary.partitions.size() != 2 || summary.failedCount() != 1 || !summary.partitions[0].ok ||
            summary.partitions[1].ok || summary.partitions[1].failureReason.find("simulated I/O error") == std::string::npos) {
            std::cerr << "Expected January to merge and March to fail with the read error\n";
            return 1;
        }
        if (store.readBars("USDJPY", tf::kOneMinute, kJan2, kMar5 + kMinute).size() != 3 || store.trackedLockCount() != 0) {
            std::cerr << "USDJPY should hold two January bars and the original March bar\n";
            return 1;
        }

        // A corrupt partition fails only its own write; reading it raises.
        {
            std::ofstream garbage(febPath, std::ios::binary | std::ios::trunc);
            garbage << "this is not a parquet file";
        }
        summary = store.writeBars("EURUSD", tf::kOneMinute, {bar(kJan2 + 2 * kMinute, 1.12), bar(kFeb10 + 2 * kMinute, 1.27)});
        if (summary.partitions.size() != 2 || summary.failedCount() != 1) {
            std::cerr << "Expected exactly one failed partition\n";
            return 1;
        }
        for (const auto& partition : summary.partitions) {
            if (partition.key.month == 1 && !partition.ok) {
                std::cerr << "January write should succeed next to a corrupt February\n";
                return 1;
            }
            if (partition.key.month == 2 && (partition.ok || partition.failureReason.empty())) {
                std::cerr << "February write should fail with a reason\n";
                return 1;
            }
        }
        if (store.readBars("EURUSD", tf::kOneMinute, kJan2, kJan2 + 10 * kMinute).size() != 3) {
            std::cerr << "January should now hold three bars\n";
            return 1;
        }
        bool corruptRaised = false;
        try {
            store.readBars("EURUSD", tf::kOneMinute, kFeb10, kFeb10 + kMinute);
        } catch (const fxb::CorruptPartitionError& ex) {
            corruptRaised = ex.path() == febPath;
        }
        if (!corruptRaised) {
            std::cerr << "Expected CorruptPartitionError naming the February file\n";
            return 1;
        }

        if (hasTemporaryFiles(dir.path)) {
            std::cerr << "Temporary files were left behind\n";
            return 1;
        }

        // Structural errors before any I/O.
        if (!throwsInvalidRange([&] { store.readBars("EURUSD", tf::kOneMinute, kMar5, kJan2); })) {
            std::cerr << "Expected InvalidRangeError for end < start\n";
            return 1;
        }
        bool invalidBar = false;
        try {
            store.writeBars("GBPUSD", tf::kOneMinute, {bar(kJan2, 1.0), domain::Bar{kJan2 + kMinute, 1.0, 0.9, 1.1, 1.0, 1.0}});
        } catch (const fxb::InvalidBarError&) {
            invalidBar = true;
        }
        if (!invalidBar || fs::exists(dir.path / "asset=GBPUSD")) {
            std::cerr << "Invalid bar must reject the whole call before touching disk\n";
            return 1;
        }
        invalidBar = false;
        try {
            store.writeBars("GBPUSD", tf::kOneHour, {bar(kJan2 + kMinute, 1.0)});
        } catch (const fxb::InvalidBarError&) {
            invalidBar = true;
        }
        if (!invalidBar) {
            std::cerr << "Misaligned bar must be rejected\n";
            return 1;
        }
        bool badAsset = false;
        try {
            store.writeBars("../escape", tf::kOneMinute, {bar(kJan2, 1.0)});
        } catch (const fxb::ConfigurationError&) {
            badAsset = true;
        }
        if (!badAsset) {
            std::cerr << "Asset names with path separators must be rejected\n";
            return 1;
        }
    } catch (const std::exception& ex) {
        std::cerr << "Unexpected exception: " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
