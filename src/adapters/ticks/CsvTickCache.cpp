#include "adapters/ticks/CsvTickCache.hpp"

#include <cstdint>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

#include <duckdb.hpp>

#include "adapters/duckdb/DuckParquetCodec.hpp"
#include "common/Log.hpp"
#include "domain/TimeUtils.hpp"

namespace fs = std::filesystem;

namespace adapters::ticks {

CsvTickCache::CsvTickCache(std::string root) : root_(std::move(root)) {}

std::string CsvTickCache::hourPath(const domain::Asset& asset, domain::TimestampMs hourStart) const {
    const auto date = domain::civilDateOf(hourStart);
    const auto hour = (hourStart - domain::floorToDayMs(hourStart)) / domain::time::kMillisPerHour;

    char year[8];
    char month[4];
    char day[4];
    char file[16];
    std::snprintf(year, sizeof(year), "%04d", date.year);
    std::snprintf(month, sizeof(month), "%02u", date.month - 1);
    std::snprintf(day, sizeof(day), "%02u", date.day);
    std::snprintf(file, sizeof(file), "%02lldh_ticks.csv", static_cast<long long>(hour));
    return (fs::path(root_) / asset / year / month / day / file).string();
}

core::TickHour CsvTickCache::fetchHour(const domain::Asset& asset, domain::TimestampMs hourStart) {
    hourStart = domain::floorToHourMs(hourStart);
    const auto path = hourPath(asset, hourStart);

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return core::TickHour::unavailable(hourStart, path, "missing hour file");
    }
    // Interrupted downloads leave zero-length files behind.
    if (fs::file_size(path, ec) == 0 || ec) {
        return core::TickHour::unavailable(hourStart, path, ec ? ec.message() : "empty hour file");
    }

    const std::string query =
        "SELECT ms, bid, ask, volume FROM read_csv(" + adapters::duckdb::quoteLiteral(path) +
        ", header = true, delim = ',', "
        "columns = {'ms': 'BIGINT', 'bid': 'DOUBLE', 'ask': 'DOUBLE', 'volume': 'DOUBLE'})";

    core::TickHour hour;
    hour.hourStart = hourStart;
    hour.source = path;

    try {
        ::duckdb::DuckDB database(nullptr);
        ::duckdb::Connection connection(database);

        auto result = connection.Query(query);
        if (!result || result->HasError()) {
            const std::string errorMessage = result ? result->GetError() : std::string{"unknown query error"};
            return core::TickHour::unavailable(hourStart, path, "unreadable hour file: " + errorMessage);
        }

        hour.ticks.reserve(result->RowCount());
        while (auto chunk = result->Fetch()) {
            const auto count = chunk->size();
            for (::duckdb::idx_t row = 0; row < count; ++row) {
                const auto msValue = chunk->GetValue(0, row);
                const auto bidValue = chunk->GetValue(1, row);
                if (msValue.IsNull() || bidValue.IsNull()) {
                    continue;
                }
                domain::Tick tick;
                tick.ts = hourStart + msValue.GetValue<std::int64_t>();
                tick.bid = bidValue.GetValue<double>();
                const auto askValue = chunk->GetValue(2, row);
                if (!askValue.IsNull()) {
                    tick.ask = askValue.GetValue<double>();
                }
                const auto volumeValue = chunk->GetValue(3, row);
                if (!volumeValue.IsNull()) {
                    tick.volume = volumeValue.GetValue<double>();
                }
                hour.ticks.push_back(tick);
            }
        }
    }
    catch (const std::exception& ex) {
        return core::TickHour::unavailable(hourStart, path, std::string{"unreadable hour file: "} + ex.what());
    }

    LOG_DEBUG("CsvTickCache: " << hour.ticks.size() << " ticks from " << path);
    return hour;
}

}  // namespace adapters::ticks
