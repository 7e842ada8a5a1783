#include "adapters/duckdb/DuckParquetCodec.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include <duckdb.hpp>

#include "common/Errors.hpp"
#include "common/Log.hpp"

namespace adapters::duckdb {
namespace {

constexpr auto kCreateStaging = R"SQL(
    CREATE TABLE staging (
        ts BIGINT,
        o DOUBLE,
        h DOUBLE,
        l DOUBLE,
        c DOUBLE,
        v DOUBLE
    )
)SQL";

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

void runOrThrow(::duckdb::Connection& connection, const std::string& sql, const char* what) {
    auto result = connection.Query(sql);
    if (!result || result->HasError()) {
        const std::string errorMessage = result ? result->GetError() : std::string{"unknown query error"};
        throw std::runtime_error(std::string{"DuckParquetCodec "} + what + " failed: " + errorMessage);
    }
}

// One in-memory database per call; single-threaded so row groups and bytes are reproducible.
void configure(::duckdb::Connection& connection) {
    runOrThrow(connection, "SET threads TO 1", "configure");
    runOrThrow(connection, "SET preserve_insertion_order = true", "configure");
}

}  // namespace

std::string quoteLiteral(const std::string& value) {
    std::string quoted;
    quoted.reserve(value.size() + 2);
    quoted.push_back('\'');
    for (char ch : value) {
        if (ch == '\'') {
            quoted.push_back('\'');
        }
        quoted.push_back(ch);
    }
    quoted.push_back('\'');
    return quoted;
}

DuckParquetCodec::DuckParquetCodec(std::string compression) : compression_(toLower(std::move(compression))) {
    if (compression_ != "zstd" && compression_ != "snappy" && compression_ != "gzip" &&
        compression_ != "uncompressed") {
        throw fxb::ConfigurationError("Unsupported parquet compression: " + compression_);
    }
}

std::vector<domain::Bar> DuckParquetCodec::read(const std::string& path) {
    const std::string query =
        "SELECT epoch_ms(CAST(datetime AS TIMESTAMP)) AS ts, \"Open\", \"High\", \"Low\", \"Close\", \"Volume\" "
        "FROM read_parquet(" + quoteLiteral(path) + ") ORDER BY ts";

    try {
        ::duckdb::DuckDB database(nullptr);
        ::duckdb::Connection connection(database);
        configure(connection);

        auto result = connection.Query(query);
        if (!result || result->HasError()) {
            const std::string errorMessage = result ? result->GetError() : std::string{"unknown query error"};
            throw fxb::CorruptPartitionError(path, errorMessage);
        }

        std::vector<domain::Bar> bars;
        bars.reserve(result->RowCount());
        while (auto chunk = result->Fetch()) {
            const auto count = chunk->size();
            for (::duckdb::idx_t row = 0; row < count; ++row) {
                domain::Bar bar{};
                for (::duckdb::idx_t column = 0; column < 6; ++column) {
                    if (chunk->GetValue(column, row).IsNull()) {
                        throw fxb::CorruptPartitionError(path, "null value in column " + std::to_string(column));
                    }
                }
                bar.ts = chunk->GetValue(0, row).GetValue<std::int64_t>();
                bar.open = chunk->GetValue(1, row).GetValue<double>();
                bar.high = chunk->GetValue(2, row).GetValue<double>();
                bar.low = chunk->GetValue(3, row).GetValue<double>();
                bar.close = chunk->GetValue(4, row).GetValue<double>();
                bar.volume = chunk->GetValue(5, row).GetValue<double>();
                bars.push_back(bar);
            }
        }
        return bars;
    }
    catch (const fxb::CorruptPartitionError&) {
        throw;
    }
    catch (const std::exception& ex) {
        throw fxb::CorruptPartitionError(path, ex.what());
    }
}

void DuckParquetCodec::write(const std::string& path, const std::vector<domain::Bar>& bars) {
    ::duckdb::DuckDB database(nullptr);
    ::duckdb::Connection connection(database);
    configure(connection);
    runOrThrow(connection, kCreateStaging, "create staging");

    {
        ::duckdb::Appender appender(connection, "staging");
        for (const auto& bar : bars) {
            appender.BeginRow();
            appender.Append<std::int64_t>(bar.ts);
            appender.Append<double>(bar.open);
            appender.Append<double>(bar.high);
            appender.Append<double>(bar.low);
            appender.Append<double>(bar.close);
            appender.Append<double>(bar.volume);
            appender.EndRow();
        }
        appender.Close();
    }

    const std::string copy =
        "COPY (SELECT epoch_ms(ts) AS datetime, o AS \"Open\", h AS \"High\", l AS \"Low\", c AS \"Close\", "
        "v AS \"Volume\" FROM staging ORDER BY ts) TO " + quoteLiteral(path) +
        " (FORMAT PARQUET, COMPRESSION " + quoteLiteral(compression_) + ", ROW_GROUP_SIZE 50000)";
    runOrThrow(connection, copy, "copy");
    LOG_DEBUG("DuckParquetCodec: wrote " << bars.size() << " rows to " << path);
}

}  // namespace adapters::duckdb
