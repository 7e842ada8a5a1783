#pragma once

#include <string>
#include <vector>

#include "core/ports/IPartitionCodec.hpp"

namespace adapters::duckdb {

// Parquet partition files through an in-process, in-memory DuckDB instance.
// Schema: datetime TIMESTAMP (UTC), "Open", "High", "Low", "Close", "Volume" DOUBLE.
class DuckParquetCodec : public core::IPartitionCodec {
public:
    explicit DuckParquetCodec(std::string compression = "zstd");

    std::vector<domain::Bar> read(const std::string& path) override;
    void write(const std::string& path, const std::vector<domain::Bar>& bars) override;

private:
    std::string compression_;
};

// Single-quoted SQL string literal.
std::string quoteLiteral(const std::string& value);

}  // namespace adapters::duckdb
