#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <boost/json/serialize.hpp>

#include "adapters/diag/JsonLinesDiagnosticSink.hpp"
#include "adapters/duckdb/DuckParquetCodec.hpp"
#include "adapters/ticks/CsvTickCache.hpp"
#include "app/IncrementalUpdateCoordinator.hpp"
#include "app/RunReport.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "core/MinuteBarBuilder.hpp"
#include "core/PartitionStore.hpp"
#include "domain/TimeUtils.hpp"

namespace {

std::string joinList(const std::vector<std::string>& values) {
    std::string joined;
    for (const auto& value : values) {
        if (joined.empty()) {
            joined = value;
        } else {
            joined.append(",").append(value);
        }
    }
    return joined;
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([] {
        try {
            auto eptr = std::current_exception();
            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const std::exception& ex) {
                    std::fprintf(stderr, "std::terminate: %s\n", ex.what());
                } catch (...) {
                    std::fprintf(stderr, "std::terminate: unknown exception\n");
                }
            } else {
                std::fprintf(stderr, "std::terminate without current_exception\n");
            }
        } catch (...) {
        }
        std::_Exit(1);
    });

    try {
        auto config = fxb::common::Config::fromArgs(argc, argv);
        fxb::log::setLevel(config.logLevel);

        // Everything structural is resolved before the first file is touched.
        const auto [start, end] = config.range();
        const auto timeframes = config.parsedTimeframes();
        const auto volumeMode = core::volumeModeFromString(config.volume);
        for (const auto& asset : config.assets) {
            core::validateAssetName(asset);
        }

        LOG_INFO("Configuration loaded");
        LOG_INFO("  Log level: " << fxb::log::levelToString(config.logLevel));
        LOG_INFO("  Data root: " << config.dataRoot);
        LOG_INFO("  Ticks root: " << config.ticksRoot);
        LOG_INFO("  Assets: " << joinList(config.assets));
        LOG_INFO("  Timeframes: " << joinList(config.timeframes));
        LOG_INFO("  Range: " << domain::formatUtc(start) << " .. " << domain::formatUtc(end));
        LOG_INFO("  Volume: " << core::volumeModeToString(volumeMode));
        LOG_INFO("  Compression: " << config.compression);
        LOG_INFO("  Refresh: " << (config.refresh ? "on" : "off"));
        if (!config.diagnosticsPath.empty()) {
            LOG_INFO("  Diagnostics: " << config.diagnosticsPath);
        }

        auto codec = std::make_shared<adapters::duckdb::DuckParquetCodec>(config.compression);
        core::PartitionStore store(config.dataRoot, codec);
        adapters::ticks::CsvTickCache tickCache(config.ticksRoot);

        std::unique_ptr<adapters::diag::JsonLinesDiagnosticSink> diagnostics;
        if (!config.diagnosticsPath.empty()) {
            diagnostics = std::make_unique<adapters::diag::JsonLinesDiagnosticSink>(config.diagnosticsPath);
        }

        app::IncrementalUpdateCoordinator coordinator(tickCache, store, core::MinuteBarBuilder(volumeMode),
                                                      diagnostics.get());

        std::vector<app::UpdateRequest> requests;
        requests.reserve(config.assets.size());
        for (const auto& asset : config.assets) {
            app::UpdateRequest request;
            request.asset = asset;
            request.timeframes = timeframes;
            request.start = start;
            request.end = end;
            request.refresh = config.refresh;
            requests.push_back(std::move(request));
        }

        const auto reports = coordinator.runAll(requests);
        for (const auto& report : reports) {
            std::cout << boost::json::serialize(app::toJson(report)) << '\n';
            if (report.hasWarnings()) {
                LOG_WARN("Run for " << report.asset << " completed with " << report.warnings.size()
                                    << " warnings");
            }
        }
        std::cout.flush();
    } catch (const std::exception& ex) {
        LOG_ERR("Update failed: " << ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
