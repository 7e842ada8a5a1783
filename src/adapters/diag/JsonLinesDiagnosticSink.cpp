#include "adapters/diag/JsonLinesDiagnosticSink.hpp"

#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <boost/json/serialize.hpp>

#include "common/Log.hpp"
#include "domain/TimeUtils.hpp"

namespace adapters::diag {

boost::json::object toJson(const core::Diagnostic& diagnostic) {
    boost::json::object payload;
    payload["timestamp_utc"] = domain::formatUtc(diagnostic.timestampUtc);
    payload["kind"] = core::diagnosticKindToString(diagnostic.kind);
    payload["asset"] = diagnostic.asset;
    if (!diagnostic.timeframe.empty()) {
        payload["timeframe"] = diagnostic.timeframe;
    }
    payload["source_file_or_url"] = diagnostic.source;
    payload["failure_reason"] = diagnostic.reason;
    return payload;
}

JsonLinesDiagnosticSink::JsonLinesDiagnosticSink(std::string path) : path_(std::move(path)) {
    const std::filesystem::path filePath{path_};
    if (filePath.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(filePath.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("JsonLinesDiagnosticSink: unable to create directory '" +
                                     filePath.parent_path().string() + "': " + ec.message());
        }
    }

    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_) {
        throw std::runtime_error("JsonLinesDiagnosticSink: unable to open " + path_);
    }
}

void JsonLinesDiagnosticSink::emit(const core::Diagnostic& diagnostic) {
    const auto line = boost::json::serialize(toJson(diagnostic));

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << '\n';
    out_.flush();
    if (!out_) {
        LOG_ERR("JsonLinesDiagnosticSink: write to " << path_ << " failed");
    }
}

}  // namespace adapters::diag
