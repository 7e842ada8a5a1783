#pragma once

#include <fstream>
#include <mutex>
#include <string>

#include <boost/json/object.hpp>

#include "core/ports/IDiagnosticSink.hpp"

namespace adapters::diag {

boost::json::object toJson(const core::Diagnostic& diagnostic);

// Appends one JSON object per line, for later retry or audit of skipped hours and failed writes.
class JsonLinesDiagnosticSink : public core::IDiagnosticSink {
public:
    explicit JsonLinesDiagnosticSink(std::string path);

    void emit(const core::Diagnostic& diagnostic) override;

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
    std::mutex mutex_;
    std::ofstream out_;
};

}  // namespace adapters::diag
