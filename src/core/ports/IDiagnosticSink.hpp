#pragma once

#include <string>

#include "domain/Types.hpp"

namespace core {

enum class DiagnosticKind {
    SkippedHour,
    PartitionWriteFailed,
};

inline const char* diagnosticKindToString(DiagnosticKind kind) noexcept {
    switch (kind) {
    case DiagnosticKind::SkippedHour:
        return "skipped_hour";
    case DiagnosticKind::PartitionWriteFailed:
        return "partition_write_failed";
    }
    return "unknown";
}

struct Diagnostic {
    domain::TimestampMs timestampUtc{0};  // hour start or partition month start
    DiagnosticKind kind{DiagnosticKind::SkippedHour};
    domain::Asset asset;
    std::string timeframe;
    std::string source;  // tick file/URL or partition path
    std::string reason;
};

class IDiagnosticSink {
public:
    virtual ~IDiagnosticSink() = default;

    virtual void emit(const Diagnostic& diagnostic) = 0;
};

}  // namespace core
