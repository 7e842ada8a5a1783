#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/Errors.hpp"
#include "domain/TimeUtils.hpp"

namespace fxb::common {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

std::string trim(std::string value) {
    auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) {
                   return !isSpace(ch);
               }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }).base(),
                value.end());
    return value;
}

std::vector<std::string> parseCsvList(const std::string& value) {
    std::vector<std::string> parts;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto trimmed = trim(item);
        if (!trimmed.empty()) {
            parts.push_back(std::move(trimmed));
        }
    }
    return parts;
}

std::vector<std::string> deduplicateList(std::vector<std::string> values) {
    std::vector<std::string> unique;
    unique.reserve(values.size());
    for (auto& value : values) {
        if (std::find(unique.begin(), unique.end(), value) == unique.end()) {
            unique.push_back(std::move(value));
        }
    }
    return unique;
}

fxb::log::Level parseLevel(const std::string& value) {
    try {
        return fxb::log::levelFromString(value);
    } catch (const std::invalid_argument& ex) {
        throw fxb::ConfigurationError(ex.what());
    }
}

std::vector<std::string> parseTimeframes(const std::string& value) {
    std::vector<std::string> labels;
    for (const auto& item : parseCsvList(value)) {
        labels.push_back(domain::timeframeLabel(domain::parseTimeframe(item)));
    }
    if (labels.empty()) {
        throw fxb::ConfigurationError("--timeframes must name at least one timeframe");
    }
    return deduplicateList(std::move(labels));
}

std::string parseVolume(const std::string& value) {
    const auto normalized = toLower(trim(value));
    if (normalized == "count" || normalized == "sum") {
        return normalized;
    }
    throw fxb::ConfigurationError("Invalid value for --volume: " + value);
}

std::string valueFromArgs(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg == key && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind(withEquals, 0) == 0) {
            return arg.substr(withEquals.size());
        }
    }
    return {};
}

bool hasFlag(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (key == argv[i]) {
            return true;
        }
    }
    return false;
}

bool isDateOnly(const std::string& value) { return value.size() == 10; }

}  // namespace

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    if (const char* envLogLevel = std::getenv("LOG_LEVEL")) {
        config.logLevel = parseLevel(envLogLevel);
    }
    if (const char* envDataRoot = std::getenv("FXB_DATA_ROOT")) {
        auto value = trim(envDataRoot);
        if (!value.empty()) {
            config.dataRoot = std::move(value);
        }
    }
    if (const char* envTicksRoot = std::getenv("FXB_TICKS_ROOT")) {
        auto value = trim(envTicksRoot);
        if (!value.empty()) {
            config.ticksRoot = std::move(value);
        }
    }
    if (const char* envDiagnostics = std::getenv("FXB_DIAGNOSTICS")) {
        config.diagnosticsPath = trim(envDiagnostics);
    }

    if (auto levelArg = valueFromArgs(argc, argv, "--log-level"); !levelArg.empty()) {
        config.logLevel = parseLevel(levelArg);
    }
    if (auto dataArg = valueFromArgs(argc, argv, "--data-root"); !dataArg.empty()) {
        config.dataRoot = trim(dataArg);
    }
    if (auto ticksArg = valueFromArgs(argc, argv, "--ticks-root"); !ticksArg.empty()) {
        config.ticksRoot = trim(ticksArg);
    }
    if (auto assetsArg = valueFromArgs(argc, argv, "--assets"); !assetsArg.empty()) {
        auto list = parseCsvList(assetsArg);
        for (auto& asset : list) {
            asset = toUpper(asset);
        }
        if (!list.empty()) {
            config.assets = deduplicateList(std::move(list));
        }
    }
    if (auto timeframesArg = valueFromArgs(argc, argv, "--timeframes"); !timeframesArg.empty()) {
        config.timeframes = parseTimeframes(timeframesArg);
    }
    if (auto fromArg = valueFromArgs(argc, argv, "--from"); !fromArg.empty()) {
        config.from = trim(fromArg);
    }
    if (auto toArg = valueFromArgs(argc, argv, "--to"); !toArg.empty()) {
        config.to = trim(toArg);
    }
    if (auto volumeArg = valueFromArgs(argc, argv, "--volume"); !volumeArg.empty()) {
        config.volume = parseVolume(volumeArg);
    }
    if (auto compressionArg = valueFromArgs(argc, argv, "--compression"); !compressionArg.empty()) {
        config.compression = toLower(trim(compressionArg));
    }
    if (auto diagnosticsArg = valueFromArgs(argc, argv, "--diagnostics"); !diagnosticsArg.empty()) {
        config.diagnosticsPath = trim(diagnosticsArg);
    }
    if (hasFlag(argc, argv, "--refresh")) {
        config.refresh = true;
    }

    if (config.from.empty()) {
        throw fxb::ConfigurationError("--from is required (YYYY-MM-DD)");
    }
    if (config.dataRoot.empty()) {
        throw fxb::ConfigurationError("--data-root must not be empty");
    }

    return config;
}

std::pair<domain::TimestampMs, domain::TimestampMs> Config::range() const {
    const auto start = domain::parseUtc(from);
    if (!start) {
        throw fxb::ConfigurationError("Invalid --from value: '" + from + "'");
    }

    domain::TimestampMs end = 0;
    if (toLower(to) == "now") {
        end = domain::nowMs();
    } else {
        const auto parsed = domain::parseUtc(to);
        if (!parsed) {
            throw fxb::ConfigurationError("Invalid --to value: '" + to + "'");
        }
        end = isDateOnly(to) ? *parsed + domain::time::kMillisPerDay - 1 : *parsed;
    }

    if (end < *start) {
        throw fxb::InvalidRangeError("--to (" + to + ") is before --from (" + from + ")");
    }
    return {*start, end};
}

std::vector<domain::Timeframe> Config::parsedTimeframes() const {
    std::vector<domain::Timeframe> parsed;
    parsed.reserve(timeframes.size());
    for (const auto& label : timeframes) {
        parsed.push_back(domain::parseTimeframe(label));
    }
    return parsed;
}

}  // namespace fxb::common
