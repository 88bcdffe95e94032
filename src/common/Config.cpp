#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace cfe::common {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
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

std::vector<std::string> split(const std::string& value, char separator) {
    std::vector<std::string> parts;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, separator)) {
        parts.push_back(trim(item));
    }
    return parts;
}

std::uint16_t parsePort(const std::string& value) {
    try {
        const auto portValue = std::stoul(value);
        if (portValue == 0U || portValue > 65535U) {
            throw std::out_of_range("port out of range");
        }
        return static_cast<std::uint16_t>(portValue);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid port: " + value);
    }
}

std::size_t parseThreads(const std::string& value) {
    try {
        const auto parsed = std::stoul(value);
        if (parsed == 0U) {
            throw std::out_of_range("threads must be >= 1");
        }
        return static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid thread count: " + value);
    }
}

std::string parseStorage(const std::string& value) {
    const auto normalized = toLower(trim(value));
    if (normalized == "memory" || normalized == "duck") {
        return normalized;
    }
    throw std::runtime_error("Invalid storage: " + value);
}

double parseFraction(const std::string& value, const std::string& label) {
    double parsed = 0.0;
    try {
        std::size_t consumed = 0;
        parsed = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
    if (!std::isfinite(parsed) || parsed < 0.0 || parsed > 1.0) {
        throw std::runtime_error(label + " must be within [0,1]: " + value);
    }
    return parsed;
}

double parseHours(const std::string& value, const std::string& label) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stod(value, &consumed);
        if (consumed != value.size() || !std::isfinite(parsed) || parsed <= 0.0) {
            throw std::out_of_range("hours must be positive");
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid hours for " + label + ": " + value);
    }
}

domain::ConfidenceMerge parseConfidenceMerge(const std::string& value) {
    const auto normalized = toLower(trim(value));
    if (normalized == "max") {
        return domain::ConfidenceMerge::KeepMax;
    }
    if (normalized == "min") {
        return domain::ConfidenceMerge::KeepMin;
    }
    throw std::runtime_error("Invalid confidence merge policy: " + value);
}

// "discord:48:168,kt_technical:336:672"
void applyStaleness(const std::string& value, domain::StalenessPolicy& policy) {
    for (const auto& entry : split(value, ',')) {
        if (entry.empty()) {
            continue;
        }
        const auto parts = split(entry, ':');
        if (parts.size() != 3U) {
            throw std::runtime_error("Invalid staleness entry (expected source:softHours:hardHours): " + entry);
        }
        const auto source = domain::sourceFromString(parts[0]);
        if (!source) {
            throw std::runtime_error("Unknown source in staleness entry: " + parts[0]);
        }

        const auto toSeconds = [](double hours) {
            return std::chrono::seconds(static_cast<std::int64_t>(std::llround(hours * 3600.0)));
        };
        domain::StalenessThresholds thresholds;
        thresholds.soft = toSeconds(parseHours(parts[1], entry));
        thresholds.hard = toSeconds(parseHours(parts[2], entry));
        if (thresholds.hard < thresholds.soft) {
            throw std::runtime_error("Hard staleness threshold below soft threshold: " + entry);
        }
        policy.set(*source, thresholds);
    }
}

std::chrono::seconds parseSkew(const std::string& value, const std::string& label) {
    return std::chrono::seconds(static_cast<std::int64_t>(std::llround(parseHours(value, label) * 3600.0)));
}

void applyWeights(const std::string& value, domain::ScoringSettings& scoring) {
    const auto parts = split(value, ',');
    if (parts.size() != 3U) {
        throw std::runtime_error("Invalid score weights (expected bias,proximity,recency): " + value);
    }
    scoring.biasWeight = parseFraction(parts[0], "bias weight");
    scoring.proximityWeight = parseFraction(parts[1], "proximity weight");
    scoring.recencyWeight = parseFraction(parts[2], "recency weight");
}

bool parseBool(const std::string& value) {
    const auto normalized = toLower(value);
    if (normalized == "true" || normalized == "1" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "false" || normalized == "0" || normalized == "no" || normalized == "off") {
        return false;
    }
    throw std::runtime_error("Invalid boolean value: " + value);
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

std::string valueFromEnv(const char* name) {
    const char* raw = std::getenv(name);
    return raw != nullptr ? trim(raw) : std::string{};
}

}  // namespace

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    if (auto envPort = valueFromEnv("PORT"); !envPort.empty()) {
        config.port = parsePort(envPort);
    }
    if (auto envLogLevel = valueFromEnv("LOG_LEVEL"); !envLogLevel.empty()) {
        config.logLevel = cfe::log::levelFromString(toLower(envLogLevel));
    }
    if (auto envDuck = valueFromEnv("DUCKDB_PATH"); !envDuck.empty()) {
        config.duckdbPath = std::move(envDuck);
    }
    if (auto envTolerance = valueFromEnv("MERGE_TOLERANCE"); !envTolerance.empty()) {
        config.engine.levels.mergeTolerance = parseFraction(envTolerance, "MERGE_TOLERANCE");
    }
    if (auto envStaleness = valueFromEnv("STALENESS_THRESHOLDS"); !envStaleness.empty()) {
        applyStaleness(envStaleness, config.engine.staleness);
    }
    if (auto envSkew = valueFromEnv("MAX_FUTURE_SKEW_HOURS"); !envSkew.empty()) {
        config.engine.maxFutureSkew = parseSkew(envSkew, "MAX_FUTURE_SKEW_HOURS");
    }

    if (auto portArg = valueFromArgs(argc, argv, "--port"); !portArg.empty()) {
        config.port = parsePort(portArg);
    }
    if (auto levelArg = valueFromArgs(argc, argv, "--log-level"); !levelArg.empty()) {
        config.logLevel = cfe::log::levelFromString(toLower(levelArg));
    }
    if (auto threadsArg = valueFromArgs(argc, argv, "--threads"); !threadsArg.empty()) {
        config.threads = parseThreads(threadsArg);
    }
    if (auto storageArg = valueFromArgs(argc, argv, "--storage"); !storageArg.empty()) {
        config.storage = parseStorage(storageArg);
    }
    if (auto duckArg = valueFromArgs(argc, argv, "--duckdb"); !duckArg.empty()) {
        config.duckdbPath = trim(duckArg);
    }
    if (auto seedArg = valueFromArgs(argc, argv, "--seed"); !seedArg.empty()) {
        config.seedPath = trim(seedArg);
    }
    if (auto toleranceArg = valueFromArgs(argc, argv, "--merge-tolerance"); !toleranceArg.empty()) {
        config.engine.levels.mergeTolerance = parseFraction(toleranceArg, "--merge-tolerance");
    }
    if (auto floorArg = valueFromArgs(argc, argv, "--confidence-floor"); !floorArg.empty()) {
        config.engine.levels.lowConfidenceFloor = parseFraction(floorArg, "--confidence-floor");
    }
    if (auto mergeArg = valueFromArgs(argc, argv, "--confidence-merge"); !mergeArg.empty()) {
        config.engine.levels.confidenceMerge = parseConfidenceMerge(mergeArg);
    }
    if (auto stalenessArg = valueFromArgs(argc, argv, "--staleness"); !stalenessArg.empty()) {
        applyStaleness(stalenessArg, config.engine.staleness);
    }
    if (auto weightsArg = valueFromArgs(argc, argv, "--score-weights"); !weightsArg.empty()) {
        applyWeights(weightsArg, config.engine.scoring);
    }
    if (auto skewArg = valueFromArgs(argc, argv, "--max-future-skew"); !skewArg.empty()) {
        config.engine.maxFutureSkew = parseSkew(skewArg, "--max-future-skew");
    }
    if (auto corsEnableArg = valueFromArgs(argc, argv, "--http.cors.enable"); !corsEnableArg.empty()) {
        config.httpCorsEnable = parseBool(corsEnableArg);
    }
    if (auto corsOriginArg = valueFromArgs(argc, argv, "--http.cors.origin"); !corsOriginArg.empty()) {
        config.httpCorsOrigin = trim(corsOriginArg);
    }

    if (config.engine.levels.mergeTolerance <= 0.0) {
        throw std::runtime_error("Merge tolerance must be positive");
    }
    if (config.storage == "duck" && config.duckdbPath.empty()) {
        throw std::runtime_error("--storage duck requires a DuckDB path");
    }

    return config;
}

}  // namespace cfe::common
