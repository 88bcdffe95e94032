#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "common/Config.hpp"

namespace {

// Restores the variable on scope exit so the test leaves the process as it found it.
struct EnvGuard {
    explicit EnvGuard(std::string variable) : name(std::move(variable)) {
        const char* current = std::getenv(name.c_str());
        if (current) {
            originalValue = current;
            hadOriginal = true;
        }
    }

    ~EnvGuard() {
        if (hadOriginal) {
            ::setenv(name.c_str(), originalValue.c_str(), 1);
        } else {
            ::unsetenv(name.c_str());
        }
    }

    void clear() { ::unsetenv(name.c_str()); }

    void set(const std::string& value) { ::setenv(name.c_str(), value.c_str(), 1); }

    std::string name;
    bool hadOriginal{false};
    std::string originalValue;
};

::cfe::common::Config runConfig(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    return ::cfe::common::Config::fromArgs(static_cast<int>(argv.size()), argv.data());
}

bool rejects(const std::vector<std::string>& args) {
    try {
        runConfig(args);
    } catch (const std::exception&) {
        return true;
    }
    return false;
}

}  // namespace

int main() {
    EnvGuard portEnv{"PORT"};
    EnvGuard duckEnv{"DUCKDB_PATH"};
    EnvGuard toleranceEnv{"MERGE_TOLERANCE"};
    EnvGuard stalenessEnv{"STALENESS_THRESHOLDS"};
    EnvGuard logEnv{"LOG_LEVEL"};
    portEnv.clear();
    duckEnv.clear();
    toleranceEnv.clear();
    stalenessEnv.clear();
    logEnv.clear();

    // Defaults when env and flags are absent.
    {
        const auto config = runConfig({"app"});
        if (config.port != 8080 || config.storage != "memory" || config.duckdbPath != "data/confluence.duckdb"
            || config.threads != 4U || config.httpCorsEnable) {
            std::cerr << "Unexpected defaults\n";
            return 1;
        }
        if (config.engine.levels.mergeTolerance != 0.015 || config.engine.scoring.biasWeight != 0.6
            || config.engine.levels.confidenceMerge != domain::ConfidenceMerge::KeepMax) {
            std::cerr << "Unexpected engine defaults\n";
            return 1;
        }
        if (config.engine.staleness.thresholds(domain::Source::Discord).soft != std::chrono::hours(48)) {
            std::cerr << "Unexpected default discord staleness\n";
            return 1;
        }
    }

    // Environment applies, flags override it.
    {
        portEnv.set("9000");
        duckEnv.set("/tmp/confluence/env.duckdb");
        toleranceEnv.set("0.02");
        const auto fromEnv = runConfig({"app"});
        if (fromEnv.port != 9000 || fromEnv.duckdbPath != "/tmp/confluence/env.duckdb"
            || fromEnv.engine.levels.mergeTolerance != 0.02) {
            std::cerr << "Environment variables not applied\n";
            return 1;
        }

        const auto fromFlags = runConfig({"app", "--port", "9100", "--duckdb=/tmp/confluence/flag.duckdb",
                                          "--merge-tolerance", "0.01", "--storage", "DUCK"});
        if (fromFlags.port != 9100 || fromFlags.duckdbPath != "/tmp/confluence/flag.duckdb"
            || fromFlags.engine.levels.mergeTolerance != 0.01 || fromFlags.storage != "duck") {
            std::cerr << "Flags should take precedence over the environment\n";
            return 1;
        }
        portEnv.clear();
        duckEnv.clear();
        toleranceEnv.clear();
    }

    // Staleness overrides, weights and merge policy.
    {
        stalenessEnv.set("twitter:12:24");
        const auto config = runConfig({"app", "--staleness", "discord:1:2.5, kt:24:48", "--score-weights",
                                       "0.5,0.3,0.2", "--confidence-merge", "min", "--confidence-floor", "0.4",
                                       "--http.cors.enable", "true", "--http.cors.origin", "*"});
        const auto& policy = config.engine.staleness;
        if (policy.thresholds(domain::Source::Twitter).hard != std::chrono::hours(24)
            || policy.thresholds(domain::Source::Discord).soft != std::chrono::hours(1)
            || policy.thresholds(domain::Source::Discord).hard != std::chrono::minutes(150)
            || policy.thresholds(domain::Source::KtTechnical).soft != std::chrono::hours(24)
            || policy.thresholds(domain::Source::Youtube).soft != std::chrono::hours(24 * 7)) {
            std::cerr << "Staleness overrides not applied\n";
            return 1;
        }
        if (config.engine.scoring.biasWeight != 0.5 || config.engine.scoring.proximityWeight != 0.3
            || config.engine.scoring.recencyWeight != 0.2) {
            std::cerr << "Score weights not applied\n";
            return 1;
        }
        if (config.engine.levels.confidenceMerge != domain::ConfidenceMerge::KeepMin
            || config.engine.levels.lowConfidenceFloor != 0.4 || !config.httpCorsEnable
            || config.httpCorsOrigin != "*") {
            std::cerr << "Level or CORS flags not applied\n";
            return 1;
        }
        stalenessEnv.clear();
    }

    // Future-skew allowance for observed_at.
    {
        if (runConfig({"app"}).engine.maxFutureSkew != std::chrono::hours(24)
            || runConfig({"app", "--max-future-skew", "1.5"}).engine.maxFutureSkew != std::chrono::minutes(90)) {
            std::cerr << "Future skew flag not applied\n";
            return 1;
        }
    }

    // Log level names and aliases.
    {
        if (cfe::log::levelFromString("WARNING") != cfe::log::Level::Warn
            || cfe::log::levelFromString("err") != cfe::log::Level::Error
            || std::string(cfe::log::levelToString(cfe::log::Level::Debug)) != "DEBUG") {
            std::cerr << "Log level names not recognized\n";
            return 1;
        }
    }

    // Malformed values are fatal.
    if (!rejects({"app", "--port", "70000"}) || !rejects({"app", "--threads", "0"})
        || !rejects({"app", "--storage", "postgres"}) || !rejects({"app", "--merge-tolerance", "0"})
        || !rejects({"app", "--merge-tolerance", "1.5"}) || !rejects({"app", "--staleness", "discord:48"})
        || !rejects({"app", "--staleness", "reddit:1:2"}) || !rejects({"app", "--staleness", "discord:48:24"})
        || !rejects({"app", "--score-weights", "0.5,0.5"}) || !rejects({"app", "--confidence-merge", "avg"})
        || !rejects({"app", "--log-level", "loud"}) || !rejects({"app", "--max-future-skew", "-1"})) {
        std::cerr << "Expected malformed configuration to be rejected\n";
        return 1;
    }

    return 0;
}
