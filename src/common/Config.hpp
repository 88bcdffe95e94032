#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "common/Log.hpp"
#include "domain/Settings.hpp"

namespace cfe::common {

struct Config {
    std::uint16_t port = 8080;
    cfe::log::Level logLevel = cfe::log::Level::Info;
    std::size_t threads = 4;
    std::string storage = "memory";
    std::string duckdbPath = "data/confluence.duckdb";
    std::string seedPath;

    domain::EngineSettings engine{};

    bool httpCorsEnable = false;
    std::string httpCorsOrigin;

    // Defaults, then environment variables, then command-line flags.
    // Throws std::runtime_error on any malformed value.
    static Config fromArgs(int argc, char** argv);
};

}  // namespace cfe::common
