#include "app/SeedLoader.hpp"

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/json/parse.hpp>

#include "common/Log.hpp"
#include "http/RecordCodec.hpp"

namespace app {

BatchSummary loadSeedFile(ConfluenceEngine& engine, const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Unable to open seed file: " + path);
    }

    std::vector<domain::ExtractionRecord> records;
    std::vector<std::string> errors;
    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(input, line)) {
        ++lineNumber;
        const auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }

        boost::json::error_code ec;
        const auto value = boost::json::parse(line, ec);
        if (ec) {
            errors.push_back(path + ":" + std::to_string(lineNumber) + ": " + ec.message());
            continue;
        }
        try {
            records.push_back(cfe::http::decode_record(value));
        } catch (const cfe::http::RecordDecodeError& ex) {
            errors.push_back(path + ":" + std::to_string(lineNumber) + ": " + ex.what());
        }
    }

    auto summary = engine.ingestBatch(records);
    for (const auto& error : errors) {
        LOG_WARN("Seed record rejected " << error);
        ++summary.rejected;
        summary.errors.push_back(error);
    }
    LOG_INFO("Seed file " << path << " loaded: " << records.size() << " records decoded, " << errors.size()
                          << " undecodable");
    return summary;
}

}  // namespace app
