#pragma once

#include <string>

#include "app/ConfluenceEngine.hpp"

namespace app {

// Ingests a JSON-lines file of extraction records (one record object per
// line, blank lines and lines starting with '#' skipped). Lines that fail to
// parse are counted as rejected; they never abort the load. Throws
// std::runtime_error when the file cannot be opened.
BatchSummary loadSeedFile(ConfluenceEngine& engine, const std::string& path);

}  // namespace app
