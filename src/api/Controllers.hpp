#pragma once

#include <string>
#include <utility>
#include <vector>

namespace cfe::api {

struct Request {
    std::string method;
    std::string target;
    std::string path;
    std::string query;
    std::string version;
    std::string body;
};

struct Response {
    int statusCode;
    std::string statusText;
    std::string body;
    std::string contentType;
    std::vector<std::pair<std::string, std::string>> headers;
};

Response healthz();

Response version();

Response stats(const Request& request);

Response symbols(const Request& request);

Response symbolDetail(const Request& request, const std::string& symbol);

Response symbolLevels(const Request& request, const std::string& symbol);

Response dismissLevel(const Request& request, const std::string& symbol, const std::string& levelId);

// Body: any of price, level_type, direction, is_active.
Response updateLevel(const Request& request, const std::string& symbol, const std::string& levelId);

Response opportunities(const Request& request);

Response ingest(const Request& request);

}  // namespace cfe::api
