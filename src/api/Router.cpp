#include "api/Router.hpp"

#include <exception>
#include <string_view>
#include <utility>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "http/ErrorCodes.hpp"
#include "http/json_error.hpp"

namespace cfe::api {

namespace {

constexpr std::string_view kSymbolsPrefix = "/api/v1/symbols/";
constexpr std::string_view kLevelsSegment = "levels";

std::string makeKey(const std::string& method, const std::string& path) {
    return method + ' ' + path;
}

std::vector<std::string> splitSegments(std::string_view path) {
    std::vector<std::string> segments;
    std::size_t start = 0;
    while (start <= path.size()) {
        const auto end = path.find('/', start);
        const auto segment = path.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
        segments.emplace_back(segment);
        if (end == std::string_view::npos) {
            break;
        }
        start = end + 1;
    }
    return segments;
}

Response errorResponse(int statusCode, std::string_view code) {
    Response response{};
    cfe::http::json_error(response, statusCode, code);
    return response;
}

}  // namespace

Router::Router() {
    routes_.emplace(makeKey("GET", "/healthz"), [](const Request&) { return healthz(); });
    routes_.emplace(makeKey("GET", "/version"), [](const Request&) { return version(); });
    routes_.emplace(makeKey("GET", "/stats"), [](const Request& request) { return stats(request); });
    routes_.emplace(makeKey("GET", "/api/v1/symbols"), [](const Request& request) { return symbols(request); });
    routes_.emplace(makeKey("GET", "/api/v1/confluence/opportunities"),
                    [](const Request& request) { return opportunities(request); });
    routes_.emplace(makeKey("POST", "/api/v1/ingest"), [](const Request& request) { return ingest(request); });
}

std::optional<Router::Match> Router::matchSymbolRoute(const Request& request, bool& pathKnown) const {
    pathKnown = false;
    if (request.path.size() <= kSymbolsPrefix.size()
        || request.path.compare(0, kSymbolsPrefix.size(), kSymbolsPrefix) != 0) {
        return std::nullopt;
    }

    const auto segments = splitSegments(std::string_view(request.path).substr(kSymbolsPrefix.size()));
    if (segments.empty() || segments.front().empty()) {
        return std::nullopt;
    }
    const auto symbol = segments.front();

    if (segments.size() == 1U) {
        pathKnown = true;
        if (request.method != "GET") {
            return std::nullopt;
        }
        return Match{"GET /api/v1/symbols/:symbol",
                     [symbol](const Request& r) { return symbolDetail(r, symbol); }};
    }

    if (segments[1] != kLevelsSegment) {
        return std::nullopt;
    }

    if (segments.size() == 2U) {
        pathKnown = true;
        if (request.method != "GET") {
            return std::nullopt;
        }
        return Match{"GET /api/v1/symbols/:symbol/levels",
                     [symbol](const Request& r) { return symbolLevels(r, symbol); }};
    }

    if (segments.size() == 3U && !segments[2].empty()) {
        pathKnown = true;
        const auto id = segments[2];
        if (request.method == "DELETE") {
            return Match{"DELETE /api/v1/symbols/:symbol/levels/:id",
                         [symbol, id](const Request& r) { return dismissLevel(r, symbol, id); }};
        }
        if (request.method == "PATCH") {
            return Match{"PATCH /api/v1/symbols/:symbol/levels/:id",
                         [symbol, id](const Request& r) { return updateLevel(r, symbol, id); }};
        }
        return std::nullopt;
    }

    return std::nullopt;
}

Response Router::handle(const Request& request) const {
    std::string routeKey = makeKey(request.method, request.path);
    Handler handler;
    bool pathKnown = false;

    if (const auto it = routes_.find(routeKey); it != routes_.end()) {
        handler = it->second;
    } else if (auto match = matchSymbolRoute(request, pathKnown)) {
        routeKey = std::move(match->routeKey);
        handler = std::move(match->handler);
    } else {
        for (const auto& [key, unused] : routes_) {
            (void)unused;
            const auto space = key.find(' ');
            if (key.compare(space + 1, std::string::npos, request.path) == 0) {
                pathKnown = true;
                break;
            }
        }
        if (pathKnown) {
            return errorResponse(405, cfe::http::errors::method_not_allowed);
        }
        return errorResponse(404, cfe::http::errors::not_found);
    }

    auto& registry = common::metrics::Registry::instance();
    registry.incrementRequest(routeKey);
    common::metrics::Registry::ScopedTimer timer(routeKey);
    try {
        return handler(request);
    } catch (const std::exception& ex) {
        LOG_ERR("Unhandled error on " << routeKey << ": " << ex.what());
        registry.incrementCounter("http.internal_errors");
        return errorResponse(500, cfe::http::errors::internal_error);
    }
}

}  // namespace cfe::api
