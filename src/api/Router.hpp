#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "api/Controllers.hpp"

namespace cfe::api {

class Router {
public:
    Router();

    Response handle(const Request& request) const;

private:
    using Handler = std::function<Response(const Request&)>;

    struct Match {
        std::string routeKey;
        Handler handler;
    };

    // Resolves /api/v1/symbols/:symbol[/levels[/:id]].
    [[nodiscard]] std::optional<Match> matchSymbolRoute(const Request& request, bool& pathKnown) const;

    std::map<std::string, Handler> routes_;
};

}  // namespace cfe::api
