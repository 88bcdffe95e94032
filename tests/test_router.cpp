#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include <boost/json/parse.hpp>
#include <boost/json/value.hpp>

#include "api/Router.hpp"
#include "app/ConfluenceEngine.hpp"
#include "app/ServiceLocator.hpp"

namespace {

cfe::api::Request makeRequest(std::string method, std::string path, std::string query = {}, std::string body = {}) {
    cfe::api::Request request{};
    request.method = std::move(method);
    request.path = std::move(path);
    request.query = std::move(query);
    request.target = request.query.empty() ? request.path : request.path + "?" + request.query;
    request.version = "HTTP/1.1";
    request.body = std::move(body);
    return request;
}

std::string errorCode(const cfe::api::Response& response) {
    const auto json = boost::json::parse(response.body);
    const auto& text = json.as_object().at("error").as_string();
    return std::string(text.data(), text.size());
}

std::string ingestBody() {
    const auto nowMs = std::to_string(domain::toEpochMs(domain::Clock::now()) - 60'000);
    return R"([
        {"symbol_text": "NQ", "source": "kt_technical", "kind": "level",
         "level_fields": {"type": "support", "price": 17800, "confidence": 0.9}, "observed_at": )" + nowMs + R"(},
        {"symbol_text": "QQQ", "source": "discord", "kind": "level",
         "level_fields": {"type": "support", "price": 17850}, "observed_at": )" + nowMs + R"(},
        {"symbol_text": "nasdaq", "source": "kt_technical", "kind": "view",
         "view_fields": {"bias": "bullish", "strategy": "buy the dip"}, "observed_at": )" + nowMs + R"(},
        {"symbol_text": "NDX", "source": "discord", "kind": "view",
         "view_fields": {"quadrant": "buy_call"}, "observed_at": )" + nowMs + R"(},
        {"symbol_text": "DOGE", "source": "twitter", "kind": "view",
         "view_fields": {"bias": "bullish"}, "observed_at": )" + nowMs + R"(},
        {"symbol_text": "SPX", "source": "twitter", "kind": "chart"}
    ])";
}

}  // namespace

int main() {
    cfe::api::Router router;

    // Without an engine the service reports itself unavailable.
    {
        app::ServiceLocator::instance().setEngine(nullptr);
        const auto health = router.handle(makeRequest("GET", "/healthz"));
        if (health.statusCode != 503 || errorCode(health) != "engine_unavailable") {
            std::cerr << "Expected 503 before the engine is installed\n";
            return 1;
        }
    }

    app::ServiceLocator::instance().setEngine(std::make_shared<app::ConfluenceEngine>());

    {
        const auto health = router.handle(makeRequest("GET", "/healthz"));
        const auto version = router.handle(makeRequest("GET", "/version"));
        if (health.statusCode != 200 || version.statusCode != 200
            || version.body.find("confluence-engine") == std::string::npos) {
            std::cerr << "Health or version endpoint failed\n";
            return 1;
        }
    }

    // Ingest a batch with one unknown symbol and one undecodable record.
    {
        const auto response = router.handle(makeRequest("POST", "/api/v1/ingest", {}, ingestBody()));
        if (response.statusCode != 200) {
            std::cerr << "Ingest failed with " << response.statusCode << ": " << response.body << '\n';
            return 1;
        }
        const auto json = boost::json::parse(response.body).as_object();
        if (json.at("inserted").to_number<std::int64_t>() != 2 || json.at("upserted").to_number<std::int64_t>() != 2
            || json.at("rejected").to_number<std::int64_t>() != 2 || json.at("errors").as_array().size() != 2U) {
            std::cerr << "Unexpected ingest summary: " << response.body << '\n';
            return 1;
        }

        const auto bad = router.handle(makeRequest("POST", "/api/v1/ingest", {}, "{not json"));
        if (bad.statusCode != 400 || errorCode(bad) != "body_invalid") {
            std::cerr << "Malformed body must be a 400\n";
            return 1;
        }

        const auto lone = router.handle(
            makeRequest("POST", "/api/v1/ingest", {}, R"({"symbol_text": "SPX", "source": "discord", "kind": "chart"})"));
        if (lone.statusCode != 200) {
            std::cerr << "An undecodable single record is a rejection, not a bad body: " << lone.body << '\n';
            return 1;
        }
        const auto loneJson = boost::json::parse(lone.body).as_object();
        const auto& loneError = loneJson.at("errors").as_array().front().as_string();
        if (loneJson.at("rejected").to_number<std::int64_t>() != 1
            || std::string(loneError.data(), loneError.size()).rfind("[0] ", 0) != 0) {
            std::cerr << "Unexpected single record summary: " << lone.body << '\n';
            return 1;
        }
    }

    // Symbol detail, listing and opportunities.
    std::int64_t levelId = 0;
    {
        const auto detail = router.handle(makeRequest("GET", "/api/v1/symbols/qqq"));
        if (detail.statusCode != 200) {
            std::cerr << "Expected QQQ detail, got " << detail.statusCode << '\n';
            return 1;
        }
        const auto json = boost::json::parse(detail.body).as_object();
        const auto& confluence = json.at("confluence").as_object();
        if (json.at("symbol").as_string() != "QQQ" || json.at("levels").as_array().size() != 2U
            || confluence.at("classification").as_string() != "high" || !confluence.at("aligned").as_bool()
            || !json.at("trade_setup").is_string()) {
            std::cerr << "Unexpected QQQ detail: " << detail.body << '\n';
            return 1;
        }
        levelId = json.at("levels").as_array().front().as_object().at("id").to_number<std::int64_t>();

        const auto list = router.handle(makeRequest("GET", "/api/v1/symbols"));
        if (list.statusCode != 200 || boost::json::parse(list.body).as_object().at("symbols").as_array().size() != 11U) {
            std::cerr << "Expected 11 symbols in the listing\n";
            return 1;
        }

        const auto opportunities = router.handle(makeRequest("GET", "/api/v1/confluence/opportunities"));
        const auto items = boost::json::parse(opportunities.body).as_object().at("opportunities").as_array();
        if (opportunities.statusCode != 200 || items.size() != 1U
            || items.front().as_object().at("symbol").as_string() != "QQQ") {
            std::cerr << "Expected QQQ as the only opportunity: " << opportunities.body << '\n';
            return 1;
        }

        const auto missing = router.handle(makeRequest("GET", "/api/v1/symbols/DOGE"));
        if (missing.statusCode != 404 || errorCode(missing) != "symbol_not_found") {
            std::cerr << "Unknown symbol must be a 404\n";
            return 1;
        }
    }

    // Level listing with a source filter.
    {
        const auto filtered = router.handle(makeRequest("GET", "/api/v1/symbols/QQQ/levels", "source=discord"));
        const auto json = boost::json::parse(filtered.body).as_object();
        if (filtered.statusCode != 200 || json.at("levels").as_array().size() != 1U) {
            std::cerr << "Source filter should leave one level: " << filtered.body << '\n';
            return 1;
        }
        const auto badSource = router.handle(makeRequest("GET", "/api/v1/symbols/QQQ/levels", "source=reddit"));
        if (badSource.statusCode != 400 || errorCode(badSource) != "source_invalid") {
            std::cerr << "Unknown source filter must be a 400\n";
            return 1;
        }
    }

    // Dismissal.
    {
        const auto path = "/api/v1/symbols/QQQ/levels/" + std::to_string(levelId);
        const auto dismissed = router.handle(makeRequest("DELETE", path));
        if (dismissed.statusCode != 200
            || boost::json::parse(dismissed.body).as_object().at("dismissed").as_object().at("active").as_bool()) {
            std::cerr << "Dismiss should return the inactive level: " << dismissed.body << '\n';
            return 1;
        }
        if (router.handle(makeRequest("DELETE", "/api/v1/symbols/QQQ/levels/abc")).statusCode != 400
            || router.handle(makeRequest("DELETE", "/api/v1/symbols/QQQ/levels/99999")).statusCode != 404
            || router.handle(makeRequest("DELETE", "/api/v1/symbols/DOGE/levels/1")).statusCode != 404) {
            std::cerr << "Dismiss error statuses are wrong\n";
            return 1;
        }
        const auto twice = router.handle(makeRequest("DELETE", path));
        if (twice.statusCode != 404 || errorCode(twice) != "level_not_found") {
            std::cerr << "Dismissing an inactive level must be a 404\n";
            return 1;
        }
    }

    // Manual level edits.
    {
        const auto listed = router.handle(makeRequest("GET", "/api/v1/symbols/QQQ/levels", "source=kt_technical"));
        const auto ktId = boost::json::parse(listed.body)
                              .as_object()
                              .at("levels")
                              .as_array()
                              .front()
                              .as_object()
                              .at("id")
                              .to_number<std::int64_t>();
        const auto path = "/api/v1/symbols/QQQ/levels/" + std::to_string(ktId);

        const auto edited = router.handle(
            makeRequest("PATCH", path, {}, R"({"price": 17900, "level_type": "resistance", "direction": null})"));
        if (edited.statusCode != 200) {
            std::cerr << "Edit failed with " << edited.statusCode << ": " << edited.body << '\n';
            return 1;
        }
        const auto updated = boost::json::parse(edited.body).as_object().at("updated").as_object();
        if (updated.at("price").to_number<double>() != 17900.0 || updated.at("type").as_string() != "resistance") {
            std::cerr << "Edit not applied: " << edited.body << '\n';
            return 1;
        }

        const auto revived = router.handle(makeRequest("PATCH",
                                                       "/api/v1/symbols/QQQ/levels/" + std::to_string(levelId),
                                                       {},
                                                       R"({"is_active": true})"));
        if (revived.statusCode != 200
            || !boost::json::parse(revived.body).as_object().at("updated").as_object().at("active").as_bool()) {
            std::cerr << "Edit should be able to reactivate a dismissed level: " << revived.body << '\n';
            return 1;
        }

        const auto negative = router.handle(makeRequest("PATCH", path, {}, R"({"price": -5})"));
        const auto empty = router.handle(makeRequest("PATCH", path, {}, "{}"));
        const auto badType = router.handle(makeRequest("PATCH", path, {}, R"({"level_type": "wall"})"));
        const std::string priceOnly = R"({"price": 1})";
        const auto unknownId = router.handle(makeRequest("PATCH", "/api/v1/symbols/QQQ/levels/99999", {}, priceOnly));
        const auto unknownSymbol = router.handle(makeRequest("PATCH", "/api/v1/symbols/DOGE/levels/1", {}, priceOnly));
        const auto wrongMethod = router.handle(makeRequest("PUT", path, {}, priceOnly));
        if (negative.statusCode != 400 || errorCode(negative) != "body_invalid" || empty.statusCode != 400
            || badType.statusCode != 400 || unknownId.statusCode != 404 || errorCode(unknownId) != "level_not_found"
            || unknownSymbol.statusCode != 404 || errorCode(unknownSymbol) != "symbol_not_found"
            || wrongMethod.statusCode != 405) {
            std::cerr << "Edit error statuses are wrong\n";
            return 1;
        }
    }

    // Unknown paths and wrong methods.
    {
        const auto unknown = router.handle(makeRequest("GET", "/api/v2/anything"));
        const auto wrongMethod = router.handle(makeRequest("DELETE", "/api/v1/symbols"));
        const auto wrongSymbolMethod = router.handle(makeRequest("POST", "/api/v1/symbols/QQQ"));
        if (unknown.statusCode != 404 || errorCode(unknown) != "not_found" || wrongMethod.statusCode != 405
            || wrongSymbolMethod.statusCode != 405) {
            std::cerr << "Unexpected routing statuses\n";
            return 1;
        }
    }

    // Handled requests show up in /stats.
    {
        const auto stats = router.handle(makeRequest("GET", "/stats"));
        const auto json = boost::json::parse(stats.body).as_object();
        if (stats.statusCode != 200 || !json.at("engine_active").as_bool()
            || !json.at("routes").as_object().contains("POST /api/v1/ingest")) {
            std::cerr << "Stats should list handled routes: " << stats.body << '\n';
            return 1;
        }
    }

    app::ServiceLocator::instance().setEngine(nullptr);
    return 0;
}
