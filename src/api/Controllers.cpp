#include "api/Controllers.hpp"

#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/value.hpp>

#include "app/ConfluenceEngine.hpp"
#include "app/ServiceLocator.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "domain/Models.hpp"
#include "http/ErrorCodes.hpp"
#include "http/HttpJson.hpp"
#include "http/RecordCodec.hpp"
#include "http/StateJson.hpp"
#include "http/json_error.hpp"

namespace cfe::api {

namespace {

constexpr char kVersionBody[] = R"({"name":"confluence-engine","version":"0.1.0"})";

Response makeJsonResponse(int statusCode, std::string statusText, std::string body) {
    return Response{statusCode, std::move(statusText), std::move(body), "application/json"};
}

Response errorResponse(int statusCode, std::string_view code) {
    Response response{};
    cfe::http::json_error(response, statusCode, code);
    return response;
}

Response jsonResponse(const boost::json::value& value, int statusCode = 200) {
    Response response{};
    cfe::http::write_json(response, value, statusCode);
    return response;
}

std::shared_ptr<app::ConfluenceEngine> engine() {
    return app::ServiceLocator::instance().engineHandle();
}

domain::Timestamp now() {
    return domain::Clock::now();
}

int hexDigit(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F') {
        return ch - 'A' + 10;
    }
    return -1;
}

// '+' is a space; a malformed escape is kept literally.
std::string percentDecode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        const char ch = text[i];
        if (ch == '%' && i + 2 < text.size()) {
            const int high = hexDigit(text[i + 1]);
            const int low = hexDigit(text[i + 2]);
            if (high >= 0 && low >= 0) {
                out.push_back(static_cast<char>(high * 16 + low));
                i += 3;
                continue;
            }
        }
        out.push_back(ch == '+' ? ' ' : ch);
        ++i;
    }
    return out;
}

// First value of `key` in the query string, decoded.
std::optional<std::string> queryValue(std::string_view query, std::string_view key) {
    while (!query.empty()) {
        const auto amp = query.find('&');
        const auto pair = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);

        const auto eq = pair.find('=');
        if (percentDecode(pair.substr(0, eq)) != key) {
            continue;
        }
        return eq == std::string_view::npos ? std::string{} : percentDecode(pair.substr(eq + 1));
    }
    return std::nullopt;
}

std::optional<std::string> stringField(const boost::json::object& body, std::string_view key, bool& ok) {
    const auto* value = body.if_contains(boost::json::string_view(key.data(), key.size()));
    if (value == nullptr || value->is_null()) {
        return std::nullopt;
    }
    if (!value->is_string()) {
        ok = false;
        return std::nullopt;
    }
    const auto& text = value->get_string();
    return std::string(text.data(), text.size());
}

// nullopt when the body is malformed or names no editable field.
std::optional<core::LevelEdit> decodeLevelEdit(const boost::json::value& body) {
    if (!body.is_object()) {
        return std::nullopt;
    }
    const auto& fields = body.get_object();
    core::LevelEdit edit;
    bool ok = true;

    if (const auto* price = fields.if_contains("price"); price != nullptr && !price->is_null()) {
        if (price->is_double()) {
            edit.price = price->get_double();
        } else if (price->is_int64()) {
            edit.price = static_cast<double>(price->get_int64());
        } else if (price->is_uint64()) {
            edit.price = static_cast<double>(price->get_uint64());
        } else {
            return std::nullopt;
        }
    }
    if (const auto type = stringField(fields, "level_type", ok)) {
        edit.type = domain::levelTypeFromString(*type);
        ok = ok && edit.type.has_value();
    }
    if (const auto direction = stringField(fields, "direction", ok)) {
        edit.direction = domain::levelDirectionFromString(*direction);
        ok = ok && edit.direction.has_value();
    }
    if (const auto* active = fields.if_contains("is_active"); active != nullptr && !active->is_null()) {
        if (!active->is_bool()) {
            return std::nullopt;
        }
        edit.active = active->get_bool();
    }

    if (!ok || (!edit.price && !edit.type && !edit.direction && !edit.active)) {
        return std::nullopt;
    }
    return edit;
}

std::optional<std::uint64_t> parseLevelId(const std::string& text) {
    std::uint64_t id = 0;
    const auto* begin = text.data();
    const auto* end = begin + text.size();
    const auto [ptr, ec] = std::from_chars(begin, end, id);
    if (text.empty() || ec != std::errc() || ptr != end || id == 0U) {
        return std::nullopt;
    }
    return id;
}

}  // namespace

Response healthz() {
    if (!engine()) {
        return errorResponse(503, cfe::http::errors::engine_unavailable);
    }
    return makeJsonResponse(200, "OK", R"({"status":"ok"})");
}

Response version() {
    return makeJsonResponse(200, "OK", kVersionBody);
}

Response stats(const Request&) {
    const auto snapshot = common::metrics::Registry::instance().snapshot();
    const auto uptimeSeconds =
        std::chrono::duration_cast<std::chrono::duration<double>>(snapshot.capturedAt - snapshot.startTime).count();

    auto threadCount = std::thread::hardware_concurrency();
    if (threadCount == 0U) {
        threadCount = 1U;
    }

    boost::json::object routes;
    for (const auto& [route, metrics] : snapshot.routes) {
        boost::json::object entry;
        entry["requests"] = metrics.totalRequests;
        if (metrics.p95Ms) {
            entry["p95_ms"] = *metrics.p95Ms;
        }
        if (metrics.p99Ms) {
            entry["p99_ms"] = *metrics.p99Ms;
        }
        routes[boost::json::string_view(route.data(), route.size())] = std::move(entry);
    }

    boost::json::object counters;
    for (const auto& [key, value] : snapshot.counters) {
        counters[boost::json::string_view(key.data(), key.size())] = value;
    }

    boost::json::object payload;
    payload["uptime_seconds"] = uptimeSeconds;
    payload["threads"] = threadCount;
    payload["engine_active"] = engine() != nullptr;
    payload["counters"] = std::move(counters);
    payload["routes"] = std::move(routes);
    return jsonResponse(payload);
}

Response symbols(const Request&) {
    const auto handle = engine();
    if (!handle) {
        return errorResponse(503, cfe::http::errors::engine_unavailable);
    }

    boost::json::array list;
    for (const auto& summary : handle->listSymbols(now())) {
        list.emplace_back(cfe::http::to_json(summary));
    }

    boost::json::object payload;
    payload["symbols"] = std::move(list);
    return jsonResponse(payload);
}

Response symbolDetail(const Request&, const std::string& symbol) {
    const auto handle = engine();
    if (!handle) {
        return errorResponse(503, cfe::http::errors::engine_unavailable);
    }

    const auto detail = handle->getSymbol(percentDecode(symbol), now());
    if (!detail) {
        return errorResponse(404, cfe::http::errors::symbol_not_found);
    }
    return jsonResponse(cfe::http::to_json(*detail));
}

Response symbolLevels(const Request& request, const std::string& symbol) {
    const auto handle = engine();
    if (!handle) {
        return errorResponse(503, cfe::http::errors::engine_unavailable);
    }

    std::optional<domain::Source> source;
    if (const auto raw = queryValue(request.query, "source"); raw && !raw->empty()) {
        source = domain::sourceFromString(*raw);
        if (!source) {
            return errorResponse(400, cfe::http::errors::source_invalid);
        }
    }

    const auto decoded = percentDecode(symbol);
    const auto levels = handle->levels(decoded, source, now());
    if (!levels) {
        return errorResponse(404, cfe::http::errors::symbol_not_found);
    }

    boost::json::array list;
    list.reserve(levels->size());
    for (const auto& level : *levels) {
        list.emplace_back(cfe::http::to_json(level));
    }

    const auto canonical = handle->normalizer().catalogMember(decoded).value_or(decoded);
    boost::json::object payload;
    payload["symbol"] = boost::json::string_view(canonical.data(), canonical.size());
    payload["levels"] = std::move(list);
    return jsonResponse(payload);
}

Response dismissLevel(const Request&, const std::string& symbol, const std::string& levelId) {
    const auto handle = engine();
    if (!handle) {
        return errorResponse(503, cfe::http::errors::engine_unavailable);
    }

    const auto decoded = percentDecode(symbol);
    if (!handle->normalizer().catalogMember(decoded)) {
        return errorResponse(404, cfe::http::errors::symbol_not_found);
    }
    const auto id = parseLevelId(levelId);
    if (!id) {
        return errorResponse(400, cfe::http::errors::level_id_invalid);
    }

    const auto dismissed = handle->dismissLevel(decoded, *id);
    if (!dismissed) {
        return errorResponse(404, cfe::http::errors::level_not_found);
    }

    boost::json::object payload;
    payload["dismissed"] = cfe::http::level_json(*dismissed);
    return jsonResponse(payload);
}

Response updateLevel(const Request& request, const std::string& symbol, const std::string& levelId) {
    const auto handle = engine();
    if (!handle) {
        return errorResponse(503, cfe::http::errors::engine_unavailable);
    }

    const auto decoded = percentDecode(symbol);
    if (!handle->normalizer().catalogMember(decoded)) {
        return errorResponse(404, cfe::http::errors::symbol_not_found);
    }
    const auto id = parseLevelId(levelId);
    if (!id) {
        return errorResponse(400, cfe::http::errors::level_id_invalid);
    }

    boost::json::error_code ec;
    const auto body = boost::json::parse(request.body, ec);
    if (ec) {
        return errorResponse(400, cfe::http::errors::body_invalid);
    }
    const auto edit = decodeLevelEdit(body);
    if (!edit) {
        return errorResponse(400, cfe::http::errors::body_invalid);
    }

    const auto edited = handle->updateLevel(decoded, *id, *edit);
    switch (edited.status) {
    case core::EditStatus::NotFound:
        return errorResponse(404, cfe::http::errors::level_not_found);
    case core::EditStatus::Invalid:
        LOG_WARN("Level edit rejected for id=" << *id << ": " << edited.reason);
        return errorResponse(400, cfe::http::errors::body_invalid);
    case core::EditStatus::Updated:
        break;
    }

    boost::json::array absorbed;
    for (std::size_t i = 1; i < edited.changed.size(); ++i) {
        absorbed.emplace_back(edited.changed[i].id);
    }
    boost::json::object payload;
    payload["updated"] = cfe::http::level_json(edited.changed.front());
    payload["absorbed"] = std::move(absorbed);
    return jsonResponse(payload);
}

Response opportunities(const Request&) {
    const auto handle = engine();
    if (!handle) {
        return errorResponse(503, cfe::http::errors::engine_unavailable);
    }

    boost::json::array list;
    for (const auto& state : handle->opportunities(now())) {
        list.emplace_back(cfe::http::to_json(state));
    }

    boost::json::object payload;
    payload["opportunities"] = std::move(list);
    return jsonResponse(payload);
}

Response ingest(const Request& request) {
    const auto handle = engine();
    if (!handle) {
        return errorResponse(503, cfe::http::errors::engine_unavailable);
    }

    boost::json::error_code ec;
    const auto body = boost::json::parse(request.body, ec);
    if (ec) {
        LOG_WARN("Ingest body is not valid JSON: " << ec.message());
        return errorResponse(400, cfe::http::errors::body_invalid);
    }

    cfe::http::DecodedBatch decoded;
    try {
        decoded = cfe::http::decode_batch(body);
    } catch (const cfe::http::RecordDecodeError& ex) {
        LOG_WARN("Ingest body rejected: " << ex.what());
        return errorResponse(400, cfe::http::errors::body_invalid);
    }

    auto summary = handle->ingestBatch(decoded.records);
    for (const auto& error : decoded.errors) {
        LOG_WARN("Rejected undecodable record " << error);
        ++summary.rejected;
        summary.errors.push_back(error);
    }
    common::metrics::Registry::instance().incrementCounter("ingest.rejected", decoded.errors.size());

    return jsonResponse(cfe::http::to_json(summary));
}

}  // namespace cfe::api
