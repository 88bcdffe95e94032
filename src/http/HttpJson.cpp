#include "http/HttpJson.hpp"

#include <array>
#include <string>

#include <boost/json/serializer.hpp>

#include "http/json_error.hpp"

namespace cfe::http {

namespace {

std::string serialize_json(const boost::json::value& value) {
    boost::json::serializer sr;
    sr.reset(&value);

    std::string result;
    std::array<char, 4096> buffer{};

    while (!sr.done()) {
        boost::json::string_view chunk = sr.read(buffer.data(), buffer.size());
        result.append(chunk.data(), chunk.size());
    }

    return result;
}

}  // namespace

void write_json(cfe::api::Response& response, const boost::json::value& value, int statusCode) {
    response.body = serialize_json(value);
    response.statusCode = statusCode;
    response.statusText = status_reason(statusCode);
    response.contentType = "application/json; charset=utf-8";
    response.headers.clear();
}

}  // namespace cfe::http
