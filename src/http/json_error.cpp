#include "http/json_error.hpp"

#include <boost/json/object.hpp>
#include <boost/json/serialize.hpp>

namespace cfe::http {

const char* status_reason(int statusCode) noexcept {
    switch (statusCode) {
    case 200:
        return "OK";
    case 204:
        return "No Content";
    case 400:
        return "Bad Request";
    case 404:
        return "Not Found";
    case 405:
        return "Method Not Allowed";
    case 413:
        return "Payload Too Large";
    case 500:
        return "Internal Server Error";
    case 503:
        return "Service Unavailable";
    default:
        break;
    }
    return "Unknown";
}

void json_error(cfe::api::Response& response, int statusCode, std::string_view errorCode) {
    boost::json::object payload;
    payload["error"] = boost::json::string_view(errorCode.data(), errorCode.size());

    response.body = boost::json::serialize(payload);
    response.statusCode = statusCode;
    response.statusText = status_reason(statusCode);
    response.contentType = "application/json; charset=utf-8";
    response.headers.clear();
}

}  // namespace cfe::http
