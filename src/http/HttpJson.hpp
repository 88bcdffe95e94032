#pragma once

#include <boost/json/value.hpp>

#include "api/Controllers.hpp"

namespace cfe::http {

// Serializes a JSON value into the response and sets the status line.
void write_json(cfe::api::Response& response, const boost::json::value& value, int statusCode = 200);

}  // namespace cfe::http
