#pragma once

#include <string_view>

#include "api/Controllers.hpp"

namespace cfe::http {

// Writes {"error":"<code>"} with the given status, replacing any previous body.
void json_error(cfe::api::Response& response, int statusCode, std::string_view errorCode);

// Reason phrase for the status codes the API emits.
const char* status_reason(int statusCode) noexcept;

}  // namespace cfe::http
