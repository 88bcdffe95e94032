#pragma once

#include <string_view>

namespace cfe::http::errors {

inline constexpr std::string_view symbol_not_found = "symbol_not_found";
inline constexpr std::string_view level_not_found = "level_not_found";
inline constexpr std::string_view level_id_invalid = "level_id_invalid";
inline constexpr std::string_view source_invalid = "source_invalid";
inline constexpr std::string_view body_invalid = "body_invalid";
inline constexpr std::string_view request_invalid = "request_invalid";
inline constexpr std::string_view payload_too_large = "payload_too_large";
inline constexpr std::string_view not_found = "not_found";
inline constexpr std::string_view method_not_allowed = "method_not_allowed";
inline constexpr std::string_view engine_unavailable = "engine_unavailable";
inline constexpr std::string_view internal_error = "internal_error";

}  // namespace cfe::http::errors
