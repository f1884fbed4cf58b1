#pragma once

#include <string_view>

namespace waypoint::http {

inline constexpr std::string_view Allow = "Allow";
inline constexpr std::string_view ContentType = "Content-Type";

inline constexpr std::string_view ContentTypeTextPlain = "text/plain";
inline constexpr std::string_view ContentTypeTextHtml = "text/html";
inline constexpr std::string_view ContentTypeApplicationJson = "application/json";

}  // namespace waypoint::http
