#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "waypoint/http-method.hpp"

namespace waypoint::http {

// Attempt to parse a HTTP method received in a request.
// RFC 9110 §9.1: The method token is case-sensitive, BUT:
// RFC 9110 §2.5 encourages robustness:
// "Although methods are case-sensitive, the implementation SHOULD be case-insensitive when parsing received messages."
std::optional<Method> MethodStrToOptEnum(std::string_view str);

// Strict variant used when configuring routes: only the exact upper case token is accepted.
std::optional<Method> MethodStrToOptEnumStrict(std::string_view str);

// Comma separated list of the methods set in 'methods', in enum order.
// Example: GET | POST -> "GET, POST". Suitable for an 'Allow' header value.
std::string MethodBmpToStr(MethodBmp methods, std::string_view separator = ", ");

}  // namespace waypoint::http
