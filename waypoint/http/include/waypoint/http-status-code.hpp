#pragma once

#include <cstdint>
#include <string_view>

namespace waypoint::http {

using StatusCode = int16_t;

inline constexpr StatusCode StatusCodeOK = 200;
inline constexpr StatusCode StatusCodeCreated = 201;
inline constexpr StatusCode StatusCodeAccepted = 202;
inline constexpr StatusCode StatusCodeNoContent = 204;

inline constexpr StatusCode StatusCodeBadRequest = 400;
inline constexpr StatusCode StatusCodeUnauthorized = 401;
inline constexpr StatusCode StatusCodeForbidden = 403;
inline constexpr StatusCode StatusCodeNotFound = 404;
inline constexpr StatusCode StatusCodeMethodNotAllowed = 405;

inline constexpr StatusCode StatusCodeInternalServerError = 500;

// Standard reason phrase of the status codes above, empty for others.
constexpr std::string_view ReasonPhraseFor(StatusCode statusCode) {
  switch (statusCode) {
    case StatusCodeOK:
      return "OK";
    case StatusCodeCreated:
      return "Created";
    case StatusCodeAccepted:
      return "Accepted";
    case StatusCodeNoContent:
      return "No Content";
    case StatusCodeBadRequest:
      return "Bad Request";
    case StatusCodeUnauthorized:
      return "Unauthorized";
    case StatusCodeForbidden:
      return "Forbidden";
    case StatusCodeNotFound:
      return "Not Found";
    case StatusCodeMethodNotAllowed:
      return "Method Not Allowed";
    case StatusCodeInternalServerError:
      return "Internal Server Error";
    default:
      return {};
  }
}

}  // namespace waypoint::http
