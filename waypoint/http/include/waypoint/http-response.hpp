#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "waypoint/http-constants.hpp"
#include "waypoint/http-header.hpp"
#include "waypoint/http-status-code.hpp"

namespace waypoint {

// Response value produced by route handlers and middleware.
// Serialization to the wire is the job of the protocol layer.
class HttpResponse {
 public:
  // Creates a response with given status code and reason.
  // If reason is empty, the standard reason phrase of the status code is used (if known).
  explicit HttpResponse(http::StatusCode code = http::StatusCodeOK, std::string_view reason = {});

  // Creates a 200 response with given body and content type.
  explicit HttpResponse(std::string_view body, std::string_view contentType = http::ContentTypeTextPlain);

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  [[nodiscard]] std::string_view reason() const noexcept { return _reason; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  [[nodiscard]] std::span<const http::Header> headers() const noexcept { return _headers; }

  // Get the value of the first header named 'key' (case-insensitive), if any.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view key) const noexcept {
    return http::FindHeaderValue(_headers, key);
  }

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view key) const noexcept {
    return headerValue(key).value_or(std::string_view{});
  }

  // Sets the status code, resetting the reason to the standard phrase.
  HttpResponse& status(http::StatusCode statusCode) & {
    setStatus(statusCode, {});
    return *this;
  }

  HttpResponse&& status(http::StatusCode statusCode) && {
    setStatus(statusCode, {});
    return std::move(*this);
  }

  // Sets or replaces the header 'key'.
  HttpResponse& header(std::string_view key, std::string_view value) & {
    http::SetHeader(_headers, key, value);
    return *this;
  }

  HttpResponse&& header(std::string_view key, std::string_view value) && {
    http::SetHeader(_headers, key, value);
    return std::move(*this);
  }

  // Appends a header, even if a header with the same name already exists.
  HttpResponse& addHeader(std::string_view key, std::string_view value) & {
    _headers.push_back(http::Header{std::string(key), std::string(value)});
    return *this;
  }

  HttpResponse&& addHeader(std::string_view key, std::string_view value) && {
    _headers.push_back(http::Header{std::string(key), std::string(value)});
    return std::move(*this);
  }

  // Replaces the body and sets the Content-Type header.
  HttpResponse& body(std::string body, std::string_view contentType = http::ContentTypeTextPlain) & {
    setBody(std::move(body), contentType);
    return *this;
  }

  HttpResponse&& body(std::string body, std::string_view contentType = http::ContentTypeTextPlain) && {
    setBody(std::move(body), contentType);
    return std::move(*this);
  }

  // Appends to the existing body, leaving the Content-Type unchanged.
  HttpResponse& appendBody(std::string_view data) & {
    _body.append(data);
    return *this;
  }

  HttpResponse&& appendBody(std::string_view data) && {
    _body.append(data);
    return std::move(*this);
  }

 private:
  void setStatus(http::StatusCode statusCode, std::string_view reason);

  void setBody(std::string body, std::string_view contentType);

  std::string _reason;
  std::string _body;
  http::Headers _headers;
  http::StatusCode _status{http::StatusCodeOK};
};

}  // namespace waypoint
