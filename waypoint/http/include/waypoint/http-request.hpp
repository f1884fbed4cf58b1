#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "waypoint/http-header.hpp"
#include "waypoint/http-method.hpp"
#include "waypoint/path-params.hpp"
#include "waypoint/vector.hpp"

namespace waypoint {

// URL decoded query parameter.
struct QueryParam {
  bool operator==(const QueryParam&) const = default;

  std::string key;
  std::string value;
};

// Request carrier handed to middleware and route handlers.
// It is filled by the protocol layer; the routing core only reads the method and path
// and stores the converted path parameters of the matched route.
class HttpRequest {
 public:
  // 'target' is the request target: a path optionally followed by '?' and a query string.
  // An empty path is treated as "/".
  HttpRequest(http::Method method, std::string_view target, std::string body = {});

  // The method of the request (GET, PUT, ...)
  [[nodiscard]] http::Method method() const noexcept { return _method; }

  // The path (the target without the query string). It cannot be empty.
  // Example:
  //  GET /path           -> '/path'
  //  GET /path?key=val   -> '/path'
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // Raw query string, without the leading '?'. Empty if absent.
  [[nodiscard]] std::string_view queryString() const noexcept { return _queryString; }

  // URL decoded query parameters ('+' is decoded as a space), in order of appearance, duplicates included.
  // A parameter without '=' has an empty value. Empty pairs are skipped.
  // Example:
  //   ?tags=a&tags=b+c&flag -> {tags, a}, {tags, b c}, {flag, ""}
  [[nodiscard]] std::span<const QueryParam> queryParams() const noexcept { return _queryParams; }

  // First value of query parameter 'key', or std::nullopt if absent.
  [[nodiscard]] std::optional<std::string_view> queryParamValue(std::string_view key) const noexcept;

  // All values of query parameter 'key', in order of appearance. Empty if absent.
  [[nodiscard]] vector<std::string_view> queryParamValues(std::string_view key) const;

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  [[nodiscard]] std::span<const http::Header> headers() const noexcept { return _headers; }

  // Returns the header value for the given key (case-insensitive lookup) or std::nullopt if absent.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view headerKey) const noexcept {
    return http::FindHeaderValue(_headers, headerKey);
  }

  // Like headerValue() but returns an empty string_view when absent.
  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view headerKey) const noexcept {
    return headerValue(headerKey).value_or(std::string_view{});
  }

  // Sets (or replaces) a header.
  HttpRequest& header(std::string_view key, std::string_view value) & {
    http::SetHeader(_headers, key, value);
    return *this;
  }

  HttpRequest&& header(std::string_view key, std::string_view value) && {
    http::SetHeader(_headers, key, value);
    return std::move(*this);
  }

  // Converted path parameters of the matched route. Empty until the request has been routed.
  [[nodiscard]] const PathParams& pathParams() const noexcept { return _pathParams; }

  void setPathParams(PathParams pathParams) { _pathParams = std::move(pathParams); }

 private:
  std::string _path;
  std::string _queryString;
  vector<QueryParam> _queryParams;
  std::string _body;
  http::Headers _headers;
  PathParams _pathParams;
  http::Method _method;
};

}  // namespace waypoint
