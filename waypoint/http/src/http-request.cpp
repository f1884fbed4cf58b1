#include "waypoint/http-request.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "waypoint/http-method.hpp"
#include "waypoint/url-decode.hpp"
#include "waypoint/vector.hpp"

namespace waypoint {

namespace {

vector<QueryParam> ParseQueryString(std::string_view queryString) {
  vector<QueryParam> queryParams;
  while (!queryString.empty()) {
    const auto pairEnd = queryString.find('&');
    const std::string_view pair = queryString.substr(0, pairEnd);
    queryString = pairEnd == std::string_view::npos ? std::string_view{} : queryString.substr(pairEnd + 1U);
    if (pair.empty()) {
      continue;
    }
    const auto keyEnd = pair.find('=');
    QueryParam queryParam;
    queryParam.key = url::DecodeQueryComponent(pair.substr(0, keyEnd));
    if (keyEnd != std::string_view::npos) {
      queryParam.value = url::DecodeQueryComponent(pair.substr(keyEnd + 1U));
    }
    queryParams.push_back(std::move(queryParam));
  }
  return queryParams;
}

}  // namespace

HttpRequest::HttpRequest(http::Method method, std::string_view target, std::string body)
    : _body(std::move(body)), _method(method) {
  const auto questionMarkPos = target.find('?');
  if (questionMarkPos != std::string_view::npos) {
    _queryString.assign(target.substr(questionMarkPos + 1U));
    _queryParams = ParseQueryString(_queryString);
    target = target.substr(0, questionMarkPos);
  }
  if (target.empty()) {
    _path.assign(1U, '/');
  } else {
    _path.assign(target);
  }
}

std::optional<std::string_view> HttpRequest::queryParamValue(std::string_view key) const noexcept {
  for (const QueryParam& queryParam : _queryParams) {
    if (queryParam.key == key) {
      return queryParam.value;
    }
  }
  return std::nullopt;
}

vector<std::string_view> HttpRequest::queryParamValues(std::string_view key) const {
  vector<std::string_view> values;
  for (const QueryParam& queryParam : _queryParams) {
    if (queryParam.key == key) {
      values.push_back(queryParam.value);
    }
  }
  return values;
}

}  // namespace waypoint
