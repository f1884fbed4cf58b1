#include "waypoint/http-response.hpp"

#include <string>
#include <string_view>
#include <utility>

#include "waypoint/http-constants.hpp"
#include "waypoint/http-header.hpp"
#include "waypoint/http-status-code.hpp"

namespace waypoint {

HttpResponse::HttpResponse(http::StatusCode code, std::string_view reason) { setStatus(code, reason); }

HttpResponse::HttpResponse(std::string_view body, std::string_view contentType) {
  setStatus(http::StatusCodeOK, {});
  setBody(std::string(body), contentType);
}

void HttpResponse::setStatus(http::StatusCode statusCode, std::string_view reason) {
  _status = statusCode;
  _reason.assign(reason.empty() ? http::ReasonPhraseFor(statusCode) : reason);
}

void HttpResponse::setBody(std::string body, std::string_view contentType) {
  _body = std::move(body);
  http::SetHeader(_headers, http::ContentType, contentType);
}

}  // namespace waypoint
