#include "waypoint/http-method-parse.hpp"

#include <optional>
#include <string>
#include <string_view>

#include "waypoint/ascii.hpp"
#include "waypoint/http-method.hpp"

namespace waypoint::http {

std::optional<Method> MethodStrToOptEnum(std::string_view str) {
  switch (str.size()) {
    case 3:  // GET, PUT
      switch (toupper(str[0])) {
        case 'G':
          return CaseInsensitiveEqual(str, "GET") ? std::optional<Method>(Method::GET) : std::nullopt;
        case 'P':
          return CaseInsensitiveEqual(str, "PUT") ? std::optional<Method>(Method::PUT) : std::nullopt;
        default:
          return std::nullopt;
      }

    case 4:  // HEAD, POST
      switch (toupper(str[0])) {
        case 'H':
          return CaseInsensitiveEqual(str, "HEAD") ? std::optional<Method>(Method::HEAD) : std::nullopt;
        case 'P':
          return CaseInsensitiveEqual(str, "POST") ? std::optional<Method>(Method::POST) : std::nullopt;
        default:
          return std::nullopt;
      }

    case 5:  // PATCH
      return CaseInsensitiveEqual(str, "PATCH") ? std::optional<Method>(Method::PATCH) : std::nullopt;

    case 6:  // DELETE
      return CaseInsensitiveEqual(str, "DELETE") ? std::optional<Method>(Method::DELETE) : std::nullopt;

    case 7:  // OPTIONS
      return CaseInsensitiveEqual(str, "OPTIONS") ? std::optional<Method>(Method::OPTIONS) : std::nullopt;

    default:
      return std::nullopt;
  }
}

std::optional<Method> MethodStrToOptEnumStrict(std::string_view str) {
  for (MethodIdx methodIdx = 0; methodIdx < kNbMethods; ++methodIdx) {
    if (kMethodStrings[methodIdx] == str) {
      return MethodFromIdx(methodIdx);
    }
  }
  return std::nullopt;
}

std::string MethodBmpToStr(MethodBmp methods, std::string_view separator) {
  std::string out;
  for (MethodIdx methodIdx = 0; methodIdx < kNbMethods; ++methodIdx) {
    const Method method = MethodFromIdx(methodIdx);
    if (!IsMethodSet(methods, method)) {
      continue;
    }
    if (!out.empty()) {
      out.append(separator);
    }
    out.append(MethodToStr(method));
  }
  return out;
}

}  // namespace waypoint::http
