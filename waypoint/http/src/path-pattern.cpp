#include "waypoint/path-pattern.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "waypoint/ascii.hpp"
#include "waypoint/log.hpp"
#include "waypoint/path-params.hpp"
#include "waypoint/stringconv.hpp"
#include "waypoint/uuid.hpp"
#include "waypoint/vector.hpp"

namespace waypoint {

namespace {

constexpr std::string_view kRegexMetaChars = R"(.^$+?()[]{}|\)";

constexpr std::string_view RegexForKind(ParamKind kind) {
  switch (kind) {
    case ParamKind::Integer:
      return R"((\d+))";
    case ParamKind::Float:
      return R"((\d+(?:\.\d+)?))";
    case ParamKind::Uuid:
      return "([0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12})";
    case ParamKind::MultiSegment:
      return "(.*)";
    default:
      return "([^/]+)";
  }
}

std::optional<PathParamValue> ConvertCapture(ParamKind kind, std::string_view raw) {
  switch (kind) {
    case ParamKind::Integer:
      if (auto val = StringToIntegral<int64_t>(raw)) {
        return PathParamValue(*val);
      }
      return std::nullopt;
    case ParamKind::Float:
      if (auto val = StringToDouble(raw)) {
        return PathParamValue(*val);
      }
      return std::nullopt;
    case ParamKind::Uuid:
      if (auto val = Uuid::Parse(raw)) {
        return PathParamValue(*val);
      }
      return std::nullopt;
    default:
      return PathParamValue(std::string(raw));
  }
}

constexpr bool IsLowerHexDigit(char ch) noexcept { return IsDigit(ch) || (ch >= 'a' && ch <= 'f'); }

constexpr std::size_t kUuidLength = 36;

bool HasUuidShape(std::string_view str) noexcept {
  if (str.size() != kUuidLength) {
    return false;
  }
  for (std::size_t pos = 0; pos < kUuidLength; ++pos) {
    const bool hyphenPos = pos == 8U || pos == 13U || pos == 18U || pos == 23U;
    if (hyphenPos ? str[pos] != '-' : !IsLowerHexDigit(str[pos])) {
      return false;
    }
  }
  return true;
}

std::size_t DigitRunEnd(std::string_view path, std::size_t pos) noexcept {
  while (pos < path.size() && IsDigit(path[pos])) {
    ++pos;
  }
  return pos;
}

// Inclusive range of possible end positions of a capture, tried from 'last' down to 'first'.
struct EndRange {
  std::size_t first;
  std::size_t last;
};

// Walks the tokens of a pattern over a path with the same semantics as its anchored regex
// (greedy captures, leftmost alternative first), without a recursion depth depending on the path.
// Recursion depth is bounded by the number of tokens of the template.
class TokenWalker {
 public:
  TokenWalker(std::span<const PathPattern::Token> tokens, std::span<const ParameterSpec> params,
              std::string_view path, std::span<std::string_view> captures) noexcept
      : _tokens(tokens), _params(params), _path(path), _captures(captures) {}

  bool matchFrom(std::size_t tokenPos, std::size_t pathPos) {
    if (tokenPos == _tokens.size()) {
      return pathPos == _path.size();
    }
    const PathPattern::Token& token = _tokens[tokenPos];
    if (token.type() == PathPattern::Token::Type::Literal) {
      return _path.substr(pathPos).starts_with(token.literal) &&
             matchFrom(tokenPos + 1U, pathPos + token.literal.size());
    }

    switch (_params[token.paramPos].kind) {
      case ParamKind::Integer:
        return tryEnds(tokenPos, pathPos, EndRange{pathPos + 1U, DigitRunEnd(_path, pathPos)});
      case ParamKind::Float: {
        // the fractional part can only follow the longest run of digits
        const std::size_t intEnd = DigitRunEnd(_path, pathPos);
        if (intEnd > pathPos && intEnd < _path.size() && _path[intEnd] == '.' &&
            tryEnds(tokenPos, pathPos, EndRange{intEnd + 2U, DigitRunEnd(_path, intEnd + 1U)})) {
          return true;
        }
        return tryEnds(tokenPos, pathPos, EndRange{pathPos + 1U, intEnd});
      }
      case ParamKind::Uuid:
        return HasUuidShape(_path.substr(pathPos, kUuidLength)) &&
               tryEnds(tokenPos, pathPos, EndRange{pathPos + kUuidLength, pathPos + kUuidLength});
      case ParamKind::MultiSegment: {
        // '.' of the regex does not match line terminators
        const std::size_t lineEnd = _path.find_first_of("\r\n", pathPos);
        return tryEnds(tokenPos, pathPos, EndRange{pathPos, lineEnd == std::string_view::npos ? _path.size() : lineEnd});
      }
      default: {
        const std::size_t slashPos = _path.find('/', pathPos);
        return tryEnds(tokenPos, pathPos,
                       EndRange{pathPos + 1U, slashPos == std::string_view::npos ? _path.size() : slashPos});
      }
    }
  }

 private:
  // Tries the capture of the parameter at 'tokenPos' starting at 'pathPos' for each end of 'range',
  // longest first. Only ends where the next token can start are visited.
  bool tryEnds(std::size_t tokenPos, std::size_t pathPos, EndRange range) {
    if (range.last < range.first) {
      return false;
    }
    const std::size_t nextTokenPos = tokenPos + 1U;
    if (nextTokenPos == _tokens.size()) {
      return range.first <= _path.size() && _path.size() <= range.last &&
             capture(tokenPos, pathPos, _path.size());
    }
    const PathPattern::Token& nextToken = _tokens[nextTokenPos];
    if (nextToken.type() == PathPattern::Token::Type::Literal) {
      for (std::size_t end = _path.rfind(nextToken.literal, range.last);
           end != std::string_view::npos && end >= range.first; end = _path.rfind(nextToken.literal, end - 1U)) {
        if (capture(tokenPos, pathPos, end)) {
          return true;
        }
        if (end == 0) {
          break;
        }
      }
      return false;
    }
    for (std::size_t end = range.last;; --end) {
      if (capture(tokenPos, pathPos, end)) {
        return true;
      }
      if (end == range.first) {
        return false;
      }
    }
  }

  bool capture(std::size_t tokenPos, std::size_t pathPos, std::size_t end) {
    _captures[_tokens[tokenPos].paramPos] = _path.substr(pathPos, end - pathPos);
    return matchFrom(tokenPos + 1U, end);
  }

  std::span<const PathPattern::Token> _tokens;
  std::span<const ParameterSpec> _params;
  std::string_view _path;
  std::span<std::string_view> _captures;
};

}  // namespace

std::string_view NormalizeTrailingSlash(std::string_view path) noexcept {
  while (!path.empty() && path.back() == '/') {
    path.remove_suffix(1U);
  }
  return path.empty() ? std::string_view("/") : path;
}

uint32_t CountPathSegments(std::string_view path) noexcept {
  std::size_t pos = 0;
  while (pos < path.size() && path[pos] == '/') {
    ++pos;
  }
  if (pos == path.size()) {
    return 1U;
  }
  uint32_t nbSegments = 1U;
  for (; pos < path.size(); ++pos) {
    nbSegments += static_cast<uint32_t>(path[pos] == '/');
  }
  return nbSegments;
}

std::string JoinPaths(std::string_view prefix, std::string_view path) {
  while (!prefix.empty() && prefix.back() == '/') {
    prefix.remove_suffix(1U);
  }
  if (prefix.empty()) {
    return std::string(path);
  }

  std::string out;
  out.reserve(prefix.size() + path.size() + 2U);
  if (prefix.front() != '/') {
    out.push_back('/');
  }
  out.append(prefix);
  if (!path.empty() && path.front() != '/') {
    out.push_back('/');
  }
  out.append(path);
  return out;
}

PathPattern::PathPattern(std::string_view pathTemplate) {
  if (pathTemplate.empty()) {
    throw std::invalid_argument("Path template cannot be empty");
  }
  _template.assign(NormalizeTrailingSlash(pathTemplate));
  compile();
}

void PathPattern::compile() {
  if (_template.front() != '/') {
    throw std::invalid_argument("Path template '" + _template + "' should start with '/'");
  }
  if (_template.find('*') != std::string::npos) {
    throw std::invalid_argument("Wildcard patterns (* and **) are not supported in '" + _template +
                                "', use a path parameter instead: {name:multipath}");
  }
  if (_template.find("//") != std::string::npos) {
    throw std::invalid_argument("Path template '" + _template + "' contains an empty segment");
  }

  _regexStr.push_back('^');

  const std::string_view tpl(_template);
  for (std::size_t pos = 0; pos < tpl.size();) {
    if (tpl[pos] != '{') {
      const char ch = tpl[pos];
      if (_tokens.empty() || _tokens.back().type() != Token::Type::Literal) {
        _tokens.emplace_back();
      }
      _tokens.back().literal.push_back(ch);
      if (kRegexMetaChars.find(ch) != std::string_view::npos) {
        _regexStr.push_back('\\');
      }
      _regexStr.push_back(ch);
      ++pos;
      continue;
    }

    const std::size_t closingPos = tpl.find('}', pos);
    if (closingPos == std::string_view::npos) {
      throw std::invalid_argument("Unclosed parameter at position " + std::to_string(pos) + " in '" + _template +
                                  "'");
    }

    std::string_view paramSpec = tpl.substr(pos + 1U, closingPos - pos - 1U);
    std::string_view name = paramSpec;
    ParamKind kind = ParamKind::String;

    const std::size_t colonPos = paramSpec.find(':');
    if (colonPos != std::string_view::npos) {
      name = paramSpec.substr(0, colonPos);
      const std::string_view kindName = paramSpec.substr(colonPos + 1U);
      const auto optKind = ParamKindFromStr(kindName);
      if (!optKind) {
        throw std::invalid_argument("Unsupported parameter type: '" + std::string(kindName) + "' in '" + _template +
                                    "'");
      }
      kind = *optKind;
    }

    if (name.empty()) {
      throw std::invalid_argument("Missing parameter name at position " + std::to_string(pos) + " in '" + _template +
                                  "'");
    }
    if (name.find_first_of("/{") != std::string_view::npos) {
      throw std::invalid_argument("Invalid parameter name '" + std::string(name) + "' in '" + _template + "'");
    }
    if (findParam(name) != nullptr) {
      throw std::invalid_argument("Duplicate parameter name '" + std::string(name) + "' in '" + _template + "'");
    }

    _tokens.emplace_back();
    _tokens.back().paramPos = static_cast<uint32_t>(_params.size());

    _params.push_back(ParameterSpec{std::string(name), kind});
    _hasTailParameter |= kind == ParamKind::MultiSegment;
    _regexStr.append(RegexForKind(kind));

    pos = closingPos + 1U;
  }

  _regexStr.push_back('$');

  _segmentCount = CountPathSegments(_template);
}

const ParameterSpec* PathPattern::findParam(std::string_view name) const noexcept {
  for (const ParameterSpec& param : _params) {
    if (param.name == name) {
      return &param;
    }
  }
  return nullptr;
}

std::optional<PathParams> PathPattern::match(std::string_view path) const {
  vector<std::string_view> captures(_params.size());
  if (!TokenWalker(_tokens, _params, path, captures).matchFrom(0, 0)) {
    return std::nullopt;
  }

  PathParams pathParams;
  for (std::size_t paramPos = 0; paramPos < _params.size(); ++paramPos) {
    const ParameterSpec& param = _params[paramPos];
    const std::string_view raw = captures[paramPos];
    auto value = ConvertCapture(param.kind, raw);
    if (!value) {
      log::debug("Path '{}' rejected by '{}': cannot convert '{}' to {}", path, _template, raw,
                 ParamKindToStr(param.kind));
      return std::nullopt;
    }
    pathParams.add(param.name, std::move(*value));
  }
  return pathParams;
}

std::string PathPattern::expand(const PathParams& params) const {
  std::string out;
  for (const Token& token : _tokens) {
    if (token.type() == Token::Type::Literal) {
      out.append(token.literal);
      continue;
    }
    const ParameterSpec& param = _params[token.paramPos];
    const PathParamValue* pValue = params.find(param.name);
    if (pValue == nullptr) {
      throw std::invalid_argument("Missing value for path parameter '" + param.name + "' of '" + _template + "'");
    }
    out.append(PathParamValueToStr(*pValue));
  }
  if (!match(out)) {
    throw std::invalid_argument("Path '" + out + "' built from parameters is not matched by '" + _template + "'");
  }
  return out;
}

}  // namespace waypoint
