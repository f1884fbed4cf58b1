#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "waypoint/path-params.hpp"
#include "waypoint/vector.hpp"

namespace waypoint {

struct ParameterSpec {
  bool operator==(const ParameterSpec&) const = default;

  std::string name;
  ParamKind kind{ParamKind::String};
};

// Compiled form of a path template such as "/users/{id:int}/files/{path:multipath}".
//
// Template syntax:
//   - Literal characters are matched verbatim (regex meta characters are escaped in regexStr()).
//   - "{name}" declares a String parameter, "{name:kind}" a parameter of given kind, with kind one of
//     "str", "int", "float", "uuid" or "multipath".
//   - A "multipath" parameter may span several segments, slashes included, and may be empty.
//   - Wildcards ('*') are not supported, use a multipath parameter instead.
//
// The template is normalized first: trailing slashes are stripped, except for the root path "/".
// Construction throws std::invalid_argument for any malformed template.
// A compiled pattern is immutable and can be shared between threads.
class PathPattern {
 public:
  struct Token {
    enum class Type : std::uint8_t { Literal, Param };

    [[nodiscard]] Type type() const noexcept { return literal.empty() ? Type::Param : Type::Literal; }

    bool operator==(const Token&) const = default;

    std::string literal;     // non empty when Type::Literal
    uint32_t paramPos{0};    // position in params() when Type::Param
  };

  explicit PathPattern(std::string_view pathTemplate);

  // The normalized template.
  [[nodiscard]] std::string_view str() const noexcept { return _template; }

  // Literal fragments and parameters, in template order.
  [[nodiscard]] std::span<const Token> tokens() const noexcept { return _tokens; }

  // Parameters, in template order. This is also the capture group order of regexStr().
  [[nodiscard]] std::span<const ParameterSpec> params() const noexcept { return _params; }

  [[nodiscard]] const ParameterSpec* findParam(std::string_view name) const noexcept;

  // Number of '/' separated segments of the normalized template ("/" counts as 1).
  [[nodiscard]] uint32_t segmentCount() const noexcept { return _segmentCount; }

  // true if one of the parameters is MultiSegment, meaning that a matching path may have more
  // segments than the template.
  [[nodiscard]] bool hasTailParameter() const noexcept { return _hasTailParameter; }

  // The anchored regular expression describing the paths accepted by match(), for diagnostics.
  // match() does not run it: it walks the tokens directly, so its stack use does not depend on the path length.
  [[nodiscard]] std::string_view regexStr() const noexcept { return _regexStr; }

  // Runs the full matcher against 'path' as given (no normalization, no segment pre-check) and
  // converts the captures according to their kind.
  // Returns std::nullopt if the path does not match or if a conversion fails (for instance an
  // integer that overflows int64_t).
  [[nodiscard]] std::optional<PathParams> match(std::string_view path) const;

  // Builds a concrete path from the template, substituting each parameter by its value in 'params'.
  // Throws std::invalid_argument if a parameter is missing, or if the produced path would not be
  // matched by this pattern.
  [[nodiscard]] std::string expand(const PathParams& params) const;

 private:
  void compile();

  std::string _template;
  std::string _regexStr;
  vector<Token> _tokens;
  vector<ParameterSpec> _params;
  uint32_t _segmentCount{1};
  bool _hasTailParameter{false};
};

// Strips trailing slashes of 'path', except when it is the root path.
// "" and "///" both give "/".
std::string_view NormalizeTrailingSlash(std::string_view path) noexcept;

// Number of '/' separated segments of 'path'. The root path (and the empty path) count as 1 segment.
// A trailing slash counts as an additional, empty segment: "/a/b" -> 2, "/a/b/" -> 3.
uint32_t CountPathSegments(std::string_view path) noexcept;

// Joins a mount prefix and a path template, normalizing the separator between them.
// The prefix gets a leading slash if it lacks one and loses its trailing slashes.
// Examples:
//   ("/api", "/users")  -> "/api/users"
//   ("/api/", "/users") -> "/api/users"
//   ("api", "users")    -> "/api/users"
//   ("", "/users")      -> "/users"
//   ("/api", "/")       -> "/api/"  (normalized to "/api" by PathPattern)
std::string JoinPaths(std::string_view prefix, std::string_view path);

}  // namespace waypoint
