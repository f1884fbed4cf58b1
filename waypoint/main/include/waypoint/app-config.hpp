#pragma once

#include <optional>

#include "waypoint/log.hpp"

namespace waypoint {

struct AppConfig {
  // If set, level applied to the spdlog default logger when the App is created.
  // The spdlog level is process wide: it is shared by all App instances, and the last App created
  // with a level wins. Leave it unset to keep the level configured by the program.
  // Default: unset
  std::optional<log::level::level_enum> logLevel;

  // When true, the body of a 500 response produced for an unhandled exception contains the
  // exception message ("Internal Server Error: <what>"). Otherwise it is "Internal Server Error".
  // Default: true
  bool exposeErrorDetails{true};

  AppConfig& withLogLevel(log::level::level_enum level);

  AppConfig& withExposeErrorDetails(bool expose = true);

  // Throws std::invalid_argument if the configuration is invalid.
  void validate() const;
};

}  // namespace waypoint
