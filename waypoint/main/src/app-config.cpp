#include "waypoint/app-config.hpp"

#include <stdexcept>

#include "waypoint/log.hpp"

namespace waypoint {

AppConfig& AppConfig::withLogLevel(log::level::level_enum level) {
  logLevel = level;
  return *this;
}

AppConfig& AppConfig::withExposeErrorDetails(bool expose) {
  exposeErrorDetails = expose;
  return *this;
}

void AppConfig::validate() const {
  if (logLevel && (*logLevel < log::level::trace || *logLevel >= log::level::n_levels)) {
    throw std::invalid_argument("Invalid log level");
  }
}

}  // namespace waypoint
