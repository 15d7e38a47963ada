#include "glint/log/level.hpp"

#include <string>

#include "glint/core/errors.hpp"
#include "glint/core/text.hpp"

namespace glint {

const char* to_string(Level lvl) noexcept {
  switch (lvl) {
    case Level::INFO:    return "INFO";
    case Level::WARN:    return "WARN";
    case Level::ERROR:   return "ERROR";
    case Level::FATAL:   return "FATAL";
    case Level::SUCCESS: return "SUCCESS";
    case Level::DEBUG:   return "DEBUG";
    case Level::NETWORK: return "NETWORK";
    default:             return "UNKNOWN";
  }
}

Level parse_level(std::string_view name) {
  for (Level lvl : kAllLevels) {
    if (iequals(name, to_string(lvl))) return lvl;
  }
  throw ConfigError("unknown log level '" + std::string(name) + "'");
}

} // namespace glint
