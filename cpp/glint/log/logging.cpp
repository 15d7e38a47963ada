#include "glint/log/logging.hpp"

namespace glint {

Logger& default_logger() {
  static Logger logger;
  return logger;
}

LoggerSettings& settings() {
  return default_logger().settings();
}

void log(std::string_view message, Level lvl) {
  default_logger().log(message, lvl);
}

void info(std::string_view message)    { log(message, Level::INFO); }
void warn(std::string_view message)    { log(message, Level::WARN); }
void error(std::string_view message)   { log(message, Level::ERROR); }
void fatal(std::string_view message)   { log(message, Level::FATAL); }
void success(std::string_view message) { log(message, Level::SUCCESS); }
void debug(std::string_view message)   { log(message, Level::DEBUG); }
void network(std::string_view message) { log(message, Level::NETWORK); }

} // namespace glint
