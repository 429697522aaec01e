#include <mcmclab/log/logger.hpp>
#include <stdexcept>

namespace mcmclab::log {

Level parse_level(std::string_view name) {
  if (name == "debug")
    return Level::debug;
  if (name == "info")
    return Level::info;
  if (name == "warn")
    return Level::warn;
  if (name == "error")
    return Level::error;
  if (name == "off")
    return Level::off;
  throw std::invalid_argument("unknown log level: " + std::string(name));
}

} // namespace mcmclab::log
