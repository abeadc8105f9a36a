// sce/basic/logging.cpp - spdlog setup
#include "sce/basic/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>

namespace sce
{

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name)
{
  const spdlog::level::level_enum level = spdlog::level::from_str(std::string(name));
  // from_str maps unknown names to "off"; only accept "off" when asked for.
  if (level == spdlog::level::off && name != "off") {
    return std::nullopt;
  }
  return level;
}

void init_logging(spdlog::level::level_enum level)
{
  auto logger = spdlog::get("sce");
  if (!logger) {
    logger = spdlog::stderr_color_mt("sce");
  }
  logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
  logger->set_level(level);
  spdlog::set_default_logger(logger);
  spdlog::set_level(level);
}

}  // namespace sce
