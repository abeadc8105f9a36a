// sce/basic/logging.hpp - spdlog setup shared by the tools
//
// Library code logs through the default spdlog logger. Tools call
// init_logging() once so that log output goes to stderr, leaving stdout
// for results and protocol traffic.
//
#pragma once

#include <spdlog/spdlog.h>

#include <optional>
#include <string_view>

namespace sce
{

[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name);

/**
 * Install a stderr logger named "sce" as the spdlog default.
 *
 * @param level Level to apply
 */
void init_logging(spdlog::level::level_enum level);

}  // namespace sce
