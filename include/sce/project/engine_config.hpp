// sce/project/engine_config.hpp - Engine configuration (.sce.yaml)
//
// Parses and validates .sce.yaml configuration files.
// Shared by the CLI and the JSON server.
//
#pragma once

#include <spdlog/spdlog.h>

#include <filesystem>
#include <optional>
#include <string>

#include "sce/analysis/slicer.hpp"
#include "sce/basic/source_manager.hpp"
#include "sce/syntax/language.hpp"
#include "sce/transform/inliner.hpp"

namespace sce
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Complete engine configuration. Every field has a usable default, so a
 * missing file means default behavior.
 */
struct EngineConfig
{
  /// Unit of Point::column on the wire
  PositionEncoding position_encoding = PositionEncoding::Utf32;

  spdlog::level::level_enum log_level = spdlog::level::warn;

  SliceOptions slice;
  InlineOptions inline_options;

  /// Extension -> language name overrides (".h" -> "cpp")
  ExtensionOverrides languages;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  EngineConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(EngineConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a configuration from a .sce.yaml file.
 *
 * @param config_path Path to .sce.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_engine_config(const std::filesystem::path & config_path);

/**
 * Parse configuration from YAML text (used by load_engine_config and tests).
 */
[[nodiscard]] ConfigLoadResult parse_engine_config(const std::string & yaml_text);

/**
 * Find a configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to .sce.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_engine_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_engine_config_file_name = ".sce.yaml";

}  // namespace sce
