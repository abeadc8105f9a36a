// sce/project/engine_config.cpp - Engine configuration implementation
//
#include "sce/project/engine_config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>

#include "sce/basic/logging.hpp"

namespace sce
{

namespace
{

/// Parse the 'slice' section
bool parse_slice_section(const YAML::Node & node, SliceOptions & out, std::string & error)
{
  if (!node.IsMap()) {
    error = "slice must be a map";
    return false;
  }

  if (node["scope"]) {
    const auto value = node["scope"].as<std::string>();
    const auto scope = parse_slice_scope(value);
    if (!scope) {
      error = "invalid slice.scope: '" + value + "' (must be 'file' or 'function')";
      return false;
    }
    out.scope = *scope;
  }

  if (node["merge_whitespace_gaps"]) {
    out.merge_whitespace_gaps = node["merge_whitespace_gaps"].as<bool>();
  }
  return true;
}

/// Parse the 'inline' section
bool parse_inline_section(const YAML::Node & node, InlineOptions & out, std::string & error)
{
  if (!node.IsMap()) {
    error = "inline must be a map";
    return false;
  }

  if (node["hoist_complex_arguments"]) {
    out.hoist_complex_arguments = node["hoist_complex_arguments"].as<bool>();
  }

  if (node["temp_prefix"]) {
    out.temp_prefix = node["temp_prefix"].as<std::string>();
    if (out.temp_prefix.empty()) {
      error = "inline.temp_prefix must not be empty";
      return false;
    }
  }
  return true;
}

/// Parse the 'languages' section (extension -> language name)
bool parse_languages_section(const YAML::Node & node, ExtensionOverrides & out, std::string & error)
{
  if (!node.IsMap()) {
    error = "languages must be a map of extension to language";
    return false;
  }

  for (const auto & entry : node) {
    std::string extension = entry.first.as<std::string>();
    const auto language = entry.second.as<std::string>();
    if (!grammar_from_name(language)) {
      error = "unknown language '" + language + "' for extension '" + extension + "'";
      return false;
    }
    if (extension.empty() || extension.front() != '.') {
      extension.insert(extension.begin(), '.');
    }
    std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char c) {
      return static_cast<char>(std::tolower(c));
    });
    out[extension] = language;
  }
  return true;
}

ConfigLoadResult parse_root(const YAML::Node & root)
{
  EngineConfig config;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));  // empty file
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  if (root["position_encoding"]) {
    const auto value = root["position_encoding"].as<std::string>();
    const auto encoding = parse_position_encoding(value);
    if (!encoding) {
      return ConfigLoadResult::fail(
        "invalid position_encoding: '" + value + "' (must be 'utf-8', 'utf-16' or 'utf-32')");
    }
    config.position_encoding = *encoding;
  }

  if (root["log_level"]) {
    const auto value = root["log_level"].as<std::string>();
    const auto level = parse_log_level(value);
    if (!level) {
      return ConfigLoadResult::fail("invalid log_level: '" + value + "'");
    }
    config.log_level = *level;
  }

  std::string error;
  if (root["slice"] && !parse_slice_section(root["slice"], config.slice, error)) {
    return ConfigLoadResult::fail(error);
  }
  if (root["inline"] && !parse_inline_section(root["inline"], config.inline_options, error)) {
    return ConfigLoadResult::fail(error);
  }
  if (root["languages"] && !parse_languages_section(root["languages"], config.languages, error)) {
    return ConfigLoadResult::fail(error);
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult parse_engine_config(const std::string & yaml_text)
{
  try {
    return parse_root(YAML::Load(yaml_text));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult load_engine_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  try {
    return parse_root(YAML::LoadFile(config_path.string()));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_engine_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_engine_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;  // reached filesystem root
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace sce
