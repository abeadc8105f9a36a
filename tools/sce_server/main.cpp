// sce_server - Slice/inline requests over stdio (one JSON object per line)
//
// Each input line is a request envelope {"id", "method", "params"}; each
// output line is the matching {"id", "result"} or {"id", "error"}. Runs
// until stdin is closed. Logs go to stderr.
//
#include <nlohmann/json.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include "sce/basic/logging.hpp"
#include "sce/project/engine_config.hpp"
#include "sce/service/engine.hpp"

namespace fs = std::filesystem;

namespace
{

struct ServerArgs
{
  std::string config_path;
  std::string encoding;
  bool verbose = false;
  bool show_help = false;
};

ServerArgs parse_args(int argc, char * argv[])
{
  ServerArgs args;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (arg == "--encoding" && i + 1 < argc) {
      args.encoding = argv[++i];
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    }
  }
  return args;
}

void print_usage(const char * program_name)
{
  std::cerr << "Usage: " << program_name << " [--config <path>] [--encoding <enc>] [-v]\n\n"
            << "Reads one JSON request per line from stdin and writes one JSON response\n"
            << "per line to stdout.\n";
}

std::optional<sce::EngineConfig> load_config(const ServerArgs & args)
{
  sce::EngineConfig config;

  std::optional<fs::path> path;
  if (!args.config_path.empty()) {
    path = fs::path(args.config_path);
  } else {
    path = sce::find_engine_config(fs::current_path());
  }

  if (path) {
    const auto result = sce::load_engine_config(*path);
    if (!result.success) {
      std::cerr << "sce_server: " << result.error << "\n";
      return std::nullopt;
    }
    config = result.config;
  }

  if (!args.encoding.empty()) {
    const auto encoding = sce::parse_position_encoding(args.encoding);
    if (!encoding) {
      std::cerr << "sce_server: unknown encoding '" << args.encoding << "'\n";
      return std::nullopt;
    }
    config.position_encoding = *encoding;
  }
  return config;
}

}  // namespace

int main(int argc, char * argv[])
{
  const ServerArgs args = parse_args(argc, argv);
  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  try {
    const auto config = load_config(args);
    if (!config) {
      return 1;
    }
    sce::init_logging(args.verbose ? spdlog::level::debug : config->log_level);

    const sce::Engine engine(*config);
    spdlog::info(
      "sce_server ready (position encoding {})", sce::to_string(config->position_encoding));

    std::string line;
    while (std::getline(std::cin, line)) {
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      if (line.find_first_not_of(" \t") == std::string::npos) {
        continue;
      }
      const nlohmann::json reply = sce::handle_line(engine, line);
      std::cout << reply.dump() << "\n" << std::flush;
    }

    spdlog::info("stdin closed, exiting");
    return 0;
  } catch (const std::exception & e) {
    std::cerr << "sce_server: fatal error: " << e.what() << "\n";
    return 1;
  }
}
