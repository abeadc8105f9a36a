// sce - Source Code Explorer command line interface
//
// Usage:
//   sce slice <file> --point L:C [--direction backward|forward] [--apply]
//   sce inline <file> --point L:C --target <file> --target-point L:C
//   sce request < envelope.json
//   sce languages
//
#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "sce/basic/error_printer.hpp"
#include "sce/basic/logging.hpp"
#include "sce/edit/text_edit.hpp"
#include "sce/project/engine_config.hpp"
#include "sce/service/engine.hpp"
#include "sce/syntax/language.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "Source Code Explorer v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  slice <file>             Print the ranges a slice at --point removes\n"
            << "  inline <file>            Inline the call at --point, print the new file\n"
            << "  request                  Handle one JSON request envelope from stdin\n"
            << "  languages                List supported languages\n\n"
            << "Options:\n"
            << "  --point <L:C>            Cursor (zero-based line and column)\n"
            << "  --direction <dir>        backward (default) or forward\n"
            << "  --apply                  Print the sliced document instead of ranges\n"
            << "  --target <file>          File holding the function definition\n"
            << "  --target-point <L:C>     Position of the definition in --target\n"
            << "  --language <name>        Language hint (default: from file name)\n"
            << "  --encoding <enc>         Column unit: utf-8, utf-16 or utf-32\n"
            << "  --config <path>          Configuration file (default: nearest .sce.yaml)\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

bool stderr_is_tty()
{
  return isatty(fileno(stderr)) != 0;
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string point;
  std::string direction = "backward";
  std::string target_file;
  std::string target_point;
  std::string language;
  std::string encoding;
  std::string config_path;
  bool apply = false;
  bool verbose = false;
  bool show_help = false;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    const auto take = [&](std::string & out) {
      if (i + 1 < argc) {
        out = argv[++i];
      }
    };

    if (arg == "--point") {
      take(args.point);
    } else if (arg == "--direction") {
      take(args.direction);
    } else if (arg == "--target") {
      take(args.target_file);
    } else if (arg == "--target-point") {
      take(args.target_point);
    } else if (arg == "--language") {
      take(args.language);
    } else if (arg == "--encoding") {
      take(args.encoding);
    } else if (arg == "--config") {
      take(args.config_path);
    } else if (arg == "--apply") {
      args.apply = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    }
  }

  return args;
}

/// "12:4" -> Point{12, 4}
std::optional<sce::Point> parse_point(const std::string & text)
{
  const auto colon = text.find(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == text.size()) {
    return std::nullopt;
  }
  try {
    size_t used = 0;
    const unsigned long line = std::stoul(text.substr(0, colon), &used);
    if (used != colon) return std::nullopt;
    const std::string col_text = text.substr(colon + 1);
    const unsigned long col = std::stoul(col_text, &used);
    if (used != col_text.size()) return std::nullopt;
    constexpr unsigned long k_max = std::numeric_limits<uint32_t>::max();
    if (line > k_max || col > k_max) return std::nullopt;
    return sce::Point{static_cast<uint32_t>(line), static_cast<uint32_t>(col)};
  } catch (const std::logic_error &) {
    return std::nullopt;
  }
}

std::optional<std::string> read_file(const std::string & path)
{
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

/// Resolve the configuration (explicit path, nearest .sce.yaml, or defaults)
std::optional<sce::EngineConfig> load_config(const CommandArgs & args)
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
      std::cerr << "error: " << result.error << "\n";
      return std::nullopt;
    }
    config = result.config;
  }

  if (!args.encoding.empty()) {
    const auto encoding = sce::parse_position_encoding(args.encoding);
    if (!encoding) {
      std::cerr << "error: unknown encoding '" << args.encoding << "'\n";
      return std::nullopt;
    }
    config.position_encoding = *encoding;
  }

  sce::init_logging(args.verbose ? spdlog::level::debug : config.log_level);
  if (path) {
    spdlog::debug("using configuration {}", path->string());
  }
  return config;
}

void report(const sce::Error & error, const sce::Source & source, sce::PositionEncoding encoding)
{
  sce::ErrorPrinter printer(std::cerr, stderr_is_tty());
  const sce::SourceManager sm(source.content, encoding);
  printer.print(error, source.filename, sm, source.point);
}

/// Read <file> and --point into a request Source
std::optional<sce::Source> load_source(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: input file required\n";
    return std::nullopt;
  }
  const auto point = parse_point(args.point);
  if (!point) {
    std::cerr << "error: --point must be LINE:COLUMN, got '" << args.point << "'\n";
    return std::nullopt;
  }
  auto content = read_file(args.input_file);
  if (!content) {
    std::cerr << "error: failed to open file: " << args.input_file << "\n";
    return std::nullopt;
  }

  sce::Source source;
  source.filename = args.input_file;
  source.content = std::move(*content);
  source.language = args.language;
  source.point = *point;
  return source;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_slice(const CommandArgs & args)
{
  const auto config = load_config(args);
  if (!config) return 1;

  auto source = load_source(args);
  if (!source) return 1;

  const auto direction = sce::parse_slice_direction(args.direction);
  if (!direction) {
    std::cerr << "error: --direction must be 'backward' or 'forward'\n";
    return 1;
  }

  const sce::Engine engine(*config);
  const sce::SliceRequest request{*source, *direction};
  const auto response = engine.slice(request);
  if (!response) {
    report(response.error(), *source, config->position_encoding);
    return 1;
  }

  if (!args.apply) {
    std::cout << nlohmann::json(response.value()).dump(2) << "\n";
    return 0;
  }

  const sce::SourceManager sm(source->content, config->position_encoding);
  const auto & ranges = response.value().ranges_to_remove;
  const auto result = sce::apply_removals(sm, ranges, source->point);
  std::cout << result.content;
  spdlog::debug("cursor moves to {}:{}", result.cursor.line, result.cursor.column);
  return 0;
}

int cmd_inline(const CommandArgs & args)
{
  const auto config = load_config(args);
  if (!config) return 1;

  auto source = load_source(args);
  if (!source) return 1;

  sce::InlineRequest request;
  request.source = *source;

  if (args.target_file.empty()) {
    request.target_content = source->content;  // definition in the same file
  } else {
    auto target = read_file(args.target_file);
    if (!target) {
      std::cerr << "error: failed to open file: " << args.target_file << "\n";
      return 1;
    }
    request.target_content = std::move(*target);
  }

  const auto target_point = parse_point(args.target_point);
  if (!target_point) {
    std::cerr << "error: --target-point must be LINE:COLUMN, got '" << args.target_point
              << "'\n";
    return 1;
  }
  request.target_point = *target_point;

  const sce::Engine engine(*config);
  const auto response = engine.inline_call(request);
  if (!response) {
    report(response.error(), *source, config->position_encoding);
    return 1;
  }

  std::cout << response.value().content;
  return 0;
}

int cmd_request(const CommandArgs & args)
{
  const auto config = load_config(args);
  if (!config) return 1;

  const std::string input{std::istreambuf_iterator<char>(std::cin), {}};
  const sce::Engine engine(*config);
  const nlohmann::json reply = sce::handle_line(engine, input);

  std::cout << reply.dump() << "\n";
  if (reply.contains("error")) {
    sce::ErrorPrinter printer(std::cerr, stderr_is_tty());
    const auto & err = reply["error"];
    const auto code = sce::parse_error_code(err.value("code", ""));
    printer.print(sce::make_error(
      code.value_or(sce::ErrorCode::InvalidRequest), err.value("message", "")));
    return 1;
  }
  return 0;
}

int cmd_languages()
{
  for (const sce::GrammarId id : sce::all_grammars()) {
    std::cout << sce::to_string(id) << "\n";
  }
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command == "slice") {
    return cmd_slice(args);
  }

  if (args.command == "inline") {
    return cmd_inline(args);
  }

  if (args.command == "request") {
    return cmd_request(args);
  }

  if (args.command == "languages") {
    return cmd_languages();
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
