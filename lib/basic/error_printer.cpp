// sce/basic/error_printer.cpp - Compiler-style error output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "sce/basic/error_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <ostream>
#include <rang.hpp>
#include <string>

namespace sce
{

ErrorPrinter::ErrorPrinter(std::ostream & os, bool use_color) : os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void ErrorPrinter::print(const Error & error)
{
  print_header(error);
}

void ErrorPrinter::print(
  const Error & error, std::string_view filename, const SourceManager & source, Point at)
{
  print_header(error);

  // Editors count from zero; people read from one.
  fmt::print(os_, "  --> {}:{}:{}\n", filename, at.line + 1, at.column + 1);

  const std::string_view line = source.get_line(at.line);
  if (line.empty() || at.line >= source.get_line_count()) {
    return;
  }

  std::string cleaned;
  std::string marker;
  const uint32_t offset = source.get_offset(at) - source.get_line_offset(at.line);
  for (size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    const std::string piece = c == '\t' ? std::string("    ") : std::string(1, c);
    if (c == '\r') continue;
    cleaned += piece;
    if (i < offset && (static_cast<unsigned char>(c) & 0xC0) != 0x80) {
      marker.append(c == '\t' ? 4 : 1, ' ');
    }
  }

  const std::string line_num = std::to_string(at.line + 1);
  const std::string pad(line_num.size(), ' ');
  fmt::print(os_, "{} |\n", pad);
  fmt::print(os_, "{} | {}\n", line_num, cleaned);
  if (use_color_) {
    os_ << pad << " | " << marker << rang::fg::red << rang::style::bold << "^" << rang::style::reset
        << rang::fg::reset << "\n";
  } else {
    fmt::print(os_, "{} | {}^\n", pad, marker);
  }
}

void ErrorPrinter::print_header(const Error & error)
{
  if (use_color_) {
    os_ << rang::style::bold << rang::fg::red << "error"
        << "[" << to_string(error.code) << "]" << rang::fg::reset << ": " << error.message
        << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "error[{}]: {}\n", to_string(error.code), error.message);
  }
}

}  // namespace sce
