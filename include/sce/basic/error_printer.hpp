// sce/basic/error_printer.hpp
//
// Prints engine errors for the command line, with the request location and
// the source line under it when available.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "sce/basic/error.hpp"
#include "sce/basic/source_manager.hpp"

namespace sce
{

/**
 * Prints errors in a compiler-style format.
 *
 * Produces output like:
 *   error[ArityMismatch]: 'add' takes 2 parameter(s) but the call passes 1 argument(s)
 *     --> main.c:8:13
 *      |
 *    8 |     int x = add(1);
 *      |             ^
 */
class ErrorPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit ErrorPrinter(std::ostream & os, bool use_color = true);

  /// Header line only
  void print(const Error & error);

  /// Header plus location and source context; `at` is in `source`'s encoding
  void print(const Error & error, std::string_view filename, const SourceManager & source, Point at);

private:
  void print_header(const Error & error);

  std::ostream & os_;
  bool use_color_;
};

}  // namespace sce
