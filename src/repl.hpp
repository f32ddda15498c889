#ifndef CRISP_REPL_HPP
#define CRISP_REPL_HPP

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>
#include <common.hpp>
#include <config.hpp>
#include <eval/environment.hpp>

namespace crisp {
#include "macros_open.hpp"

  struct Options {
    std::optional<std::string> configPath;
    std::vector<std::string> files; // "-" stands for `in`
  };

  // Reads one line at a time until an exit keyword or the end of `in`.
  // Results and errors are both printed to `out`; errors do not end the loop.
  auto repl(eval::Environment& env, Config const& config, std::istream& in, std::ostream& out) -> void;

  // Loads the prelude, then either runs the interactive loop (no files) or loads each file in order.
  // The first evaluation failure is printed to `err` and makes the result nonzero.
  auto run(Options const& options, Config const& config, std::istream& in, std::ostream& out, std::ostream& err) -> int;

#include "macros_close.hpp"
}

#endif // CRISP_REPL_HPP
