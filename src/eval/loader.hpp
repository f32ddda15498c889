#ifndef CRISP_EVAL_LOADER_HPP
#define CRISP_EVAL_LOADER_HPP

#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>
#include "environment.hpp"
#include "tree.hpp"

namespace crisp::eval {
#include "macros_open.hpp"

  // Parses one form and evaluates it. Parse failures are rethrown as `EvalError`s of kind `Parsing`.
  auto evalString(Environment& env, std::string_view s) -> Tree;

  // Evaluates any number of top-level forms in order, by wrapping them in `(progn ...)`.
  auto evalSource(Environment& env, std::string_view s) -> Tree;

  auto evalStream(Environment& env, std::istream& in) -> Tree;
  auto evalFile(Environment& env, std::filesystem::path const& path) -> Tree;

#include "macros_close.hpp"
}

#endif // CRISP_EVAL_LOADER_HPP
