#ifndef CRISP_EVAL_BUILTINS_HPP
#define CRISP_EVAL_BUILTINS_HPP

#include <string>
#include <vector>
#include "environment.hpp"

namespace crisp::eval {
#include "macros_open.hpp"

  // Registers the native operations: control forms (`progn`, `if`, `when`, `while`, `defun`, `set`, `let`),
  // `debug`, integer arithmetic and comparison, `=`, `/=`, `car` and `cdr`.
  auto installBuiltins(Environment& env) -> void;

  // Convenient pattern-matching functions (throw `PartialEvalError` on failure).
  template <typename T>
  auto expect(Tree const& e) -> T const&;

  auto expectArgs(std::vector<Tree> const& args, size_t n) -> void;
  auto expectAtLeast(std::vector<Tree> const& args, size_t n) -> void;

#define defineExpect(T, msg)                                                 \
  template <>                                                                \
  inline auto expect<T>(Tree const& e) -> T const& {                         \
    if (auto const p = std::get_if<T>(&e)) return *p;                        \
    throw PartialEvalError(std::string(msg ", got ") + e.toString());        \
  }
  defineExpect(Integer, "expected integer")
  defineExpect(String, "expected string")
  defineExpect(Symbol, "expected symbol")
  defineExpect(List, "expected list")
#undef defineExpect

#include "macros_close.hpp"
}

#endif // CRISP_EVAL_BUILTINS_HPP
