#ifndef CRISP_EVAL_EVALUATOR_HPP
#define CRISP_EVAL_EVALUATOR_HPP

#include <vector>
#include "environment.hpp"
#include "tree.hpp"

namespace crisp::eval {
#include "macros_open.hpp"

  // Reduces `e` under `env`:
  // - `nil`, `t`, integers and strings evaluate to themselves;
  // - `'x` evaluates to itself, `x` to its bound value, `,x` to the evaluation of its bound value;
  // - lists evaluate element-wise, left to right;
  // - calls are dispatched through `Environment::call()`.
  // The first failing sub-evaluation aborts the whole form.
  // Recursion depth follows the nesting depth of the program; see `Environment::maxDepth()`.
  auto eval(Tree const& e, Environment& env) -> Tree;

  // Evaluates `es[from...]` in order and returns the last result (`nil` if there is none).
  auto progn(std::vector<Tree> const& es, Environment& env, size_t from = 0) -> Tree;

#include "macros_close.hpp"
}

#endif // CRISP_EVAL_EVALUATOR_HPP
