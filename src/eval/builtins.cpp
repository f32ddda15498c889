#include "builtins.hpp"
#include <limits>
#include <utility>
#include "evaluator.hpp"

using std::vector;
using std::pair;

namespace crisp::eval {
#include "macros_open.hpp"

  auto expectArgs(vector<Tree> const& args, size_t n) -> void {
    if (args.size() != n)
      throw PartialEvalError("expected " + std::to_string(n) + " arguments, got " + std::to_string(args.size()));
  }

  auto expectAtLeast(vector<Tree> const& args, size_t n) -> void {
    if (args.size() < n)
      throw PartialEvalError("expected at least " + std::to_string(n) + " arguments, got " + std::to_string(args.size()));
  }

  // Narrows a wide intermediate result, rejecting anything outside the integer range.
  auto checked(int64_t v) -> int32_t {
    if (v < std::numeric_limits<int32_t>::min() || v > std::numeric_limits<int32_t>::max())
      throw PartialEvalError("integer overflow: " + std::to_string(v));
    return static_cast<int32_t>(v);
  }

  // Evaluates every argument (left to right), each of which must be an integer.
  auto integers(Environment& env, vector<Tree> const& args) -> vector<int64_t> {
    auto res = vector<int64_t>();
    for (auto const& arg: args) res.push_back(expect<Integer>(eval(arg, env)).val);
    return res;
  }

  // `(op symbol value)`: the first argument must evaluate to a symbol (usually written `'name`).
  auto symbolBinding(Environment& env, vector<Tree> const& args) -> pair<Symbol, Tree> {
    expectArgs(args, 2);
    auto sym = expect<Symbol>(eval(args[0], env));
    auto value = eval(args[1], env);
    return {std::move(sym), std::move(value)};
  }

  // Evaluates all (at least one) arguments, then compares them structurally.
  auto allEqual(Environment& env, vector<Tree> const& args) -> bool {
    expectAtLeast(args, 1);
    auto values = vector<Tree>();
    for (auto const& arg: args) values.push_back(eval(arg, env));
    for (auto i = 1uz; i < values.size(); i++)
      if (values[i] != values[0]) return false;
    return true;
  }

  auto installBuiltins(Environment& env) -> void {

    // =============
    // Control forms
    // =============

    env.addNative("progn", [](Environment& env, vector<Tree> const& args) -> Tree { return progn(args, env); });

    // `(if cond then else...)`: only the chosen branch is evaluated
    env.addNative("if", [](Environment& env, vector<Tree> const& args) -> Tree {
      expectAtLeast(args, 2);
      if (!eval(args[0], env).isNil()) return eval(args[1], env);
      return progn(args, env, 2);
    });

    env.addNative("when", [](Environment& env, vector<Tree> const& args) -> Tree {
      expectAtLeast(args, 2);
      if (!eval(args[0], env).isNil()) return progn(args, env, 1);
      return Nil{};
    });

    env.addNative("while", [](Environment& env, vector<Tree> const& args) -> Tree {
      expectAtLeast(args, 2);
      while (!eval(args[0], env).isNil()) progn(args, env, 1);
      return Nil{};
    });

    // `(defun name [params...] body...)`: parameters are taken literally; at most one rest parameter, last
    env.addNative("defun", [](Environment& env, vector<Tree> const& args) -> Tree {
      expectAtLeast(args, 2);
      auto const& name = expect<Symbol>(args[0]).name;
      auto params = vector<Symbol>();
      for (auto const& e: expect<List>(args[1]).elements) params.push_back(expect<Symbol>(e));
      for (auto i = 0uz; i < params.size(); i++)
        if (params[i].rest && i + 1 != params.size())
          throw PartialEvalError("rest parameter " + params[i].name + " must be the last parameter");
      env.addFunction(name, Defun{vector<Tree>(args.begin() + 2, args.end()), std::move(params)});
      return Nil{};
    });

    // Mutates the nearest existing binding, or creates one at the top level
    env.addNative("set", [](Environment& env, vector<Tree> const& args) -> Tree {
      auto [sym, value] = symbolBinding(env, args);
      if (auto const frame = env.findFrame(sym)) frame->put(sym.name, value);
      else env.topLevel().put(sym.name, value);
      return value;
    });

    // Binds into the frame of whoever called `let`
    env.addNative("let", [](Environment& env, vector<Tree> const& args) -> Tree {
      auto [sym, value] = symbolBinding(env, args);
      env.caller().put(sym.name, value);
      return value;
    });

    env.addNative("debug", [](Environment& env, vector<Tree> const& args) -> Tree {
      auto res = Tree(Nil{});
      for (auto const& arg: args) {
        res = eval(arg, env);
        env.out() << res.toString() << std::endl;
      }
      return res;
    });

    // ==========
    // Arithmetic
    // ==========

// Left fold over at least one integer argument
#define fold(name, op)                                                         \
  env.addNative(name, [](Environment& env, vector<Tree> const& args) -> Tree { \
    expectAtLeast(args, 1);                                                    \
    auto const xs = integers(env, args);                                       \
    auto acc = int64_t{xs[0]};                                                 \
    for (auto i = 1uz; i < xs.size(); i++) acc = checked(acc op xs[i]);        \
    return Integer{checked(acc)};                                              \
  })

    fold("+", +);
    fold("*", *);

#undef fold

    env.addNative("-", [](Environment& env, vector<Tree> const& args) -> Tree {
      expectAtLeast(args, 1);
      auto const xs = integers(env, args);
      if (xs.size() == 1) return Integer{checked(-xs[0])};
      auto acc = xs[0];
      for (auto i = 1uz; i < xs.size(); i++) acc = checked(acc - xs[i]);
      return Integer{checked(acc)};
    });

    // Truncates towards zero
    env.addNative("/", [](Environment& env, vector<Tree> const& args) -> Tree {
      expectAtLeast(args, 1);
      auto const xs = integers(env, args);
      auto acc = xs[0];
      for (auto i = 1uz; i < xs.size(); i++) {
        if (xs[i] == 0) throw PartialEvalError("division by zero");
        acc = checked(acc / xs[i]);
      }
      return Integer{checked(acc)};
    });

    // ==========
    // Comparison
    // ==========

    env.addNative("=", [](Environment& env, vector<Tree> const& args) -> Tree {
      return allEqual(env, args) ? Tree(True{}) : Tree(Nil{});
    });
    env.addNative("/=", [](Environment& env, vector<Tree> const& args) -> Tree {
      return allEqual(env, args) ? Tree(Nil{}) : Tree(True{});
    });

// Holds iff every adjacent pair of (at least one) integer arguments satisfies `op`
#define chain(name, op)                                                       \
  env.addNative(name, [](Environment& env, vector<Tree> const& args) -> Tree { \
    expectAtLeast(args, 1);                                                   \
    auto const xs = integers(env, args);                                      \
    for (auto i = 1uz; i < xs.size(); i++)                                    \
      if (!(xs[i - 1] op xs[i])) return Nil{};                                \
    return True{};                                                            \
  })

    chain("<", <);
    chain(">", >);
    chain("<=", <=);
    chain(">=", >=);

#undef chain

    // =====
    // Lists
    // =====

    env.addNative("car", [](Environment& env, vector<Tree> const& args) -> Tree {
      expectArgs(args, 1);
      auto const list = eval(args[0], env);
      auto const& elements = expect<List>(list).elements;
      if (elements.empty()) return Nil{};
      return elements.front();
    });

    env.addNative("cdr", [](Environment& env, vector<Tree> const& args) -> Tree {
      expectArgs(args, 1);
      auto const list = eval(args[0], env);
      auto const& elements = expect<List>(list).elements;
      if (elements.size() < 2) return List{};
      return List{vector<Tree>(elements.begin() + 1, elements.end())};
    });
  }

#include "macros_close.hpp"
}
