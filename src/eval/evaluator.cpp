#include "evaluator.hpp"

using std::vector;

namespace crisp::eval {
#include "macros_open.hpp"

  auto resolve(Symbol const& sym, Environment& env) -> Tree {
    if (auto const val = env.lookup(sym)) return *val;
    throw EvalError(EvalError::Kind::VariableIsVoid, sym.name, "variable is void: " + sym.name);
  }

  auto eval(Tree const& e, Environment& env) -> Tree {
    return match(
      e,
      [&](Symbol const& x) -> Tree {
        switch (x.quote) {
          case Quote::Single: return x;
          case Quote::None: return resolve(x, env);
          case Quote::Eval: return eval(resolve(x, env), env);
        }
        unreachable;
      },
      [&](List const& x) -> Tree {
        auto res = List{};
        res.elements.reserve(x.elements.size());
        for (auto const& element: x.elements) res.elements.push_back(eval(element, env));
        return res;
      },
      [&](Funcall const& x) -> Tree { return env.call(x.name, x.args); },
      // Everything else: evaluates to itself
      [&](auto const&) -> Tree { return e; }
    );
  }

  auto progn(vector<Tree> const& es, Environment& env, size_t from) -> Tree {
    auto res = Tree(Nil{});
    for (auto i = from; i < es.size(); i++) res = eval(es[i], env);
    return res;
  }

#include "macros_close.hpp"
}
