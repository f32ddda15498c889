#include "environment.hpp"
#include "evaluator.hpp"

using std::string;
using std::vector;
using enum crisp::eval::EvalError::Kind;

namespace crisp::eval {
#include "macros_open.hpp"

  auto Frame::get(string const& name) const -> Tree const* {
    if (auto const it = _bindings.find(name); it != _bindings.end()) return &it->second;
    return nullptr;
  }

  Environment::Environment(std::ostream& out, size_t maxDepth):
    _out(out),
    _maxDepth(maxDepth) {
    _frames.emplace_back(topLevelLabel);
  }

  auto Environment::lookup(Symbol const& sym) const -> Tree const* {
    for (auto it = _frames.rbegin(); it != _frames.rend(); it++)
      if (auto const val = it->get(sym.name)) return val;
    return nullptr;
  }

  auto Environment::findFrame(Symbol const& sym) -> Frame* {
    for (auto it = _frames.rbegin(); it != _frames.rend(); it++)
      if (it->contains(sym.name)) return &*it;
    return nullptr;
  }

  auto Environment::caller() -> Frame& {
    if (_frames.size() < 2) throw PartialEvalError("no caller frame at depth " + std::to_string(_frames.size()));
    return _frames[_frames.size() - 2];
  }

  auto Environment::function(string const& name) const -> std::shared_ptr<Function const> {
    if (auto const it = _functions.find(name); it != _functions.end()) return it->second;
    return nullptr;
  }

  auto Environment::call(Symbol const& name, vector<Tree> const& args) -> Tree {
    auto const f = function(name.name);
    if (!f) throw EvalError(FunctionDefinitionIsVoid, name.name, "function definition is void: " + name.name);
    if (_maxDepth > 0 && _frames.size() >= _maxDepth)
      throw EvalError(DepthExceeded, name.name, "maximum call depth " + std::to_string(_maxDepth) + " exceeded at: " + name.name);

    auto const guard = FrameGuard(*this, name.name);
    assert(_frames.size() >= 2);
    return match(
      *f,
      [&](Native const& x) -> Tree {
        try {
          return x.f(*this, args);
        } catch (PartialEvalError& ex) {
          // "Decorate" partial exceptions with the operation name, and rethrow a (complete) exception
          throw EvalError(ArgsMismatch, name.name, name.name + ": " + ex.what());
        }
      },
      [&](Defun const& x) -> Tree { return callDefun(x, args); }
    );
  }

  // Binds parameters into the frame pushed by `call()`, then evaluates the body in that same frame.
  // Argument expressions are evaluated after the frame is pushed, so they also see earlier parameters.
  auto Environment::callDefun(Defun const& f, vector<Tree> const& args) -> Tree {
    auto& frame = current();
    auto next = 0uz;
    for (auto const& param: f.params) {
      if (param.rest) {
        auto rest = Tree(List{vector<Tree>(args.begin() + static_cast<std::ptrdiff_t>(next), args.end())});
        frame.put(param.name, param.quote == Quote::Single ? std::move(rest) : eval(rest, *this));
        next = args.size();
        break;
      }
      if (next == args.size())
        throw EvalError(ArgsMismatch, frame.label(), frame.label() + ": missing argument for parameter " + param.name);
      auto const& arg = args[next++];
      frame.put(param.name, param.quote == Quote::Single ? arg : eval(arg, *this));
    }
    if (next < args.size())
      throw EvalError(
        ArgsMismatch,
        frame.label(),
        frame.label() + ": expected " + std::to_string(f.params.size()) + " arguments, got " + std::to_string(args.size())
      );
    return progn(f.body, *this);
  }

#include "macros_close.hpp"
}
