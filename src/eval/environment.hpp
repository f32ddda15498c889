#ifndef CRISP_EVAL_ENVIRONMENT_HPP
#define CRISP_EVAL_ENVIRONMENT_HPP

#include <deque>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>
#include <common.hpp>
#include "tree.hpp"

namespace crisp::eval {
#include "macros_open.hpp"

  struct EvalError: std::runtime_error {
    enum class Kind: uint8_t {
      ArgsMismatch,             // Arity or type mismatch; `name` is the operation
      VariableIsVoid,           // `name` is the unbound variable
      FunctionDefinitionIsVoid, // `name` is the unregistered function
      Parsing,                  // Wrapped `parsing::ParseError`
      FileRead,                 // `name` is the path
      DepthExceeded             // Too many live frames
    };

    Kind kind;
    std::string name;

    EvalError(Kind kind, std::string name, std::string const& s):
      std::runtime_error(s),
      kind(kind),
      name(std::move(name)) {}
  };

  // Throw this from a native operation to let the dispatcher provide the operation name.
  struct PartialEvalError: std::runtime_error {
    explicit PartialEvalError(std::string const& s):
      std::runtime_error(s) {}
  };

  // One call's bindings. Keys are symbol names only: quote modes and rest markers do not take part.
  class Frame {
  public:
    explicit Frame(std::string label):
        _label(std::move(label)) {}

    auto label() const -> std::string const& { return _label; }
    auto contains(std::string const& name) const -> bool { return _bindings.contains(name); }
    auto get(std::string const& name) const -> Tree const*;
    auto put(std::string const& name, Tree value) -> void { _bindings.insert_or_assign(name, std::move(value)); }
    auto size() const -> size_t { return _bindings.size(); }

  private:
    std::string _label;
    std::unordered_map<std::string, Tree> _bindings;
  };

  class Environment;

  // Native operations receive their arguments unevaluated.
  using NativeFunc = std::function<Tree(Environment&, std::vector<Tree> const&)>;

  struct Native {
    NativeFunc f;
  };

  // The body forms run in the frame holding the parameters, as an implicit `progn`.
  struct Defun {
    std::vector<Tree> body;
    std::vector<Symbol> params;
  };

  using Function = std::variant<Native, Defun>;

  // Stack of frames plus the function table. Frame 0 (the top level) lives as long as the environment.
  // Frames are kept in a `std::deque`, so references to a frame stay valid while inner calls push and pop.
  // Separate instances share nothing.
  class Environment {
  public:
    static constexpr size_t defaultMaxDepth = 10000;
    static constexpr char const* topLevelLabel = "top-level";

    explicit Environment(std::ostream& out = std::cout, size_t maxDepth = defaultMaxDepth);
    Environment(Environment const&) = delete;
    Environment(Environment&&) = delete;
    auto operator=(Environment const&) -> Environment& = delete;
    auto operator=(Environment&&) -> Environment& = delete;
    ~Environment() = default;

    // Innermost frame first; `nullptr` if unbound.
    auto lookup(Symbol const& sym) const -> Tree const*;
    auto findFrame(Symbol const& sym) -> Frame*;

    auto topLevel() -> Frame& { return _frames.front(); }
    auto current() -> Frame& { return _frames.back(); }
    auto caller() -> Frame&;
    auto depth() const -> size_t { return _frames.size(); }

    // Re-registration overwrites.
    auto addFunction(std::string const& name, Function f) -> void {
      _functions.insert_or_assign(name, std::make_shared<Function const>(std::move(f)));
    }
    auto addNative(std::string const& name, NativeFunc f) -> void { addFunction(name, Native{std::move(f)}); }
    // A running function stays alive even if it is redefined during its own call.
    auto function(std::string const& name) const -> std::shared_ptr<Function const>;

    // Pushes a frame labelled by `name`, invokes the function, pops the frame on every exit path.
    // Unknown names fail before any frame is pushed.
    auto call(Symbol const& name, std::vector<Tree> const& args) -> Tree;

    auto out() -> std::ostream& { return _out; }
    auto maxDepth() const -> size_t { return _maxDepth; }

  private:
    // Pops the frame pushed by its constructor.
    class FrameGuard {
    public:
      FrameGuard(Environment& env, std::string const& label):
          _env(env) {
        _env._frames.emplace_back(label);
      }
      FrameGuard(FrameGuard const&) = delete;
      auto operator=(FrameGuard const&) -> FrameGuard& = delete;
      ~FrameGuard() { _env._frames.pop_back(); }

    private:
      Environment& _env;
    };

    std::ostream& _out;
    size_t _maxDepth;
    std::deque<Frame> _frames;
    std::unordered_map<std::string, std::shared_ptr<Function const>> _functions;

    auto callDefun(Defun const& f, std::vector<Tree> const& args) -> Tree;
  };

#include "macros_close.hpp"
}

#endif // CRISP_EVAL_ENVIRONMENT_HPP
