#ifndef CRISP_EVAL_TREE_HPP
#define CRISP_EVAL_TREE_HPP

#include <compare>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <common.hpp>

namespace crisp::eval {
#include "macros_open.hpp"

  // How a symbol is evaluated where it appears (as a reference or as a parameter descriptor).
  enum class Quote: uint8_t {
    None,   // `x`: resolved to its bound value
    Single, // `'x`: the symbol itself, never evaluated
    Eval    // `,x`: resolved, then the found value is evaluated again
  };

  // clang-format off
  // Concrete atom types for Tree
  class Tree;
  struct Nil     {                     auto operator==(Nil const&)     const -> bool = default; };
  struct True    {                     auto operator==(True const&)    const -> bool = default; };
  struct Integer { int32_t val;        auto operator==(Integer const&) const -> bool = default; };
  struct String  { std::string val;    auto operator==(String const&)  const -> bool = default; };
  // clang-format on

  // Equality considers the full triplet; frames key on `name` only.
  struct Symbol {
    std::string name;
    Quote quote = Quote::None;
    bool rest = false;
    auto operator==(Symbol const&) const -> bool = default;
  };

  // `(name args...)`: a call of a named operation with unevaluated argument expressions.
  struct Funcall {
    Symbol name;
    std::vector<Tree> args;
    auto operator==(Funcall const& r) const -> bool;
  };

  // `[elements...]`: literal data, never a call.
  struct List {
    std::vector<Tree> elements;
    auto operator==(List const& r) const -> bool;
  };

  // Main Tree type
  // Values are immutable and acyclic: copies are independent, evaluation builds new trees.
  class Tree: public std::variant<Nil, True, Integer, String, Symbol, Funcall, List> {
  public:
    using variant::variant;

    Tree():
        variant(Nil{}) {}

    // Nil, empty lists and empty strings are false; everything else (including `0`) is true.
    auto isNil() const -> bool;

    // Textual form, readable back by the parser.
    auto toString() const -> std::string;

    static auto escapeString(std::string const& s) -> std::string;
  };

  inline auto Funcall::operator==(Funcall const& r) const -> bool {
    return name == r.name && args == r.args;
  }

  inline auto List::operator==(List const& r) const -> bool {
    return elements == r.elements;
  }

#include "macros_close.hpp"
}

#endif // CRISP_EVAL_TREE_HPP
