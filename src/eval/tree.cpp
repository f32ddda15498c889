#include "tree.hpp"

using std::string;

namespace crisp::eval {
#include "macros_open.hpp"

  auto Tree::isNil() const -> bool {
    return match(
      *this,
      [](Nil const&) { return true; },
      [](List const& x) { return x.elements.empty(); },
      [](String const& x) { return x.val.empty(); },
      [](auto const&) { return false; }
    );
  }

  auto symbolString(Symbol const& x) -> string {
    auto res = string();
    switch (x.quote) {
      case Quote::None: break;
      case Quote::Single: res += '\''; break;
      case Quote::Eval: res += ','; break;
    }
    res += x.name;
    if (x.rest) res += "...";
    return res;
  }

  auto Tree::toString() const -> string {
    return match(
      *this,
      [](Nil const&) { return string("nil"); },
      [](True const&) { return string("t"); },
      [](Integer const& x) { return std::to_string(x.val); },
      [](String const& x) { return "\"" + escapeString(x.val) + "\""; },
      [](Symbol const& x) { return symbolString(x); },
      [](Funcall const& x) {
        auto res = "(" + symbolString(x.name);
        for (auto const& arg: x.args) res += " " + arg.toString();
        return res + ")";
      },
      [](List const& x) {
        auto res = string("[");
        auto first = true;
        for (auto const& e: x.elements) {
          if (!first) res += " ";
          first = false;
          res += e.toString();
        }
        return res + "]";
      }
    );
  }

  // Only the escapes the parser accepts are produced.
  auto Tree::escapeString(string const& s) -> string {
    auto res = string();
    for (char c: s) {
      switch (c) {
        case '"': res += "\\\""; break;
        case '\\': res += "\\\\"; break;
        case '\n': res += "\\n"; break;
        case '\t': res += "\\t"; break;
        default: res += c; break;
      }
    }
    return res;
  }

#include "macros_close.hpp"
}
