#include "parser.hpp"
#include <array>
#include <limits>
#include <optional>
#include <vector>

using std::string;
using std::string_view;
using std::vector;
using std::optional;
using crisp::eval::Tree, crisp::eval::Nil, crisp::eval::True, crisp::eval::Integer, crisp::eval::String;
using crisp::eval::Symbol, crisp::eval::Quote, crisp::eval::Funcall, crisp::eval::List;
using enum crisp::parsing::ParseError::Kind;

namespace crisp::parsing {
#include "macros_open.hpp"

  auto isBlank(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
  }

  auto isDigit(char c) -> bool {
    return c >= '0' && c <= '9';
  }

  auto isSymbolChar(char c) -> bool {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || isDigit(c)) return true;
    return string_view("!#$%&*+-./:;<=>?@^_|~").find(c) != string_view::npos;
  }

  auto trim(string_view s) -> string_view {
    while (!s.empty() && isBlank(s.front())) s.remove_prefix(1);
    while (!s.empty() && isBlank(s.back())) s.remove_suffix(1);
    return s;
  }

  // Returns the position just past the string literal starting at `s[i]`, or `s.size()` if it is not terminated.
  auto skipString(string_view s, size_t i) -> size_t {
    for (i++; i < s.size(); i++) {
      if (s[i] == '\\') i++;
      else if (s[i] == '"') return i + 1;
    }
    return s.size();
  }

  // =======
  // Integer
  // =======

  auto acceptsInteger(string_view s) -> bool {
    auto i = 0uz;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) i++;
    if (i == s.size()) return false;
    for (; i < s.size(); i++)
      if (!isDigit(s[i])) return false;
    return true;
  }

  auto parseInteger(string_view s) -> Tree {
    auto const negative = s.front() == '-';
    auto i = (s.front() == '+' || s.front() == '-') ? 1uz : 0uz;
    // The magnitude of the lower bound is one greater than the upper bound.
    auto const limit = negative ? -static_cast<int64_t>(std::numeric_limits<int32_t>::min())
                                : static_cast<int64_t>(std::numeric_limits<int32_t>::max());
    auto acc = int64_t{0};
    for (; i < s.size(); i++) {
      acc = acc * 10 + (s[i] - '0');
      if (acc > limit) throw ParseError(IntegerOverflow, "integer literal out of range: " + string(s));
    }
    return Integer{static_cast<int32_t>(negative ? -acc : acc)};
  }

  // ===============
  // Special literal
  // ===============

  constexpr auto specialNames = std::array<string_view, 2>{"t", "nil"};

  auto acceptsSpecial(string_view s) -> bool {
    for (auto const name: specialNames)
      if (s == name) return true;
    return false;
  }

  auto parseSpecial(string_view s) -> Tree {
    if (s == "t") return True{};
    return Nil{};
  }

  // ======
  // String
  // ======

  auto acceptsString(string_view s) -> bool {
    return !s.empty() && s.front() == '"';
  }

  auto parseString(string_view s) -> Tree {
    auto res = string();
    for (auto i = 1uz; i < s.size(); i++) {
      auto const c = s[i];
      if (c == '\\') {
        if (++i == s.size()) break;
        switch (s[i]) {
          case '"': res += '"'; break;
          case '\\': res += '\\'; break;
          case 'n': res += '\n'; break;
          case 't': res += '\t'; break;
          default: throw ParseError(InvalidEscape, "invalid escape sequence: \\" + string(1, s[i]));
        }
      } else if (c == '"') {
        if (i + 1 != s.size())
          throw ParseError(Malformed, "unexpected characters after closing quote: " + string(s.substr(i + 1)));
        return String{res};
      } else {
        res += c;
      }
    }
    throw ParseError(Malformed, "unterminated string literal: " + string(s));
  }

  // ======
  // Symbol
  // ======

  auto acceptsSymbol(string_view s) -> bool {
    if (s.empty()) return false;
    auto const c = s.front();
    return c == singleQuoteMarker || c == evalQuoteMarker || isSymbolChar(c);
  }

  auto parseSymbol(string_view s) -> Tree {
    auto res = Symbol{};
    if (s.front() == singleQuoteMarker) res.quote = Quote::Single, s.remove_prefix(1);
    else if (s.front() == evalQuoteMarker) res.quote = Quote::Eval, s.remove_prefix(1);
    if (s.size() > restMarker.size() && s.ends_with(restMarker)) res.rest = true, s.remove_suffix(restMarker.size());
    if (s.empty()) throw ParseError(Malformed, "missing symbol name");
    for (auto const c: s)
      if (!isSymbolChar(c)) throw ParseError(Malformed, "illegal character in symbol: (" + string(1, c) + ")");
    res.name = string(s);
    return res;
  }

  // ==============
  // Bracketed form
  // ==============

  auto acceptsBracketed(string_view s) -> bool {
    return !s.empty() && (s.front() == '(' || s.front() == '[');
  }

  // The whole input must be one form: its first bracket is closed by its last character.
  auto checkBalanced(string_view s) -> void {
    auto expected = vector<char>();
    for (auto i = 0uz; i < s.size();) {
      auto const c = s[i];
      if (c == '"') {
        i = skipString(s, i);
        continue;
      }
      if (c == '(') expected.push_back(')');
      else if (c == '[') expected.push_back(']');
      else if (c == ')' || c == ']') {
        if (expected.empty() || expected.back() != c)
          throw ParseError(UnmatchedBrackets, "unmatched bracket '" + string(1, c) + "' in: " + string(s));
        expected.pop_back();
        if (expected.empty() && i + 1 != s.size())
          throw ParseError(UnmatchedBrackets, "form closed before end of input: " + string(s));
      }
      i++;
    }
    if (!expected.empty()) throw ParseError(UnmatchedBrackets, "missing '" + string(1, expected.back()) + "' in: " + string(s));
  }

  // Splits on blanks outside of brackets and string literals, so every piece spans exactly one element
  // (a literal keeps its inner blanks). Brackets inside string literals do not nest.
  auto splitTopLevel(string_view s) -> vector<string_view> {
    auto res = vector<string_view>();
    auto depth = 0uz;
    auto inString = false;
    auto begin = optional<size_t>();
    for (auto i = 0uz; i < s.size(); i++) {
      auto const c = s[i];
      if (isBlank(c) && depth == 0 && !inString) {
        if (begin) res.push_back(s.substr(*begin, i - *begin)), begin.reset();
        continue;
      }
      if (!begin) begin = i;
      if (inString) {
        if (c == '\\') i++;
        else if (c == '"') inString = false;
      } else if (c == '"') {
        inString = true;
      } else if (c == '(' || c == '[') {
        depth++;
      } else if ((c == ')' || c == ']') && depth > 0) {
        depth--;
      }
    }
    if (begin) res.push_back(s.substr(*begin));
    return res;
  }

  // A piece that fails to parse could not be completed by the following pieces either: they are
  // separated from it by blanks outside of any bracket or literal.
  auto parseElements(string_view s) -> vector<Tree> {
    auto res = vector<Tree>();
    for (auto const piece: splitTopLevel(s)) res.push_back(parse(piece));
    return res;
  }

  auto parseBracketed(string_view s) -> Tree {
    checkBalanced(s);
    auto elements = parseElements(s.substr(1, s.size() - 2));
    if (s.back() == ']') return List{std::move(elements)};
    if (elements.empty()) throw ParseError(EmptyCall, "empty function call: " + string(s));
    auto const head = std::get_if<Symbol>(&elements.front());
    if (!head || head->quote != Quote::None || head->rest)
      throw ParseError(InvalidCall, "invalid function call head: " + elements.front().toString());
    auto name = *head;
    elements.erase(elements.begin());
    return Funcall{std::move(name), std::move(elements)};
  }

  struct Recognizer {
    bool (*accepts)(string_view);
    Tree (*parse)(string_view);
  };

  // In order of priority.
  constexpr auto recognizers = std::array<Recognizer, 5>{{
    {acceptsInteger, parseInteger},
    {acceptsSpecial, parseSpecial},
    {acceptsString, parseString},
    {acceptsSymbol, parseSymbol},
    {acceptsBracketed, parseBracketed},
  }};

  auto parse(string_view s) -> Tree {
    s = trim(s);
    for (auto const& recognizer: recognizers)
      if (recognizer.accepts(s)) return recognizer.parse(s);
    throw ParseError(NoParser, "no parser available for: \"" + string(s) + "\"");
  }

#include "macros_close.hpp"
}
