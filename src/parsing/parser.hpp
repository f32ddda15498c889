#ifndef CRISP_PARSING_PARSER_HPP
#define CRISP_PARSING_PARSER_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <common.hpp>
#include <eval/tree.hpp>

namespace crisp::parsing {
#include "macros_open.hpp"

  struct ParseError: std::runtime_error {
    enum class Kind: uint8_t {
      Malformed,         // Recognized shape, but the contents are not well-formed
      IntegerOverflow,   // Integer literal outside the `int32_t` range
      InvalidEscape,     // Backslash sequence other than `\" \n \t \\`
      UnmatchedBrackets, // Bracket stack mismatch, or form closed before the end of input
      EmptyCall,         // `()`
      InvalidCall,       // `(head ...)` where `head` is not an unquoted symbol
      NoParser           // No recognizer accepts the input
    };

    Kind kind;

    ParseError(Kind kind, std::string const& s):
      std::runtime_error(s),
      kind(kind) {}
  };

  constexpr char singleQuoteMarker = '\'';
  constexpr char evalQuoteMarker = ',';
  constexpr std::string_view restMarker = "...";

  auto isBlank(char c) -> bool;
  auto isSymbolChar(char c) -> bool;

  // Turns exactly one form into a `Tree` (surrounding blanks are ignored).
  // Recognizers are tried in a fixed order: integer, special literal, string, symbol, bracketed form.
  // Multiple top-level forms must be wrapped by the caller, e.g. in `(progn ...)`.
  auto parse(std::string_view s) -> eval::Tree;

#include "macros_close.hpp"
}

#endif // CRISP_PARSING_PARSER_HPP
