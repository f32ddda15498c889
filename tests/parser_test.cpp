#include <chrono>
#include <string>
#include <gtest/gtest.h>
#include <parsing/parser.hpp>

using namespace crisp::eval;
using crisp::parsing::parse, crisp::parsing::ParseError;
using enum ParseError::Kind;

namespace {

  auto parseErrorKind(std::string const& s) -> ParseError::Kind {
    try {
      parse(s);
    } catch (ParseError& ex) { return ex.kind; }
    ADD_FAILURE() << "expected a parse error for: " << s;
    return Malformed;
  }

}

TEST(ParserTest, SpecialLiterals) {
  EXPECT_EQ(parse("t"), Tree(True{}));
  EXPECT_EQ(parse("nil"), Tree(Nil{}));
  // Only exact matches
  EXPECT_EQ(parse("nil2"), Tree(Symbol{"nil2"}));
}

TEST(ParserTest, Integers) {
  for (auto const i: {0, 1, -1, 10, -10, 99, -99}) EXPECT_EQ(parse(std::to_string(i)), Tree(Integer{i}));
  EXPECT_EQ(parse("+1000"), Tree(Integer{1000}));
  EXPECT_EQ(parse("007"), Tree(Integer{7}));
  EXPECT_EQ(parse("-2147483648"), Tree(Integer{-2147483647 - 1}));
  EXPECT_EQ(parse("2147483647"), Tree(Integer{2147483647}));
}

TEST(ParserTest, IntegerOverflowIsAnError) {
  EXPECT_EQ(parseErrorKind("2147483648"), IntegerOverflow);
  EXPECT_EQ(parseErrorKind("-2147483649"), IntegerOverflow);
  EXPECT_EQ(parseErrorKind("100000000000"), IntegerOverflow);
  EXPECT_EQ(parseErrorKind("-99999999999"), IntegerOverflow);
  EXPECT_EQ(parseErrorKind("+99999999999"), IntegerOverflow);
  EXPECT_EQ(parseErrorKind("[1 99999999999]"), IntegerOverflow);
}

TEST(ParserTest, SignsAloneAreSymbols) {
  EXPECT_EQ(parse("+"), Tree(Symbol{"+"}));
  EXPECT_EQ(parse("-"), Tree(Symbol{"-"}));
  EXPECT_EQ(parse("1+"), Tree(Symbol{"1+"}));
}

TEST(ParserTest, Strings) {
  EXPECT_EQ(parse(R"("meh")"), Tree(String{"meh"}));
  EXPECT_EQ(parse(R"("Hello, World!")"), Tree(String{"Hello, World!"}));
  EXPECT_EQ(parse(R"("")"), Tree(String{""}));
  EXPECT_EQ(parse(R"("\\")"), Tree(String{"\\"}));
  EXPECT_EQ(parse(R"("\"hello\"")"), Tree(String{"\"hello\""}));
  EXPECT_EQ(parse(R"("hello\nworld\t!")"), Tree(String{"hello\nworld\t!"}));
}

TEST(ParserTest, MalformedStrings) {
  EXPECT_EQ(parseErrorKind(R"("hello)"), Malformed);
  EXPECT_EQ(parseErrorKind(R"(hello")"), Malformed);
  EXPECT_EQ(parseErrorKind(R"("hello"")"), Malformed);
  EXPECT_EQ(parseErrorKind(R"("a" "b")"), Malformed);
  EXPECT_EQ(parseErrorKind(R"("hello\q")"), InvalidEscape);
  EXPECT_EQ(parseErrorKind(R"("\r")"), InvalidEscape);
}

TEST(ParserTest, Symbols) {
  EXPECT_EQ(parse("'hello"), Tree(Symbol{"hello", Quote::Single, false}));
  EXPECT_EQ(parse(",bye"), Tree(Symbol{"bye", Quote::Eval, false}));
  EXPECT_EQ(parse("'actually-no..."), Tree(Symbol{"actually-no", Quote::Single, true}));
  EXPECT_EQ(parse("rest..."), Tree(Symbol{"rest", Quote::None, true}));
  EXPECT_EQ(parse("..."), Tree(Symbol{"...", Quote::None, false}));
  EXPECT_EQ(parse("+*answer/to/the|universe=42*+"), Tree(Symbol{"+*answer/to/the|universe=42*+"}));
  EXPECT_EQ(parse("  padded\n"), Tree(Symbol{"padded"}));
}

TEST(ParserTest, MalformedSymbols) {
  EXPECT_EQ(parseErrorKind("'with-a space"), Malformed);
  EXPECT_EQ(parseErrorKind("'a 'b"), Malformed);
  EXPECT_EQ(parseErrorKind("'"), Malformed);
  EXPECT_EQ(parseErrorKind(",'x"), Malformed);
  EXPECT_EQ(parseErrorKind("a,b"), Malformed);
}

TEST(ParserTest, Lists) {
  EXPECT_EQ(parse("[t nil]"), Tree(List{{True{}, Nil{}}}));
  EXPECT_EQ(parse("[[t t] [nil nil]]"), Tree(List{{List{{True{}, True{}}}, List{{Nil{}, Nil{}}}}}));
  EXPECT_EQ(parse("[]"), Tree(List{}));
  EXPECT_EQ(parse("[ \n ]"), Tree(List{}));
  // A bracketed list is data even when its head is a symbol
  EXPECT_EQ(parse("[f 1]"), Tree(List{{Symbol{"f"}, Integer{1}}}));
  EXPECT_EQ(parse("[(f 1)]"), Tree(List{{Funcall{Symbol{"f"}, {Integer{1}}}}}));
}

TEST(ParserTest, StringsWithBlanksInsideForms) {
  EXPECT_EQ(parse(R"(["hello" "world"])"), Tree(List{{String{"hello"}, String{"world"}}}));
  EXPECT_EQ(
    parse(R"(["hello world" "goodbye  world"])"),
    Tree(List{{String{"hello world"}, String{"goodbye  world"}}})
  );
  EXPECT_EQ(parse(R"((debug "a (b" "]"))"), Tree(Funcall{Symbol{"debug"}, {String{"a (b"}, String{"]"}}}));
  EXPECT_EQ(parse("[\"tab\tand\nnewline\"]"), Tree(List{{String{"tab\tand\nnewline"}}}));
}

TEST(ParserTest, Funcalls) {
  EXPECT_EQ(parse("(+ 1 2 3)"), Tree(Funcall{Symbol{"+"}, {Integer{1}, Integer{2}, Integer{3}}}));
  EXPECT_EQ(parse("(f)"), Tree(Funcall{Symbol{"f"}, {}}));
  EXPECT_EQ(
    parse("(defun add1 [n]\n  (+ n 1))"),
    Tree(Funcall{
      Symbol{"defun"},
      {Symbol{"add1"}, List{{Symbol{"n"}}}, Funcall{Symbol{"+"}, {Symbol{"n"}, Integer{1}}}}
    })
  );
}

TEST(ParserTest, InvalidCalls) {
  EXPECT_EQ(parseErrorKind("()"), EmptyCall);
  EXPECT_EQ(parseErrorKind("(   )"), EmptyCall);
  EXPECT_EQ(parseErrorKind("(1 2)"), InvalidCall);
  EXPECT_EQ(parseErrorKind("('f 2)"), InvalidCall);
  EXPECT_EQ(parseErrorKind("(,f 2)"), InvalidCall);
  EXPECT_EQ(parseErrorKind("(f... 2)"), InvalidCall);
  EXPECT_EQ(parseErrorKind("((f) 2)"), InvalidCall);
  EXPECT_EQ(parseErrorKind("([f] 2)"), InvalidCall);
  EXPECT_EQ(parseErrorKind("[()]"), EmptyCall);
}

TEST(ParserTest, UnmatchedBrackets) {
  EXPECT_EQ(parseErrorKind("(f"), UnmatchedBrackets);
  EXPECT_EQ(parseErrorKind("[1 2"), UnmatchedBrackets);
  EXPECT_EQ(parseErrorKind("(f]"), UnmatchedBrackets);
  EXPECT_EQ(parseErrorKind("[1 (2])"), UnmatchedBrackets);
  EXPECT_EQ(parseErrorKind("(f))"), UnmatchedBrackets);
  EXPECT_EQ(parseErrorKind("(f) (g)"), UnmatchedBrackets);
  EXPECT_EQ(parseErrorKind(R"(["abc])"), UnmatchedBrackets);
}

TEST(ParserTest, NothingMatches) {
  EXPECT_EQ(parseErrorKind(""), NoParser);
  EXPECT_EQ(parseErrorKind("   "), NoParser);
  EXPECT_EQ(parseErrorKind(")"), NoParser);
  EXPECT_EQ(parseErrorKind("]x"), NoParser);
  EXPECT_EQ(parseErrorKind("{a}"), NoParser);
}

TEST(ParserTest, ElementErrorsPropagate) {
  EXPECT_EQ(parseErrorKind(R"([1 "bad\q" 2])"), InvalidEscape);
  EXPECT_EQ(parseErrorKind("(f a{b})"), Malformed);
}

TEST(ParserTest, LongStringArgumentParsesInLinearTime) {
  auto words = std::string();
  for (auto i = 0; i < 50000; i++) words += "w ";
  auto const start = std::chrono::steady_clock::now();
  auto const tree = parse("(debug \"" + words + "\")");
  auto const elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_EQ(tree, Tree(Funcall{Symbol{"debug"}, {String{words}}}));
  EXPECT_LT(elapsed, std::chrono::seconds(1));
}

TEST(ParserTest, EarlyErrorInLongSourceIsReportedQuickly) {
  auto source = std::string("(progn\n(f ())\n");
  for (auto i = 0; i < 4000; i++) source += "(set 'counter (+ counter 1))\n";
  source += ")";
  auto const start = std::chrono::steady_clock::now();
  EXPECT_EQ(parseErrorKind(source), EmptyCall);
  auto const elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_LT(elapsed, std::chrono::seconds(1));
}
