#include "loader.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <parsing/parser.hpp>
#include "evaluator.hpp"

using std::string;
using std::string_view;

namespace crisp::eval {
#include "macros_open.hpp"

  auto evalString(Environment& env, string_view s) -> Tree {
    auto e = Tree();
    try {
      e = parsing::parse(s);
    } catch (parsing::ParseError& ex) {
      throw EvalError(EvalError::Kind::Parsing, "", string("parsing error: ") + ex.what());
    }
    return eval(e, env);
  }

  auto evalSource(Environment& env, string_view s) -> Tree {
    return evalString(env, "(progn\n" + string(s) + "\n)");
  }

  // See: https://stackoverflow.com/questions/116038/how-do-i-read-an-entire-file-into-a-stdstring-in-c
  auto evalStream(Environment& env, std::istream& in) -> Tree {
    auto sstr = std::ostringstream();
    sstr << in.rdbuf();
    return evalSource(env, sstr.str());
  }

  auto evalFile(Environment& env, std::filesystem::path const& path) -> Tree {
    auto in = std::ifstream(path);
    if (!in.is_open())
      throw EvalError(EvalError::Kind::FileRead, path.string(), "could not read " + path.string() + ": " + std::strerror(errno));
    auto sstr = std::ostringstream();
    sstr << in.rdbuf();
    if (in.bad()) throw EvalError(EvalError::Kind::FileRead, path.string(), "could not read " + path.string() + ": I/O error");
    return evalSource(env, sstr.str());
  }

#include "macros_close.hpp"
}
