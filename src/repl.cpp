#include "repl.hpp"
#include <algorithm>
#include <iostream>
#include <eval/builtins.hpp>
#include <eval/loader.hpp>

using std::string;
using std::endl;

namespace crisp {
#include "macros_open.hpp"

  auto repl(eval::Environment& env, Config const& config, std::istream& in, std::ostream& out) -> void {
    auto line = string();
    while (true) {
      out << config.prompt << std::flush;
      if (!std::getline(in, line)) {
        out << endl;
        break;
      }
      if (line.ends_with('\r')) line.pop_back();
      if (std::ranges::find(config.exitKeywords, line) != config.exitKeywords.end()) {
        out << "Goodbye!" << endl;
        break;
      }
      if (line.find_first_not_of(" \t\f\v") == string::npos) continue;
      try {
        out << eval::evalString(env, line).toString() << endl;
      } catch (eval::EvalError& ex) { out << ex.what() << endl; }
    }
  }

  auto run(Options const& options, Config const& config, std::istream& in, std::ostream& out, std::ostream& err) -> int {
    auto env = eval::Environment(out, config.maxDepth);
    eval::installBuiltins(env);
    try {
      for (auto const& path: config.prelude) eval::evalFile(env, path);
      if (options.files.empty()) {
        repl(env, config, in, out);
        return 0;
      }
      for (auto const& file: options.files) {
        if (file == "-") eval::evalStream(env, in);
        else eval::evalFile(env, file);
      }
    } catch (eval::EvalError& ex) {
      err << ex.what() << endl;
      return 1;
    }
    return 0;
  }

#include "macros_close.hpp"
}
