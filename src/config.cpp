#include "config.hpp"
#include <fstream>

using std::string;
using std::vector;
using nlohmann::json;

namespace crisp {
#include "macros_open.hpp"

  // Signed and floating-point numbers are rejected rather than converted.
  auto unsignedValue(json const& j, char const* key, size_t def) -> size_t {
    if (!j.contains(key)) return def;
    auto const& v = j.at(key);
    if (!v.is_number_unsigned())
      throw ConfigError(string("invalid configuration: ") + key + " must be a non-negative integer, got " + v.dump());
    return v.get<size_t>();
  }

  auto Config::fromJson(json const& j) -> Config {
    if (!j.is_object()) throw ConfigError("configuration must be a JSON object, got " + string(j.type_name()));
    auto res = Config();
    try {
      res.stackSize = unsignedValue(j, "stackSize", res.stackSize);
      res.maxDepth = unsignedValue(j, "maxDepth", res.maxDepth);
      res.prompt = j.value("prompt", res.prompt);
      res.exitKeywords = j.value("exitKeywords", res.exitKeywords);
      for (auto const& s: j.value("prelude", vector<string>())) res.prelude.emplace_back(s);
    } catch (json::exception& ex) { throw ConfigError(string("invalid configuration: ") + ex.what()); }
    if (res.stackSize == 0) throw ConfigError("invalid configuration: stackSize must be positive");
    return res;
  }

  auto Config::fromString(string const& s) -> Config {
    try {
      return fromJson(json::parse(s));
    } catch (json::parse_error& ex) { throw ConfigError(string("malformed configuration: ") + ex.what()); }
  }

  auto Config::fromFile(std::filesystem::path const& path) -> Config {
    auto in = std::ifstream(path);
    if (!in.is_open()) throw ConfigError("could not open configuration file " + path.string());
    try {
      return fromJson(json::parse(in));
    } catch (json::parse_error& ex) {
      throw ConfigError("malformed configuration file " + path.string() + ": " + ex.what());
    }
  }

#include "macros_close.hpp"
}
