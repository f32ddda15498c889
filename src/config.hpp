#ifndef CRISP_CONFIG_HPP
#define CRISP_CONFIG_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>
#include <common.hpp>
#include <eval/environment.hpp>
#include <nlohmann/json.hpp>

namespace crisp {
#include "macros_open.hpp"

  struct ConfigError: std::runtime_error {
    explicit ConfigError(std::string const& s):
      std::runtime_error(s) {}
  };

  // Interpreter settings, read from a JSON object. Missing keys keep their defaults.
  // Example: `{ "stackSize": 268435456, "maxDepth": 50000, "prelude": ["lib/std.cr"] }`
  struct Config {
    static constexpr size_t defaultStackSize = 64uz * 1024 * 1024;

    size_t stackSize = defaultStackSize; // Native stack of the interpreter thread, in bytes
    size_t maxDepth = eval::Environment::defaultMaxDepth; // Live frames; 0 means unlimited
    std::string prompt = "> ";
    std::vector<std::string> exitKeywords = {"exit", "quit"};
    std::vector<std::filesystem::path> prelude; // Loaded before the program

    static auto fromJson(nlohmann::json const& j) -> Config;
    static auto fromString(std::string const& s) -> Config;
    static auto fromFile(std::filesystem::path const& path) -> Config;
  };

#include "macros_close.hpp"
}

#endif // CRISP_CONFIG_HPP
