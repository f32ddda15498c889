#ifndef CRISP_COMMON_HPP
#define CRISP_COMMON_HPP

#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>
#include <utility>
#include <variant>
#undef assert

namespace crisp {

  using std::int32_t;
  using std::int64_t;
  using std::size_t;
  using std::uint8_t;

  // "Unreachable" mark.
  [[noreturn]] inline auto unreachable(char const* file, int line, char const* func) -> void {
    std::cerr << "\"Unreachable\" code was reached: " << file << ":" << line << ", at function " << func << std::endl;
    std::terminate();
  }

  // Assertion that remains present under non-debug configurations.
  inline auto assert(bool expr, char const* name, char const* file, int line, char const* func) -> void {
    if (!expr) {
      std::cerr << "Assertion failed: " << name << std::endl;
      unreachable(file, line, func);
    }
  }

  // "Pattern matching" on `std::variant`.
  // See: https://en.cppreference.com/w/cpp/utility/variant/visit
  template <typename... Ts>
  struct Matcher: Ts... {
    using Ts::operator()...;
  };

  // Usage: `match(variant, [&](CaseType1 v) { return ...; }, [&](CaseType2 v) { return ...; }, ...)`
  // Return values of each lambda must have the same type.
  template <typename T, typename... Ts>
  constexpr auto match(T&& variant, Ts&&... lambdas) {
    return std::visit(Matcher<Ts...>{std::forward<Ts>(lambdas)...}, std::forward<T>(variant));
  }

}

#endif // CRISP_COMMON_HPP
