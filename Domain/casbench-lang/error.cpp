#include "error.hpp"
#include <fmt/core.h>
#include <type_traits>
#include <utility>

namespace casbench {

  namespace {

    template <class>
    inline constexpr bool always_false = false;

  } // namespace

  std::string describe(const Error &e) {
    return std::visit(
        [](const auto &d) -> std::string {
          using T = std::decay_t<decltype(d)>;
          if constexpr (std::is_same_v<T, InvalidLexeme>) {
            return fmt::format("Invalid lexeme {} encountered on line {} at column {} (index {}) during lexing",
                               d.character, d.line, d.column, d.index);
          } else if constexpr (std::is_same_v<T, UnexpectedToken>) {
            return fmt::format("Unexpected {} on line {} at column {}, expected {}",
                               to_string(d.found.type), d.found.line, d.found.column, to_string(d.expected));
          } else if constexpr (std::is_same_v<T, ExhaustedTokens>) {
            return fmt::format("Token stream exhausted after {} tokens, expected {}", d.consumed,
                               to_string(d.expected));
          } else {
            static_assert(always_false<T>, "unhandled error kind");
          }
        },
        e);
  }

  CasbenchError::CasbenchError(Error e) : std::runtime_error(describe(e)), error_(std::move(e)) {}

} // namespace casbench
