#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <variant>

namespace casbench {

  enum class TokenType {
    Identifier,
    IntegerLiteral,
    FloatLiteral,
    LeftParenthesis,
    RightParenthesis,
    Comma,
    EqualEqual, // ==
    EndOfStream,
  };

  // Parsed value of a numeric lexeme.
  using Literal = std::variant<std::int64_t, double>;

  struct Token {
    TokenType type{};
    std::optional<std::string> lexeme{}; // empty only for EndOfStream
    std::size_t line{0};
    std::size_t column{0};
    std::optional<Literal> literal{}; // set only for IntegerLiteral / FloatLiteral

    // Characters consumed (UTF-8 code points, not bytes).
    std::size_t length() const;
  };

  const char *to_string(TokenType t);

  bool operator==(const Token &a, const Token &b);
  inline bool operator!=(const Token &a, const Token &b) {
    return !(a == b);
  }

  std::ostream &operator<<(std::ostream &os, TokenType t);
  std::ostream &operator<<(std::ostream &os, const Token &tok);

} // namespace casbench
