#pragma once
#include "token.hpp"
#include <cstddef>
#include <stdexcept>
#include <string>
#include <variant>

namespace casbench {

  // Character the lexer could not classify, or that broke a token rule.
  // character holds the whole UTF-8 sequence, or a \xNN escape for a malformed byte.
  // index is the offset in characters, not bytes.
  struct InvalidLexeme {
    std::string character{};
    std::size_t line{0};
    std::size_t column{0};
    std::size_t index{0};
  };

  // Parser-side: a token of the wrong type at a position in the stream.
  struct UnexpectedToken {
    TokenType expected{};
    Token found{};
  };

  // Parser-side: the stream ran out while a token was still expected.
  struct ExhaustedTokens {
    TokenType expected{};
    std::size_t consumed{0};
  };

  using Error = std::variant<InvalidLexeme, UnexpectedToken, ExhaustedTokens>;

  std::string describe(const Error &e);

  class CasbenchError : public std::runtime_error {
  public:
    const Error &error() const noexcept {
      return error_;
    }

  protected:
    explicit CasbenchError(Error e);

  private:
    Error error_;
  };

  class InvalidLexemeError : public CasbenchError {
  public:
    explicit InvalidLexemeError(const InvalidLexeme &e) : CasbenchError(e) {}
    const InvalidLexeme &detail() const noexcept {
      return std::get<InvalidLexeme>(error());
    }
  };

  // Reserved for the parser; never thrown by the lexer.
  class UnexpectedTokenError : public CasbenchError {
  public:
    explicit UnexpectedTokenError(const UnexpectedToken &e) : CasbenchError(e) {}
    const UnexpectedToken &detail() const noexcept {
      return std::get<UnexpectedToken>(error());
    }
  };

  class ExhaustedTokensError : public CasbenchError {
  public:
    explicit ExhaustedTokensError(const ExhaustedTokens &e) : CasbenchError(e) {}
    const ExhaustedTokens &detail() const noexcept {
      return std::get<ExhaustedTokens>(error());
    }
  };

} // namespace casbench
