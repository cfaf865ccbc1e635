#include "token.hpp"
#include <algorithm>
#include <fmt/core.h>

namespace casbench {

  const char *to_string(TokenType t) {
    switch (t) {
    case TokenType::Identifier:
      return "identifier";
    case TokenType::IntegerLiteral:
      return "integer_literal";
    case TokenType::FloatLiteral:
      return "float_literal";
    case TokenType::LeftParenthesis:
      return "left_parenthesis";
    case TokenType::RightParenthesis:
      return "right_parenthesis";
    case TokenType::Comma:
      return "comma";
    case TokenType::EqualEqual:
      return "equal_equal";
    case TokenType::EndOfStream:
      return "end_of_stream";
    }
    return "unknown";
  }

  std::size_t Token::length() const {
    if (!lexeme)
      return 0;
    // count every byte that does not continue a UTF-8 sequence
    return (std::size_t)std::count_if(lexeme->begin(), lexeme->end(),
                                      [](char c) { return ((unsigned char)c & 0xC0) != 0x80; });
  }

  bool operator==(const Token &a, const Token &b) {
    return a.type == b.type && a.lexeme == b.lexeme && a.line == b.line && a.column == b.column &&
           a.literal == b.literal;
  }

  std::ostream &operator<<(std::ostream &os, TokenType t) {
    return os << to_string(t);
  }

  std::ostream &operator<<(std::ostream &os, const Token &tok) {
    os << to_string(tok.type);
    if (tok.lexeme)
      os << " \"" << *tok.lexeme << "\"";
    os << " @" << tok.line << ":" << tok.column;
    if (tok.literal) {
      if (const auto *i = std::get_if<std::int64_t>(&*tok.literal))
        os << " = " << *i;
      else
        os << " = " << fmt::format("{}", std::get<double>(*tok.literal));
    }
    return os;
  }

} // namespace casbench
