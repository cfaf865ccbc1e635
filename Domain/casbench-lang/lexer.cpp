#include "lexer.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <fmt/core.h>
#include <limits>
#include <locale>
#include <sstream>
#include <system_error>

namespace casbench {

  // One decoded UTF-8 sequence. bytes == 0 marks a malformed sequence.
  struct CodePoint {
    char32_t value{0};
    std::size_t bytes{0};
  };

  static CodePoint decode_utf8(const std::string &s, std::size_t i) {
    const auto b0 = (unsigned char)s[i];
    if (b0 < 0x80)
      return {b0, 1};
    std::size_t len = 0;
    char32_t cp     = 0;
    if ((b0 & 0xE0) == 0xC0) {
      len = 2;
      cp  = b0 & 0x1F;
    } else if ((b0 & 0xF0) == 0xE0) {
      len = 3;
      cp  = b0 & 0x0F;
    } else if ((b0 & 0xF8) == 0xF0) {
      len = 4;
      cp  = b0 & 0x07;
    } else {
      return {};
    }
    if (i + len > s.size())
      return {};
    for (std::size_t k = 1; k < len; ++k) {
      const auto b = (unsigned char)s[i + k];
      if ((b & 0xC0) != 0x80)
        return {};
      cp = (cp << 6) | (b & 0x3F);
    }
    static const char32_t min_for_len[] = {0, 0, 0x80, 0x800, 0x10000};
    if (cp < min_for_len[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
      return {};
    return {cp, len};
  }

  // Letters outside ASCII: Latin-1, Latin Extended-A/B and Additional, Greek, Cyrillic.
  static bool is_letter_beyond_ascii(char32_t c) {
    if (c == 0xAA || c == 0xB5 || c == 0xBA)
      return true;
    if (c >= 0xC0 && c <= 0x24F)
      return c != 0xD7 && c != 0xF7;
    if (c == 0x386 || (c >= 0x388 && c <= 0x3FF))
      return c != 0x38B && c != 0x38D && c != 0x3A2 && c != 0x3F6;
    if (c >= 0x400 && c <= 0x52F)
      return c <= 0x481 || c >= 0x48A;
    return c >= 0x1E00 && c <= 0x1EFF;
  }

  static bool is_alpha(char32_t c) {
    if (c < 0x80)
      return std::isalpha((int)c) != 0;
    return is_letter_beyond_ascii(c);
  }
  static bool is_digit(char32_t c) {
    return c >= '0' && c <= '9';
  }
  static bool is_ident_char(char32_t c) {
    return is_alpha(c) || is_digit(c) || c == '_';
  }

  static bool is_nonzero_digit(char c) {
    return c >= '1' && c <= '9';
  }

  static std::optional<Literal> parse_literal(const std::string &text, bool has_decimal_point) {
    if (!has_decimal_point) {
      std::int64_t v = 0;
      auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
      if (ec != std::errc() || end != text.data() + text.size())
        return std::nullopt;
      return Literal{v};
    }
    // "1." is accepted; the stream parser reads it as 1.0
    std::istringstream is(text);
    is.imbue(std::locale::classic());
    double d = 0.0;
    is >> d;
    if (is.fail()) {
      // text is digits with one '.', so the only failure left is range:
      // a nonzero integer part overflowed, otherwise the fraction underflowed
      auto dot = text.find('.');
      if (std::any_of(text.begin(), text.begin() + (std::ptrdiff_t)dot, is_nonzero_digit))
        return Literal{std::numeric_limits<double>::infinity()};
      return Literal{0.0};
    }
    return Literal{d};
  }

  static bool trace_enabled() {
    if (const char *env = std::getenv("CASBENCH_LEX_TRACE"))
      return std::strcmp(env, "0") != 0;
    return false;
  }

  const LexResult &Lexer::try_tokens() const {
    std::call_once(once_, [this] { result_ = compute(); });
    return *result_;
  }

  const std::vector<Token> &Lexer::tokens() const {
    const LexResult &r = try_tokens();
    if (r.error)
      throw InvalidLexemeError(*r.error);
    return r.tokens;
  }

  LexResult Lexer::compute() const {
    LexResult r = scan();
    if (trace_enabled()) {
      fmt::print(stderr, "[lex] source: \"{}\" ({} bytes)\n", src_, src_.size());
      if (r.error) {
        fmt::print(stderr, "[lex] {}\n", describe(*r.error));
      } else {
        for (const auto &t : r.tokens)
          fmt::print(stderr, "[lex] {} '{}' {}:{}\n", to_string(t.type), t.lexeme.value_or(""), t.line, t.column);
      }
    }
    return r;
  }

  // index counts characters (code points) like column; pos is the byte offset into src_.
  LexResult Lexer::scan() const {
    LexResult out;
    const std::size_t n = src_.size();
    std::size_t line    = 0;
    std::size_t column  = 0;
    std::size_t index   = 0;
    std::size_t pos     = 0;

    auto invalid_at = [&](std::size_t at) {
      const CodePoint cp = decode_utf8(src_, at);
      LexResult failed;
      failed.error = InvalidLexeme{cp.bytes ? src_.substr(at, cp.bytes)
                                            : fmt::format("\\x{:02X}", (unsigned)(unsigned char)src_[at]),
                                   line, column, index};
      return failed;
    };

    while (pos < n) {
      const CodePoint c = decode_utf8(src_, pos);
      if (!c.bytes)
        return invalid_at(pos);

      if (c.value == ' ') {
        ++column;
        ++index;
        ++pos;
        continue;
      }

      TokenType type{};
      std::size_t bytes = c.bytes;
      std::size_t chars = 1;
      std::optional<Literal> literal;

      if (is_alpha(c.value)) {
        while (pos + bytes < n) {
          const CodePoint p = decode_utf8(src_, pos + bytes);
          if (!p.bytes || !is_ident_char(p.value))
            break;
          bytes += p.bytes;
          ++chars;
        }
        type = TokenType::Identifier;
      } else if (is_digit(c.value)) {
        bool has_decimal_point = false;
        while (pos + bytes < n) {
          const CodePoint p = decode_utf8(src_, pos + bytes);
          if (p.value == '.' && p.bytes) {
            if (has_decimal_point)
              return invalid_at(pos);
            has_decimal_point = true;
          } else if (p.bytes && (is_alpha(p.value) || p.value == '_')) {
            // 100_000, 0x1, 2π
            return invalid_at(pos);
          } else if (!p.bytes || !is_digit(p.value)) {
            break;
          }
          bytes += p.bytes;
          ++chars;
        }
        literal = parse_literal(src_.substr(pos, bytes), has_decimal_point);
        if (!literal)
          return invalid_at(pos);
        type = has_decimal_point ? TokenType::FloatLiteral : TokenType::IntegerLiteral;
      } else {
        switch (c.value) {
        case '(':
          type = TokenType::LeftParenthesis;
          break;
        case ')':
          type = TokenType::RightParenthesis;
          break;
        case ',':
          type = TokenType::Comma;
          break;
        case '=':
          // only == exists; a lone = (including at end of input) is an error
          if (pos + 1 >= n || src_[pos + 1] != '=')
            return invalid_at(pos);
          type  = TokenType::EqualEqual;
          bytes = 2;
          chars = 2;
          break;
        default:
          return invalid_at(pos);
        }
      }

      out.tokens.push_back(Token{type, src_.substr(pos, bytes), line, column, literal});
      column += chars;
      index += chars;
      pos += bytes;
    }

    out.tokens.push_back(Token{TokenType::EndOfStream, std::nullopt, line, column, std::nullopt});
    return out;
  }

} // namespace casbench
