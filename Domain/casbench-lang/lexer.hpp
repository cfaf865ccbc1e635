#pragma once
#include "error.hpp"
#include "token.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace casbench {

  // Outcome of one scan: the full token stream, or the error that aborted it.
  // tokens is empty whenever error is set.
  struct LexResult {
    std::vector<Token> tokens;
    std::optional<InvalidLexeme> error;

    bool ok() const {
      return !error.has_value();
    }
  };

  // Single-line lexer for benchmark-definition expressions such as
  // `evalf(subs(result, x, 1.0)) == 0.5678`.
  //
  // The source is scanned at most once per instance, on the first call to
  // tokens() or try_tokens(); later calls (from any thread) return the cached
  // result, including a cached failure.
  class Lexer {
  public:
    explicit Lexer(std::string src) : src_(std::move(src)) {}
    Lexer(const Lexer &)            = delete;
    Lexer &operator=(const Lexer &) = delete;

    const std::string &source() const {
      return src_;
    }

    // Token stream ending in exactly one EndOfStream token.
    // Throws InvalidLexemeError if the source cannot be tokenized.
    const std::vector<Token> &tokens() const;

    // Same scan as tokens(), reported without throwing.
    const LexResult &try_tokens() const;

  private:
    LexResult scan() const;
    LexResult compute() const;

    std::string src_;
    mutable std::once_flag once_;
    mutable std::optional<LexResult> result_;
  };

} // namespace casbench
