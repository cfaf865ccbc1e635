#include <gtest/gtest.h>
#include "../../Domain/casbench-lang/error.hpp"

using namespace casbench;

TEST(Error, InvalidLexemeMessage){
  InvalidLexemeError e(InvalidLexeme{"_", 0, 4, 4});
  EXPECT_STREQ(e.what(), "Invalid lexeme _ encountered on line 0 at column 4 (index 4) during lexing");
  EXPECT_EQ(e.detail().character, "_");
  EXPECT_EQ(e.detail().column, 4u);
  EXPECT_TRUE(std::holds_alternative<InvalidLexeme>(e.error()));
}

TEST(Error, CatchableThroughRoot){
  try {
    throw InvalidLexemeError(InvalidLexeme{"#", 0, 2, 2});
  } catch (const CasbenchError& e) {
    EXPECT_EQ(std::get<InvalidLexeme>(e.error()).index, 2u);
    return;
  }
  FAIL() << "InvalidLexemeError not caught as CasbenchError";
}

TEST(Error, RootDerivesFromRuntimeError){
  EXPECT_THROW(throw ExhaustedTokensError(ExhaustedTokens{TokenType::RightParenthesis, 3}), std::runtime_error);
}

TEST(Error, ParserKindsDescribeThemselves){
  Token found{TokenType::Comma, std::string(","), 0, 9, std::nullopt};
  UnexpectedTokenError u(UnexpectedToken{TokenType::RightParenthesis, found});
  EXPECT_STREQ(u.what(), "Unexpected comma on line 0 at column 9, expected right_parenthesis");
  EXPECT_EQ(u.detail().found, found);

  ExhaustedTokensError x(ExhaustedTokens{TokenType::Identifier, 5});
  EXPECT_STREQ(x.what(), "Token stream exhausted after 5 tokens, expected identifier");
}

TEST(Error, DescribeMatchesWhat){
  Error e = InvalidLexeme{"=", 0, 3, 3};
  InvalidLexemeError ex(std::get<InvalidLexeme>(e));
  EXPECT_EQ(describe(e), ex.what());
}

TEST(Error, MultibyteCharacterKeptWhole){
  InvalidLexemeError e(InvalidLexeme{"\u2211", 0, 5, 5});
  EXPECT_EQ(e.detail().character, "\xE2\x88\x91");
  EXPECT_STREQ(e.what(), "Invalid lexeme \u2211 encountered on line 0 at column 5 (index 5) during lexing");
}
