#include <gtest/gtest.h>
#include "../../Infrastructure/casbench-capi/capi.hpp"
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

TEST(CApi, LexesToJsonArray){
  char* out = nullptr;
  char* err = nullptr;
  ASSERT_EQ(casbench_lex_source("diff(e, x, 10)", &out, &err), 0);
  ASSERT_NE(out, nullptr);
  EXPECT_EQ(err, nullptr);
  auto j = json::parse(out);
  casbench_free(out);

  ASSERT_TRUE(j.is_array());
  ASSERT_EQ(j.size(), 9u);
  EXPECT_EQ(j[0]["type"], "identifier");
  EXPECT_EQ(j[0]["lexeme"], "diff");
  EXPECT_TRUE(j[0]["literal"].is_null());
  EXPECT_EQ(j[6]["type"], "integer_literal");
  EXPECT_EQ(j[6]["literal"], 10);
  EXPECT_EQ(j[6]["column"], 14);
  EXPECT_EQ(j[8]["type"], "end_of_stream");
  EXPECT_TRUE(j[8]["lexeme"].is_null());
  EXPECT_EQ(j[8]["column"], 14 + 3);
}

TEST(CApi, FloatLiteral){
  char* out = nullptr;
  char* err = nullptr;
  ASSERT_EQ(casbench_lex_source("0.5678", &out, &err), 0);
  auto j = json::parse(out);
  casbench_free(out);
  EXPECT_EQ(j[0]["type"], "float_literal");
  EXPECT_DOUBLE_EQ(j[0]["literal"].get<double>(), 0.5678);
}

TEST(CApi, InvalidLexemeReported){
  char* out = nullptr;
  char* err = nullptr;
  ASSERT_EQ(casbench_lex_source("f(100_000)", &out, &err), 4);
  EXPECT_EQ(out, nullptr);
  ASSERT_NE(err, nullptr);
  auto j = json::parse(err);
  casbench_free(err);
  EXPECT_EQ(j["kind"], "invalid_lexeme");
  EXPECT_EQ(j["character"], "1");
  EXPECT_EQ(j["column"], 2);
  EXPECT_EQ(j["index"], 2);
  EXPECT_EQ(j["line"], 0);
  EXPECT_EQ(j["message"], "Invalid lexeme 1 encountered on line 0 at column 2 (index 2) during lexing");
}

TEST(CApi, NullArguments){
  char* out = nullptr;
  char* err = nullptr;
  EXPECT_EQ(casbench_lex_source(nullptr, &out, &err), 1);
  EXPECT_EQ(casbench_lex_source("x", nullptr, &err), 1);
  EXPECT_EQ(casbench_lex_source("x", &out, nullptr), 1);
  casbench_free(nullptr);
}

TEST(CApi, NonAsciiIdentifiersAndErrors){
  char* out = nullptr;
  char* err = nullptr;
  ASSERT_EQ(casbench_lex_source("f(\u03c0)", &out, &err), 0);
  auto j = json::parse(out);
  casbench_free(out);
  EXPECT_EQ(j[2]["lexeme"], "\u03c0");
  EXPECT_EQ(j[3]["column"], 3);

  out = nullptr;
  ASSERT_EQ(casbench_lex_source("x == \u221a2", &out, &err), 4);
  auto e = json::parse(err); // throws on invalid UTF-8
  casbench_free(err);
  EXPECT_EQ(e["character"], "\u221a");
  EXPECT_EQ(e["column"], 5);
}
