#include "capi.hpp"
#include "../../Domain/casbench-lang/lexer.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <cstring>
#include <string>

using json = nlohmann::json;

namespace casbench {

  void to_json(json& j, TokenType t){ j = to_string(t); }

  void to_json(json& j, const Token& t){
    j = json{{"type", t.type}, {"line", t.line}, {"column", t.column}};
    j["lexeme"] = t.lexeme ? json(*t.lexeme) : json(nullptr);
    if (!t.literal) j["literal"] = nullptr;
    else if (const auto* i = std::get_if<std::int64_t>(&*t.literal)) j["literal"] = *i;
    else j["literal"] = std::get<double>(*t.literal);
  }

  void to_json(json& j, const InvalidLexeme& e){
    j = json{{"kind", "invalid_lexeme"},
             {"character", e.character},
             {"line", e.line},
             {"column", e.column},
             {"index", e.index},
             {"message", describe(e)}};
  }

} // namespace casbench

static char* dup_utf8(const std::string& s){
  char* p = (char*)std::malloc(s.size()+1);
  if (!p) return nullptr;
  std::memcpy(p, s.data(), s.size());
  p[s.size()] = '\0';
  return p;
}

extern "C" {

CASBENCH_API void casbench_free(char* ptr){ if(ptr) std::free(ptr); }

CASBENCH_API int casbench_lex_source(const char* source_utf8, char** out_json, char** out_error){
  if (!source_utf8 || !out_json || !out_error) return 1;
  *out_json = nullptr; *out_error = nullptr;
  try{
    casbench::Lexer lex(source_utf8);
    const auto& res = lex.try_tokens();
    if (!res.ok()){
      json j = *res.error;
      *out_error = dup_utf8(j.dump());
      return *out_error ? 4 : 2;
    }
    json out = res.tokens;
    *out_json = dup_utf8(out.dump());
    if (!*out_json) { *out_error = dup_utf8("alloc failure"); return 2; }
    return 0;
  } catch (const std::exception& ex){
    *out_error = dup_utf8(ex.what());
    return 3;
  }
}

} // extern "C"
