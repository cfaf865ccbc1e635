#pragma once

#if defined(_WIN32)
  #define CASBENCH_API __declspec(dllexport)
#else
  #define CASBENCH_API __attribute__((visibility("default")))
#endif

extern "C" {
  // Lexes one expression. Returns 0 on success with *out_json set to a JSON array of tokens.
  // Returns 4 when the source has an invalid lexeme (*out_error holds a JSON object describing it),
  // 1 on null arguments, 2 on allocation failure, 3 on any other error (*out_error holds the message).
  // Strings handed out must be released with casbench_free.
  CASBENCH_API int casbench_lex_source(const char* source_utf8, char** out_json, char** out_error);
  CASBENCH_API void casbench_free(char* ptr);
}
