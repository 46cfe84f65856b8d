#ifndef SRC_UTIL_INL_H_
#define SRC_UTIL_INL_H_

#if defined(INWASM_WANT_INTERNALS) && INWASM_WANT_INTERNALS

#include <locale>
#include "util.h"

namespace inwasm {

char ToLower(char c) {
  return std::tolower(c, std::locale::classic());
}

std::string ToLower(std::string_view in) {
  std::string out(in.size(), 0);
  for (size_t i = 0; i < in.size(); ++i)
    out[i] = ToLower(in[i]);
  return out;
}

char ToUpper(char c) {
  return std::toupper(c, std::locale::classic());
}

std::string ToUpper(std::string_view in) {
  std::string out(in.size(), 0);
  for (size_t i = 0; i < in.size(); ++i)
    out[i] = ToUpper(in[i]);
  return out;
}

}  // namespace inwasm

#endif  // defined(INWASM_WANT_INTERNALS) && INWASM_WANT_INTERNALS

#endif  // SRC_UTIL_INL_H_
