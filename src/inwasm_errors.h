#ifndef SRC_INWASM_ERRORS_H_
#define SRC_INWASM_ERRORS_H_

#include <stdexcept>
#include <string>

namespace inwasm {

// Base class of every error raised by inwasm itself. Errors coming from the
// host WebAssembly engine are EngineErrors and are never wrapped in this.
class Error : public std::runtime_error {
 public:
  Error(const char* code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  // Stable identifier, e.g. "ERR_INWASM_MISSING_COMPILE_STEP".
  const char* code() const { return code_; }

 private:
  const char* code_;
};

class TypeError : public Error {
 public:
  using Error::Error;
};

class RangeError : public Error {
 public:
  using Error::Error;
};

// Helpers to construct errors with a code.
// Example: with `V(ERR_INWASM_INVALID_DEFINITION, TypeError)`, there will be
// `inwasm::ERR_INWASM_INVALID_DEFINITION("message")` returning a TypeError
// with the proper code and message, and THROW_ERR_INWASM_INVALID_DEFINITION()
// throwing it.
#define ERRORS_WITH_CODE(V)                                                    \
  V(ERR_INWASM_BUILD_DIRECTORY, Error)                                         \
  V(ERR_INWASM_DUPLICATE_DEFINITION, Error)                                    \
  V(ERR_INWASM_HOST_INITIALIZATION_FAILED, Error)                              \
  V(ERR_INWASM_INVALID_DEFINITION, TypeError)                                  \
  V(ERR_INWASM_INVALID_WASM_BINARY, RangeError)                                \
  V(ERR_INWASM_MISSING_COMPILE_STEP, Error)                                    \
  V(ERR_INWASM_NO_ENGINE, Error)                                               \
  V(ERR_INWASM_UNSUPPORTED_SOURCE_KIND, Error)

#define V(code, type) inline constexpr char k##code[] = #code;
ERRORS_WITH_CODE(V)
#undef V

}  // namespace inwasm

#if defined(INWASM_WANT_INTERNALS) && INWASM_WANT_INTERNALS

#include "debug_utils-inl.h"

namespace inwasm {

// If the macros are used as ERR_*(message) or THROW_ERR_*(message) with a
// single string argument, do not run the formatter on the message, so the
// caller can pass in text that would otherwise need escaping.
#define V(code, type)                                                          \
  template <typename... Args>                                                  \
  inline type code(const char* format, Args&&... args) {                       \
    std::string message;                                                       \
    if constexpr (sizeof...(Args) == 0) {                                      \
      message = format;                                                        \
    } else {                                                                   \
      message = SPrintF(format, std::forward<Args>(args)...);                  \
    }                                                                          \
    return type(k##code, message);                                             \
  }                                                                            \
  template <typename... Args>                                                  \
  [[noreturn]] inline void THROW_##code(const char* format, Args&&... args) {  \
    throw code(format, std::forward<Args>(args)...);                           \
  }
ERRORS_WITH_CODE(V)
#undef V

// Errors with predefined static messages

#define PREDEFINED_ERROR_MESSAGES(V)                                           \
  V(ERR_INWASM_NO_ENGINE,                                                      \
    "No WebAssembly engine is available to load this definition")

#define V(code, message)                                                       \
  inline auto code() { return code(message); }                                 \
  [[noreturn]] inline void THROW_##code() { throw code(message); }
PREDEFINED_ERROR_MESSAGES(V)
#undef V

// Errors with predefined non-static messages
[[noreturn]] inline void THROW_ERR_INWASM_MISSING_COMPILE_STEP(
    const std::string& name) {
  THROW_ERR_INWASM_MISSING_COMPILE_STEP(
      "WebAssembly definition \"%s\" was not compiled, must run \"inwasm\"",
      name);
}

}  // namespace inwasm

#endif  // defined(INWASM_WANT_INTERNALS) && INWASM_WANT_INTERNALS

#endif  // SRC_INWASM_ERRORS_H_
