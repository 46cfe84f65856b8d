#ifndef SRC_UTIL_H_
#define SRC_UTIL_H_

#if defined(INWASM_WANT_INTERNALS) && INWASM_WANT_INTERNALS

#include <cstddef>
#include <cstdio>
#include <cstdlib>

#include <string>
#include <string_view>

namespace inwasm {

// The reason that Assert() takes a struct argument instead of individual
// const char*s is to ease instruction cache pressure in calls from CHECK.
struct AssertionInfo {
  const char* file_line;  // filename:line
  const char* message;
  const char* function;
};

[[noreturn]] void Assert(const AssertionInfo& info);
void DumpNativeBacktrace(FILE* fp);

#define ABORT_NO_BACKTRACE() abort()

// `ABORT` must be a macro and not a [[noreturn]] function to make sure the
// backtrace is correct.
#define ABORT()                                                                \
  do {                                                                         \
    inwasm::DumpNativeBacktrace(stderr);                                       \
    fflush(stderr);                                                            \
    ABORT_NO_BACKTRACE();                                                      \
  } while (0)

#define ERROR_AND_ABORT(expr)                                                  \
  do {                                                                         \
    /* Make sure that this struct does not end up in inline code, but      */  \
    /* rather in a read-only data section when modifying this code.        */  \
    static const inwasm::AssertionInfo error_and_abort_args = {                \
        __FILE__ ":" STRINGIFY(__LINE__), #expr, PRETTY_FUNCTION_NAME};        \
    inwasm::Assert(error_and_abort_args);                                      \
  } while (0)

#ifdef __GNUC__
#define PRETTY_FUNCTION_NAME __PRETTY_FUNCTION__
#else
#if defined(_MSC_VER)
#define PRETTY_FUNCTION_NAME __FUNCSIG__
#else
#define PRETTY_FUNCTION_NAME ""
#endif
#endif

#define STRINGIFY_(x) #x
#define STRINGIFY(x) STRINGIFY_(x)

#define CHECK(expr)                                                            \
  do {                                                                         \
    if (!(expr)) [[unlikely]] {                                                \
      ERROR_AND_ABORT(expr);                                                   \
    }                                                                          \
  } while (0)

#define CHECK_EQ(a, b) CHECK((a) == (b))
#define CHECK_GE(a, b) CHECK((a) >= (b))
#define CHECK_LT(a, b) CHECK((a) < (b))
#define CHECK_NE(a, b) CHECK((a) != (b))
#define CHECK_NOT_NULL(val) CHECK((val) != nullptr)

#ifdef DEBUG
  #define DCHECK_LT(a, b) CHECK((a) < (b))
#else
  #define DCHECK_LT(a, b)
#endif

#define UNREACHABLE(...)                                                      \
  ERROR_AND_ABORT("Unreachable code reached" __VA_OPT__(": ") __VA_ARGS__)

template <typename T, size_t N>
constexpr size_t arraysize(const T (&)[N]) {
  return N;
}

// tolower() is locale-sensitive.  Use ToLower() instead.
inline char ToLower(char c);
inline std::string ToLower(std::string_view in);

// toupper() is locale-sensitive.  Use ToUpper() instead.
inline char ToUpper(char c);
inline std::string ToUpper(std::string_view in);

// Reads an environment variable through libuv. Returns false when the
// variable is not set.
bool SafeGetenv(const char* key, std::string* text);

}  // namespace inwasm

#endif  // defined(INWASM_WANT_INTERNALS) && INWASM_WANT_INTERNALS

#endif  // SRC_UTIL_H_
