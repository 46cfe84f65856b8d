#ifndef SRC_DEBUG_UTILS_H_
#define SRC_DEBUG_UTILS_H_

#if defined(INWASM_WANT_INTERNALS) && INWASM_WANT_INTERNALS

#include "util.h"

#include <string>
#include <string_view>

// Use FORCE_INLINE on functions that have a debug-category-enabled check first
// and then ideally only a single function call following it, to maintain
// performance for the common case (no debugging used).
#ifdef __GNUC__
#define FORCE_INLINE __attribute__((always_inline))
#define COLD_NOINLINE __attribute__((cold, noinline))
#else
#define FORCE_INLINE
#define COLD_NOINLINE
#endif

namespace inwasm {

template <typename T>
inline std::string ToString(const T& value);

// C++-style variant of sprintf()/fprintf() that:
// - Returns an std::string
// - Handles \0 bytes correctly
// - Supports %p and %s. %d, %i and %u are aliases for %s.
// - Accepts any class that has a ToString() method for stringification.
template <typename... Args>
inline std::string SPrintF(std::string_view format, Args&&... args);
template <typename... Args>
inline void FPrintF(FILE* file, std::string_view format, Args&&... args);
void FWrite(FILE* file, const std::string& str);

#define DEBUG_CATEGORY_NAMES(V)                                                \
  V(CODEC)                                                                     \
  V(DEFINITION)                                                                \
  V(CAPTURE)                                                                   \
  V(LOADER)                                                                    \
  V(ENGINE)                                                                    \
  V(COMPILER)                                                                  \
  V(HOST)

enum class DebugCategory : unsigned int {
#define V(name) name,
  DEBUG_CATEGORY_NAMES(V)
#undef V
};

#define V(name) +1
constexpr unsigned int kDebugCategoryCount = DEBUG_CATEGORY_NAMES(V);
#undef V

class EnabledDebugList {
 public:
  bool FORCE_INLINE enabled(DebugCategory category) const {
    DCHECK_LT(static_cast<unsigned int>(category), kDebugCategoryCount);
    return enabled_[static_cast<unsigned int>(category)];
  }

  // Uses INWASM_DEBUG_NATIVE to initialize the categories.
  void Parse();
  // Enable all categories matching cats.
  void Parse(const std::string& cats);
  void Reset();

 private:
  void set_enabled(DebugCategory category) {
    DCHECK_LT(static_cast<unsigned int>(category), kDebugCategoryCount);
    enabled_[static_cast<int>(category)] = true;
  }

  bool enabled_[kDebugCategoryCount] = {false};
};

template <typename... Args>
inline void FORCE_INLINE Debug(EnabledDebugList* list,
                               DebugCategory cat,
                               const char* format,
                               Args&&... args);

inline void FORCE_INLINE Debug(EnabledDebugList* list,
                               DebugCategory cat,
                               const char* message);

namespace per_process {
// Parsed lazily from INWASM_DEBUG_NATIVE on first use.
EnabledDebugList* enabled_debug_list();

template <typename... Args>
inline void FORCE_INLINE Debug(DebugCategory cat,
                               const char* format,
                               Args&&... args);

inline void FORCE_INLINE Debug(DebugCategory cat, const char* message);
}  // namespace per_process
}  // namespace inwasm

#endif  // defined(INWASM_WANT_INTERNALS) && INWASM_WANT_INTERNALS

#endif  // SRC_DEBUG_UTILS_H_
