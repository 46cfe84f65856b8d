#include "inwasm_options.h"
#include "debug_utils-inl.h"
#include "util.h"

#include <cerrno>
#include <climits>
#include <cstdlib>

namespace inwasm {

namespace {

constexpr int kMaxThreadPoolSize = 1024;

bool ParseThreadPoolSize(const std::string& text, int* result) {
  if (text.empty()) return false;
  char* end = nullptr;
  errno = 0;
  const long value = strtol(text.c_str(), &end, 10);  // NOLINT(runtime/int)
  if (errno != 0 || *end != '\0') return false;
  if (value < 1 || value > kMaxThreadPoolSize) return false;
  *result = static_cast<int>(value);
  return true;
}

}  // anonymous namespace

HostOptions HostOptions::FromEnvironment() {
  HostOptions options;

  std::string text;
  if (SafeGetenv("INWASM_THREAD_POOL_SIZE", &text)) {
    if (!ParseThreadPoolSize(text, &options.thread_pool_size)) {
      per_process::Debug(DebugCategory::HOST,
                         "ignoring INWASM_THREAD_POOL_SIZE=%s, using %d\n",
                         text,
                         kDefaultThreadPoolSize);
    }
  }
  if (SafeGetenv("INWASM_V8_FLAGS", &text)) {
    options.v8_flags = text;
  }

  per_process::Debug(DebugCategory::HOST,
                     "host options: thread_pool_size=%d v8_flags=\"%s\"\n",
                     options.thread_pool_size,
                     options.v8_flags);
  return options;
}

}  // namespace inwasm
