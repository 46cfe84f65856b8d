#include "util-inl.h"  // NOLINT(build/include)

#include <uv.h>

#include <string>
#include <vector>

#if defined(__linux__) && !defined(__GLIBC__) || defined(__UCLIBC__)
#define HAVE_EXECINFO_H 0
#else
#define HAVE_EXECINFO_H 1
#endif

#if HAVE_EXECINFO_H
#include <cxxabi.h>
#include <dlfcn.h>
#include <execinfo.h>
#endif

namespace inwasm {

void DumpNativeBacktrace(FILE* fp) {
  fprintf(fp, "----- Native stack trace -----\n\n");
#if HAVE_EXECINFO_H
  void* frames[256];
  const int size = backtrace(frames, arraysize(frames));
  for (int i = 1; i < size; i += 1) {
    void* frame = frames[i];
    std::string name;
    Dl_info info;
    if (dladdr(frame, &info) && info.dli_sname != nullptr) {
      if (char* demangled =
              abi::__cxa_demangle(info.dli_sname, nullptr, nullptr, nullptr)) {
        name = demangled;
        free(demangled);
      } else {
        name = info.dli_sname;
      }
    }
    fprintf(fp, "%2d: %p %s\n", i, frame, name.c_str());
  }
#endif  // HAVE_EXECINFO_H
}

[[noreturn]] void Assert(const AssertionInfo& info) {
  fprintf(stderr,
          "inwasm: %s:%s%s Assertion `%s' failed.\n",
          info.file_line,
          info.function,
          *info.function ? ":" : "",
          info.message);
  fflush(stderr);

  ABORT();
}

bool SafeGetenv(const char* key, std::string* text) {
  size_t init_sz = 256;
  std::vector<char> val(init_sz);
  int ret = uv_os_getenv(key, val.data(), &init_sz);

  if (ret == UV_ENOBUFS) {
    // Buffer is not large enough, reallocate to the updated init_sz
    // and fetch env value again.
    val.resize(init_sz);
    ret = uv_os_getenv(key, val.data(), &init_sz);
  }

  if (ret < 0) return false;
  text->assign(val.data(), init_sz);
  return true;
}

}  // namespace inwasm
