#ifndef SRC_INWASM_OPTIONS_H_
#define SRC_INWASM_OPTIONS_H_

#include <string>
#include <vector>

namespace inwasm {

struct HostOptions {
  static constexpr int kDefaultThreadPoolSize = 4;

  // Worker threads of the V8 platform.
  int thread_pool_size = kDefaultThreadPoolSize;
  // Passed to v8::V8::SetFlagsFromString() before V8 is initialized.
  std::string v8_flags;
  // Execution arguments of the embedded environment.
  std::vector<std::string> exec_args;

  // Reads INWASM_THREAD_POOL_SIZE and INWASM_V8_FLAGS. Malformed values are
  // ignored.
  static HostOptions FromEnvironment();
};

}  // namespace inwasm

#endif  // SRC_INWASM_OPTIONS_H_
