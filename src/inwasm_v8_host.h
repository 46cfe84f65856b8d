#ifndef SRC_INWASM_V8_HOST_H_
#define SRC_INWASM_V8_HOST_H_

#include <memory>
#include <string>

#include "inwasm_engine.h"
#include "inwasm_options.h"
#include "node.h"
#include "v8.h"

namespace inwasm {

// One embedded Node.js environment with its own isolate, context and event
// loop. The process must be initialized first and torn down after the last
// host is gone:
//
//   V8Host::InitializeProcess(options);
//   {
//     std::unique_ptr<V8Host> host = V8Host::Create(options);
//     ...
//   }
//   V8Host::TearDownProcess();
class V8Host {
 public:
  // Both throw ERR_INWASM_HOST_INITIALIZATION_FAILED.
  static void InitializeProcess(const HostOptions& options);
  static std::unique_ptr<V8Host> Create(const HostOptions& options);

  static void TearDownProcess();
  static bool IsProcessInitialized();

  ~V8Host();
  V8Host(const V8Host&) = delete;
  V8Host& operator=(const V8Host&) = delete;

  v8::Isolate* isolate() const;
  // Requires an active HandleScope.
  v8::Local<v8::Context> context() const;
  node::Environment* env() const;

  // Runs `source` in the main context and returns its completion value as a
  // string. A JS exception is thrown as EngineError.
  std::string RunScript(const std::string& source);

  // Runs the event loop, platform tasks and microtasks until none are left.
  // Async engine callbacks are delivered from here.
  void RunUntilIdle();

 private:
  explicit V8Host(std::unique_ptr<node::CommonEnvironmentSetup> setup);

  std::unique_ptr<node::CommonEnvironmentSetup> setup_;
};

}  // namespace inwasm

#if defined(INWASM_WANT_INTERNALS) && INWASM_WANT_INTERNALS

namespace inwasm {

inline v8::Local<v8::String> OneByteString(v8::Isolate* isolate,
                                           const char* data) {
  return v8::String::NewFromOneByte(isolate,
                                    reinterpret_cast<const uint8_t*>(data),
                                    v8::NewStringType::kInternalized)
      .ToLocalChecked();
}

std::string ToUtf8String(v8::Isolate* isolate, v8::Local<v8::Value> value);

// Reads `name` and `message` of a thrown JS value.
EngineError ErrorFromException(v8::Isolate* isolate,
                               v8::Local<v8::Context> context,
                               v8::Local<v8::Value> exception);
EngineError ErrorFromTryCatch(v8::Isolate* isolate,
                              v8::Local<v8::Context> context,
                              const v8::TryCatch& try_catch);

}  // namespace inwasm

#endif  // defined(INWASM_WANT_INTERNALS) && INWASM_WANT_INTERNALS

#endif  // SRC_INWASM_V8_HOST_H_
