#ifndef SRC_INWASM_V8_ENGINE_H_
#define SRC_INWASM_V8_ENGINE_H_

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "inwasm_engine.h"
#include "inwasm_v8_host.h"
#include "v8.h"

namespace inwasm {

class V8Module final : public WasmModule {
 public:
  V8Module(v8::Isolate* isolate, v8::Local<v8::WasmModuleObject> module)
      : module_(isolate, module) {}

  v8::Local<v8::WasmModuleObject> Get(v8::Isolate* isolate) const {
    return module_.Get(isolate);
  }

 private:
  v8::Global<v8::WasmModuleObject> module_;
};

// A `WebAssembly.Instance`.
class V8Instance final : public WasmInstance {
 public:
  V8Instance(V8Host* host, v8::Local<v8::Object> instance)
      : host_(host), instance_(host->isolate(), instance) {}

  std::vector<std::string> GetExportNames() const override;

  v8::Local<v8::Object> Get(v8::Isolate* isolate) const {
    return instance_.Get(isolate);
  }

 private:
  V8Host* host_;
  v8::Global<v8::Object> instance_;
};

class V8HostValue final : public HostValue {
 public:
  V8HostValue(v8::Isolate* isolate, v8::Local<v8::Value> value)
      : value_(isolate, value) {}

  v8::Local<v8::Value> Get(v8::Isolate* isolate) const {
    return value_.Get(isolate);
  }

 private:
  v8::Global<v8::Value> value_;
};

// WasmEngine backed by the `WebAssembly` namespace of a host's main context.
// Asynchronous results are delivered while the host's loop is pumped, see
// V8Host::RunUntilIdle() and RunUntilSettled().
class V8Engine final : public WasmEngine {
 public:
  explicit V8Engine(V8Host* host);
  ~V8Engine() override;

  V8Engine(const V8Engine&) = delete;
  V8Engine& operator=(const V8Engine&) = delete;

  // Reads the global property `name`. undefined and null map to nullptr.
  std::shared_ptr<HostValue> LookupEnvironment(
      const std::string& name) override;

  bool Validate(const WasmBytes& bytes) override;

  ModuleRef CompileSync(const WasmBytes& bytes) override;
  void CompileAsync(const WasmBytes& bytes,
                    Callback<ModuleRef> callback) override;

  InstanceRef InstantiateSync(
      const ModuleRef& module,
      const std::optional<ImportObject>& imports) override;
  void InstantiateModuleAsync(const ModuleRef& module,
                              const std::optional<ImportObject>& imports,
                              Callback<InstanceRef> callback) override;
  void InstantiateBytesAsync(const WasmBytes& bytes,
                             const std::optional<ImportObject>& imports,
                             Callback<InstantiatedSource> callback) override;

  // Calls the exported function `name` with numeric arguments. Returns NaN
  // when the function returns nothing.
  double CallExport(const InstanceRef& instance,
                    const std::string& name,
                    const std::vector<double>& args);

  // Pumps the host until every asynchronous operation has been reported.
  void RunUntilSettled();
  size_t pending_operations() const { return pending_.size(); }

  V8Host* host() const { return host_; }

 private:
  struct PendingOperation;
  using Settle =
      std::function<void(v8::Local<v8::Value> value, std::exception_ptr)>;

  // Calls the `WebAssembly` member `name` with `args` and reports the
  // settlement of the returned promise to `settle`.
  void CallAsync(const char* name,
                 std::vector<v8::Local<v8::Value>> args,
                 Settle settle);
  static void OnFulfilled(const v8::FunctionCallbackInfo<v8::Value>& info);
  static void OnRejected(const v8::FunctionCallbackInfo<v8::Value>& info);
  void Finish(PendingOperation* operation,
              v8::Local<v8::Value> value,
              std::exception_ptr error);

  V8Host* host_;
  std::unordered_map<PendingOperation*, std::unique_ptr<PendingOperation>>
      pending_;
};

}  // namespace inwasm

#endif  // SRC_INWASM_V8_ENGINE_H_
