#ifndef SRC_INWASM_ENGINE_H_
#define SRC_INWASM_ENGINE_H_

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace inwasm {

// Raw wasm bytes. Shared so a cached copy can be handed out without copying.
using WasmBytes = std::shared_ptr<const std::vector<uint8_t>>;

// Opaque handle of a compiled module owned by the engine.
class WasmModule {
 public:
  virtual ~WasmModule() = default;
};

// Opaque handle of an instantiated module owned by the engine.
class WasmInstance {
 public:
  virtual ~WasmInstance() = default;

  virtual std::vector<std::string> GetExportNames() const = 0;
};

// A value living in the host environment, e.g. the object passed to an
// instance under its import key.
class HostValue {
 public:
  virtual ~HostValue() = default;
};

using ModuleRef = std::shared_ptr<WasmModule>;
using InstanceRef = std::shared_ptr<WasmInstance>;

// The `{ [key]: value }` map passed to instantiation.
struct ImportObject {
  std::string key;
  std::shared_ptr<HostValue> value;
};

struct InstantiatedSource {
  ModuleRef module;
  InstanceRef instance;
};

// Error reported by the engine itself. `name()` is the engine's error class,
// e.g. "CompileError", "LinkError" or "RuntimeError".
class EngineError : public std::runtime_error {
 public:
  EngineError(const std::string& name, const std::string& message)
      : std::runtime_error(message), name_(name) {}

  const std::string& name() const { return name_; }

 private:
  std::string name_;
};

// The host WebAssembly implementation. Synchronous operations throw
// EngineError. Asynchronous operations invoke their callback exactly once,
// from the thread that pumps the engine, with either a result or an
// exception.
class WasmEngine {
 public:
  template <typename T>
  using Callback = std::function<void(T result, std::exception_ptr error)>;

  virtual ~WasmEngine() = default;

  // Returns the host value registered under `name`, or nullptr.
  virtual std::shared_ptr<HostValue> LookupEnvironment(
      const std::string& name) = 0;

  virtual bool Validate(const WasmBytes& bytes) = 0;

  virtual ModuleRef CompileSync(const WasmBytes& bytes) = 0;
  virtual void CompileAsync(const WasmBytes& bytes,
                            Callback<ModuleRef> callback) = 0;

  virtual InstanceRef InstantiateSync(
      const ModuleRef& module, const std::optional<ImportObject>& imports) = 0;
  virtual void InstantiateModuleAsync(
      const ModuleRef& module,
      const std::optional<ImportObject>& imports,
      Callback<InstanceRef> callback) = 0;
  // Compiles and instantiates in one step, reporting both results.
  virtual void InstantiateBytesAsync(
      const WasmBytes& bytes,
      const std::optional<ImportObject>& imports,
      Callback<InstantiatedSource> callback) = 0;
};

// Supplies the engine when an accessor runs. May return nullptr while no
// engine exists yet.
using EngineProvider = std::function<WasmEngine*()>;

}  // namespace inwasm

#endif  // SRC_INWASM_ENGINE_H_
