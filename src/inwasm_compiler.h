#ifndef SRC_INWASM_COMPILER_H_
#define SRC_INWASM_COMPILER_H_

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "inwasm_capture.h"
#include "inwasm_definition.h"
#include "inwasm_engine.h"

namespace inwasm {

// Turns the inline source of an authoring definition into raw wasm bytes.
// Implementations wrap an external toolchain and throw on failure.
class CompilerBackend {
 public:
  virtual ~CompilerBackend() = default;

  virtual std::vector<uint8_t> Compile(const AuthoringDefinition& definition,
                                       const std::string& build_dir) = 0;
};

class CompilerRegistry {
 public:
  // Replaces any backend previously registered for `kind`.
  void Register(SourceKind kind, std::shared_ptr<CompilerBackend> backend);
  // Returns nullptr when no backend handles `kind`.
  CompilerBackend* Get(SourceKind kind) const;

 private:
  std::map<SourceKind, std::shared_ptr<CompilerBackend>> backends_;
};

// Compiles one definition inside `build_root`/<name>, which is created if
// needed. The output must start with the wasm magic and version 1 and, when
// `validator` is given, pass its Validate().
CompiledDefinition CompileDefinition(const AuthoringDefinition& definition,
                                     const std::string& build_root,
                                     const CompilerRegistry& registry,
                                     WasmEngine* validator = nullptr);

// Compiles every captured definition, in capture order.
std::vector<CompiledDefinition> CompileCaptured(
    const CaptureContext& capture,
    const std::string& build_root,
    const CompilerRegistry& registry,
    WasmEngine* validator = nullptr);

// Returns the C++ initializer that replaces the authoring literal at the
// call site, e.g.
//   inwasm::CompiledDefinition{inwasm::OutputType::kBytes, true, "AGFzbQ..."}
std::string EmitCompiledDefinition(const CompiledDefinition& compiled);

}  // namespace inwasm

#endif  // SRC_INWASM_COMPILER_H_
