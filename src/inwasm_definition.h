#ifndef SRC_INWASM_DEFINITION_H_
#define SRC_INWASM_DEFINITION_H_

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace inwasm {

// Determines whether an accessor provides bytes, a module or an instance.
// The numeric values are the `t` tags written into compiled definitions.
enum class OutputType : uint8_t {
  kInstance = 0,
  kModule = 1,
  kBytes = 2
};

// Whether an accessor returns its artifact directly or as a future.
// Synchronous compilation is only reliable on hosts that allow it for
// arbitrary module sizes.
enum class OutputMode : uint8_t {
  kAsync = 0,
  kSync = 1
};

#define INWASM_SOURCE_KINDS(V)                                                 \
  V(kC, "C")                                                                   \
  V(kCpp, "C++")                                                               \
  V(kClangC, "Clang-C")                                                        \
  V(kClangCpp, "Clang-C++")                                                    \
  V(kZig, "Zig")                                                               \
  V(kWat, "wat")                                                               \
  V(kCustom, "custom")                                                         \
  V(kRust, "Rust")

// Compiler backend selected for the inline source. kZig builds freestanding
// modules without a libc.
enum class SourceKind : uint8_t {
#define V(kind, name) kind,
  INWASM_SOURCE_KINDS(V)
#undef V
};

enum class ExportKind : uint8_t {
  kFunction,
  kGlobal
};

// Expected shape of one export. `signature` is free text in the form
// "i32(i32,i32)" for functions or "mut i32" for globals. It is checked
// statically by tooling only, never at run time.
struct ExportShape {
  ExportKind kind = ExportKind::kFunction;
  std::string signature;
};

struct CompileOptions {
  // Passed to the compiler as -D<name>=<value>.
  std::map<std::string, std::string> defines;
  // Additional include paths, should be absolute.
  std::vector<std::string> include;
  // Additional source files copied into the build directory.
  std::vector<std::string> sources;
  // Raw compiler switches, applied after everything above.
  std::vector<std::string> switches;

  void Define(const std::string& name, const std::string& value) {
    defines[name] = value;
  }
  void Define(const std::string& name, int64_t value) {
    defines[name] = std::to_string(value);
  }
};

struct AuthoringDefinition;

// Produces the raw wasm bytes of `definition`. `build_dir` is a scratch
// directory owned by the current build.
using CustomRunner = std::function<std::vector<uint8_t>(
    const AuthoringDefinition& definition, const std::string& build_dir)>;

// Pre-compilation shape: carries inline source and compiler settings.
struct AuthoringDefinition {
  // Name of the wasm target, unique within a build.
  std::string name;
  OutputType type = OutputType::kInstance;
  OutputMode mode = OutputMode::kAsync;
  std::map<std::string, ExportShape> exports;
  // Name of the environment object exposed to the instance. Only used for
  // OutputType::kInstance.
  std::optional<std::string> imports;
  SourceKind source_kind = SourceKind::kC;
  std::string code;
  CompileOptions compile;
  // Required for SourceKind::kCustom, ignored otherwise.
  CustomRunner custom_runner;
};

// Post-compilation shape. The field names are kept as short as the
// generated call sites that carry them.
struct CompiledDefinition {
  OutputType t = OutputType::kInstance;
  // true for OutputMode::kSync.
  bool s = false;
  // Base64 of the raw wasm bytes.
  std::string d;
  // Key of the import object, e.g. "env".
  std::optional<std::string> e;

  OutputMode mode() const { return s ? OutputMode::kSync : OutputMode::kAsync; }
};

using Definition = std::variant<AuthoringDefinition, CompiledDefinition>;

// Shape detection is structural: only the compiled shape carries encoded
// data.
inline bool IsCompiled(const Definition& definition) {
  return std::holds_alternative<CompiledDefinition>(definition);
}

// Both throw ERR_INWASM_INVALID_DEFINITION.
void ValidateDefinition(const AuthoringDefinition& definition);
void ValidateDefinition(const CompiledDefinition& definition);

const char* OutputTypeName(OutputType type);
const char* OutputModeName(OutputMode mode);
const char* SourceKindName(SourceKind kind);
std::optional<SourceKind> ParseSourceKind(std::string_view name);

}  // namespace inwasm

#endif  // SRC_INWASM_DEFINITION_H_
