#include "inwasm_definition.h"
#include "debug_utils-inl.h"
#include "inwasm_errors.h"

namespace inwasm {

void ValidateDefinition(const AuthoringDefinition& definition) {
  if (definition.name.empty()) {
    THROW_ERR_INWASM_INVALID_DEFINITION(
        "WebAssembly definition must have a name");
  }
  if (definition.code.empty()) {
    THROW_ERR_INWASM_INVALID_DEFINITION(
        "WebAssembly definition \"%s\" has no source code", definition.name);
  }
  if (definition.source_kind == SourceKind::kCustom &&
      !definition.custom_runner) {
    THROW_ERR_INWASM_INVALID_DEFINITION(
        "WebAssembly definition \"%s\" uses source kind \"custom\" "
        "without a custom runner",
        definition.name);
  }
  if (definition.imports.has_value()) {
    if (definition.imports->empty()) {
      THROW_ERR_INWASM_INVALID_DEFINITION(
          "WebAssembly definition \"%s\" has an empty imports name",
          definition.name);
    }
    if (definition.type != OutputType::kInstance) {
      per_process::Debug(DebugCategory::DEFINITION,
                         "definition %s: imports \"%s\" ignored for %s\n",
                         definition.name,
                         *definition.imports,
                         OutputTypeName(definition.type));
    }
  }
}

void ValidateDefinition(const CompiledDefinition& definition) {
  switch (definition.t) {
    case OutputType::kInstance:
    case OutputType::kModule:
    case OutputType::kBytes:
      break;
    default:
      THROW_ERR_INWASM_INVALID_DEFINITION(
          "Compiled WebAssembly definition has unknown output type %u",
          static_cast<unsigned>(definition.t));
  }
  if (definition.d.empty()) {
    THROW_ERR_INWASM_INVALID_DEFINITION(
        "Compiled WebAssembly definition carries no data");
  }
  if (definition.e.has_value() && definition.e->empty()) {
    THROW_ERR_INWASM_INVALID_DEFINITION(
        "Compiled WebAssembly definition has an empty import key");
  }
}

const char* OutputTypeName(OutputType type) {
  switch (type) {
    case OutputType::kInstance:
      return "INSTANCE";
    case OutputType::kModule:
      return "MODULE";
    case OutputType::kBytes:
      return "BYTES";
  }
  return "UNKNOWN";
}

const char* OutputModeName(OutputMode mode) {
  switch (mode) {
    case OutputMode::kAsync:
      return "ASYNC";
    case OutputMode::kSync:
      return "SYNC";
  }
  return "UNKNOWN";
}

const char* SourceKindName(SourceKind kind) {
  switch (kind) {
#define V(kind, name)                                                          \
  case SourceKind::kind:                                                       \
    return name;
    INWASM_SOURCE_KINDS(V)
#undef V
  }
  return "unknown";
}

std::optional<SourceKind> ParseSourceKind(std::string_view name) {
#define V(kind, kind_name)                                                     \
  if (name == kind_name) return SourceKind::kind;
  INWASM_SOURCE_KINDS(V)
#undef V
  return std::nullopt;
}

}  // namespace inwasm
