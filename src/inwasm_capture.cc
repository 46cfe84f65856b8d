#include "inwasm_capture.h"
#include "debug_utils-inl.h"
#include "inwasm_errors.h"

#include <utility>

namespace inwasm {

void CaptureContext::Add(const AuthoringDefinition& definition) {
  ValidateDefinition(definition);
  if (!names_.insert(definition.name).second) {
    THROW_ERR_INWASM_DUPLICATE_DEFINITION(
        "WebAssembly definition \"%s\" was already captured",
        definition.name);
  }
  definitions_.push_back(definition);
  per_process::Debug(DebugCategory::CAPTURE,
                     "captured %s (%s %s, %s)\n",
                     definition.name,
                     OutputTypeName(definition.type),
                     OutputModeName(definition.mode),
                     SourceKindName(definition.source_kind));

  if (mode_ == CaptureMode::kRaise) throw CaptureSignal(definition.name);
}

std::vector<AuthoringDefinition> CaptureContext::TakeDefinitions() {
  std::vector<AuthoringDefinition> taken = std::move(definitions_);
  definitions_.clear();
  names_.clear();
  return taken;
}

}  // namespace inwasm
