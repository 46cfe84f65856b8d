#ifndef SRC_INWASM_TYPED_H_
#define SRC_INWASM_TYPED_H_

#include <future>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include "inwasm_loader.h"

namespace inwasm {

template <OutputType type>
struct SyncArtifact;

template <>
struct SyncArtifact<OutputType::kBytes> {
  using type = WasmBytes;
};

template <>
struct SyncArtifact<OutputType::kModule> {
  using type = ModuleRef;
};

template <>
struct SyncArtifact<OutputType::kInstance> {
  using type = InstanceRef;
};

// Accessor whose result type is known at compile time, e.g.
// TypedAccessor<OutputType::kModule, OutputMode::kAsync> returns
// std::shared_future<ModuleRef>.
template <OutputType type, OutputMode mode>
class TypedAccessor {
 public:
  using result_type =
      std::conditional_t<mode == OutputMode::kSync,
                         typename SyncArtifact<type>::type,
                         std::shared_future<typename SyncArtifact<type>::type>>;

  explicit TypedAccessor(Accessor accessor) : accessor_(std::move(accessor)) {}

  result_type operator()() const {
    return std::get<result_type>(accessor_());
  }

  const Accessor& accessor() const { return accessor_; }

 private:
  Accessor accessor_;
};

// Like Load(), but a compiled definition must carry exactly `type` and
// `mode`, otherwise ERR_INWASM_INVALID_DEFINITION is thrown.
template <OutputType type, OutputMode mode>
std::optional<TypedAccessor<type, mode>> LoadTyped(
    const Definition& definition,
    WasmEngine* engine,
    CaptureSink* capture = nullptr) {
  if (const auto* compiled = std::get_if<CompiledDefinition>(&definition)) {
    CheckDefinitionTags(*compiled, type, mode);
  }
  std::optional<Accessor> accessor = Load(definition, engine, capture);
  if (!accessor.has_value()) return std::nullopt;
  return TypedAccessor<type, mode>(std::move(*accessor));
}

}  // namespace inwasm

#endif  // SRC_INWASM_TYPED_H_
