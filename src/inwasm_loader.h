#ifndef SRC_INWASM_LOADER_H_
#define SRC_INWASM_LOADER_H_

#include <future>
#include <memory>
#include <optional>
#include <utility>
#include <variant>

#include "inwasm_capture.h"
#include "inwasm_definition.h"
#include "inwasm_engine.h"

namespace inwasm {

// Single-initialization slot. The first write wins and later writes are
// dropped. Not thread-safe; accessors are used from one thread.
template <typename T>
class OnceCell {
 public:
  bool has_value() const { return value_.has_value(); }
  const T& get() const { return *value_; }

  // Returns the stored value, which is `value` only if the cell was empty.
  const T& TrySet(T value) {
    if (!value_.has_value()) value_ = std::move(value);
    return *value_;
  }

 private:
  std::optional<T> value_;
};

// Per-accessor artifacts. `instance` keeps the first instance created and is
// only there for introspection; instance accessors hand out a new instance
// on every call.
struct LoaderCache {
  OnceCell<WasmBytes> bytes;
  OnceCell<ModuleRef> module;
  OnceCell<InstanceRef> instance;
};

// Result of one accessor call. The alternative is fixed by the definition's
// output type and mode.
using Artifact = std::variant<WasmBytes,
                              ModuleRef,
                              InstanceRef,
                              std::shared_future<WasmBytes>,
                              std::shared_future<ModuleRef>,
                              std::shared_future<InstanceRef>>;

// Zero-argument callable returned by Load(). Copies share one cache.
class Accessor {
 public:
  Artifact operator()() const;

  OutputType type() const;
  OutputMode mode() const;
  const LoaderCache& cache() const;

  // Definition, engine and cache shared by all copies.
  struct State;

 private:
  explicit Accessor(std::shared_ptr<State> state) : state_(std::move(state)) {}

  std::shared_ptr<State> state_;

  friend std::optional<Accessor> Load(const Definition& definition,
                                      EngineProvider engine,
                                      CaptureSink* capture);
};

// Compiled shape: validates and returns an accessor. The engine is resolved
// each time a module or instance accessor runs, so it may not exist yet when
// Load() is called; a missing engine then throws ERR_INWASM_NO_ENGINE from
// the accessor. Byte accessors never touch the engine.
// Authoring shape: hands the definition to `capture` and returns nothing, or
// throws ERR_INWASM_MISSING_COMPILE_STEP when there is no capture sink.
std::optional<Accessor> Load(const Definition& definition,
                             EngineProvider engine,
                             CaptureSink* capture = nullptr);

// Same, with an engine that is fixed up front. `engine` may be null.
std::optional<Accessor> Load(const Definition& definition,
                             WasmEngine* engine,
                             CaptureSink* capture = nullptr);

// Throws ERR_INWASM_INVALID_DEFINITION unless `definition` has the given tags.
void CheckDefinitionTags(const CompiledDefinition& definition,
                         OutputType type,
                         OutputMode mode);

}  // namespace inwasm

#endif  // SRC_INWASM_LOADER_H_
