#include "inwasm_loader.h"
#include "debug_utils-inl.h"
#include "inwasm_codec.h"
#include "inwasm_errors.h"
#include "util.h"

namespace inwasm {

struct Accessor::State {
  State(CompiledDefinition definition, EngineProvider provider)
      : definition(std::move(definition)), provider(std::move(provider)) {}

  // Throws ERR_INWASM_NO_ENGINE while the provider has nothing to give.
  WasmEngine* engine() const {
    WasmEngine* engine = provider ? provider() : nullptr;
    if (engine == nullptr) THROW_ERR_INWASM_NO_ENGINE();
    return engine;
  }

  const CompiledDefinition definition;
  const EngineProvider provider;
  LoaderCache cache;
};

namespace {

using StateRef = std::shared_ptr<Accessor::State>;

template <typename T>
std::shared_future<T> MakeReadyFuture(T value) {
  std::promise<T> promise;
  promise.set_value(std::move(value));
  return promise.get_future().share();
}

const WasmBytes& EnsureBytes(Accessor::State* state) {
  if (!state->cache.bytes.has_value()) {
    state->cache.bytes.TrySet(DecodeBase64(state->definition.d));
  }
  return state->cache.bytes.get();
}

const ModuleRef& EnsureModuleSync(Accessor::State* state) {
  if (!state->cache.module.has_value()) {
    per_process::Debug(DebugCategory::LOADER, "compiling module\n");
    // An EngineError leaves the slot empty.
    WasmEngine* engine = state->engine();
    state->cache.module.TrySet(engine->CompileSync(EnsureBytes(state)));
  }
  return state->cache.module.get();
}

// Resolved from the host on every instantiation.
std::optional<ImportObject> GetImportObject(Accessor::State* state) {
  const std::optional<std::string>& key = state->definition.e;
  if (!key.has_value()) return std::nullopt;
  return BuildImportObject(key, state->engine()->LookupEnvironment(*key));
}

std::shared_future<ModuleRef> CompileModuleAsync(const StateRef& state) {
  if (state->cache.module.has_value()) {
    return MakeReadyFuture(state->cache.module.get());
  }
  per_process::Debug(DebugCategory::LOADER,
                     "compiling module asynchronously\n");
  auto promise = std::make_shared<std::promise<ModuleRef>>();
  std::shared_future<ModuleRef> result = promise->get_future().share();
  state->engine()->CompileAsync(
      EnsureBytes(state.get()),
      [state, promise](ModuleRef module, std::exception_ptr error) {
        if (error) {
          promise->set_exception(error);
          return;
        }
        state->cache.module.TrySet(module);
        promise->set_value(std::move(module));
      });
  return result;
}

InstanceRef InstantiateSync(Accessor::State* state) {
  const ModuleRef& module = EnsureModuleSync(state);
  InstanceRef instance =
      state->engine()->InstantiateSync(module, GetImportObject(state));
  state->cache.instance.TrySet(instance);
  return instance;
}

std::shared_future<InstanceRef> InstantiateAsync(const StateRef& state) {
  auto promise = std::make_shared<std::promise<InstanceRef>>();
  std::shared_future<InstanceRef> result = promise->get_future().share();
  std::optional<ImportObject> imports = GetImportObject(state.get());

  if (state->cache.module.has_value()) {
    state->engine()->InstantiateModuleAsync(
        state->cache.module.get(),
        imports,
        [state, promise](InstanceRef instance, std::exception_ptr error) {
          if (error) {
            promise->set_exception(error);
            return;
          }
          state->cache.instance.TrySet(instance);
          promise->set_value(std::move(instance));
        });
    return result;
  }

  per_process::Debug(DebugCategory::LOADER,
                     "instantiating from bytes asynchronously\n");
  state->engine()->InstantiateBytesAsync(
      EnsureBytes(state.get()),
      imports,
      [state, promise](InstantiatedSource source, std::exception_ptr error) {
        if (error) {
          promise->set_exception(error);
          return;
        }
        state->cache.module.TrySet(source.module);
        state->cache.instance.TrySet(source.instance);
        promise->set_value(std::move(source.instance));
      });
  return result;
}

}  // anonymous namespace

Artifact Accessor::operator()() const {
  const bool sync = state_->definition.mode() == OutputMode::kSync;
  switch (state_->definition.t) {
    case OutputType::kBytes: {
      const WasmBytes& bytes = EnsureBytes(state_.get());
      if (sync) return bytes;
      return MakeReadyFuture(bytes);
    }
    case OutputType::kModule:
      if (sync) return EnsureModuleSync(state_.get());
      return CompileModuleAsync(state_);
    case OutputType::kInstance:
      if (sync) return InstantiateSync(state_.get());
      return InstantiateAsync(state_);
    default:
      UNREACHABLE();
  }
}

OutputType Accessor::type() const {
  return state_->definition.t;
}

OutputMode Accessor::mode() const {
  return state_->definition.mode();
}

const LoaderCache& Accessor::cache() const {
  return state_->cache;
}

std::optional<Accessor> Load(const Definition& definition,
                             EngineProvider engine,
                             CaptureSink* capture) {
  if (const auto* authoring = std::get_if<AuthoringDefinition>(&definition)) {
    if (capture == nullptr) {
      THROW_ERR_INWASM_MISSING_COMPILE_STEP(authoring->name);
    }
    capture->Add(*authoring);
    return std::nullopt;
  }

  const CompiledDefinition& compiled = std::get<CompiledDefinition>(definition);
  ValidateDefinition(compiled);
  per_process::Debug(DebugCategory::LOADER,
                     "new %s %s accessor over %u base64 characters\n",
                     OutputTypeName(compiled.t),
                     OutputModeName(compiled.mode()),
                     compiled.d.size());
  return Accessor(
      std::make_shared<Accessor::State>(compiled, std::move(engine)));
}

std::optional<Accessor> Load(const Definition& definition,
                             WasmEngine* engine,
                             CaptureSink* capture) {
  return Load(definition, [engine]() { return engine; }, capture);
}

void CheckDefinitionTags(const CompiledDefinition& definition,
                         OutputType type,
                         OutputMode mode) {
  if (definition.t != type || definition.mode() != mode) {
    THROW_ERR_INWASM_INVALID_DEFINITION(
        "Compiled WebAssembly definition is %s %s, expected %s %s",
        OutputTypeName(definition.t),
        OutputModeName(definition.mode()),
        OutputTypeName(type),
        OutputModeName(mode));
  }
}

}  // namespace inwasm
