#include "inwasm_loader.h"
#include "inwasm_errors.h"
#include "inwasm_typed.h"

#include <algorithm>
#include <chrono>
#include <future>
#include <memory>
#include <type_traits>

#include "fake_engine.h"
#include "gtest/gtest.h"
#include "wasm_fixtures.h"

using inwasm::Accessor;
using inwasm::Artifact;
using inwasm::AuthoringDefinition;
using inwasm::CaptureContext;
using inwasm::CaptureMode;
using inwasm::CompiledDefinition;
using inwasm::EngineError;
using inwasm::InstanceRef;
using inwasm::Load;
using inwasm::ModuleRef;
using inwasm::OutputMode;
using inwasm::OutputType;
using inwasm::WasmBytes;

namespace {

template <typename T>
bool IsReady(const std::shared_future<T>& future) {
  return future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

AuthoringDefinition LogDefinition() {
  AuthoringDefinition definition;
  definition.name = "log";
  definition.type = OutputType::kInstance;
  definition.imports = "env";
  definition.source_kind = inwasm::SourceKind::kWat;
  definition.code = "(module (import \"env\" \"log\" (func (param i32))))";
  return definition;
}

class LoaderTest : public ::testing::Test {
 protected:
  Accessor MustLoad(const CompiledDefinition& definition) {
    std::optional<Accessor> accessor = Load(definition, &engine_);
    EXPECT_TRUE(accessor.has_value());
    return *accessor;
  }

  FakeEngine engine_;
};

}  // namespace

TEST_F(LoaderTest, AuthoringShapeWithoutCaptureSink) {
  try {
    Load(LogDefinition(), &engine_);
    FAIL() << "expected ERR_INWASM_MISSING_COMPILE_STEP";
  } catch (const inwasm::Error& e) {
    EXPECT_STREQ(e.code(), inwasm::kERR_INWASM_MISSING_COMPILE_STEP);
    EXPECT_NE(std::string(e.what()).find("\"log\""), std::string::npos);
  }
  EXPECT_EQ(engine_.total_calls(), 0);
}

TEST_F(LoaderTest, AuthoringShapeIsCaptured) {
  CaptureContext capture;
  EXPECT_THROW(Load(LogDefinition(), &engine_, &capture),
               inwasm::CaptureSignal);
  ASSERT_EQ(capture.size(), 1u);
  EXPECT_EQ(capture.definitions()[0].name, "log");

  CaptureContext collect(CaptureMode::kCollect);
  EXPECT_FALSE(Load(LogDefinition(), &engine_, &collect).has_value());
  EXPECT_EQ(collect.size(), 1u);
  EXPECT_EQ(engine_.total_calls(), 0);
}

TEST_F(LoaderTest, InvalidCompiledDefinition) {
  EXPECT_THROW(
      Load(CompiledDefinition{OutputType::kModule, true, ""}, &engine_),
      inwasm::TypeError);
}

TEST_F(LoaderTest, BytesSync) {
  std::optional<Accessor> accessor = Load(
      CompiledDefinition{OutputType::kBytes, true, kAddModuleBase64}, nullptr);
  ASSERT_TRUE(accessor.has_value());
  EXPECT_EQ(accessor->type(), OutputType::kBytes);
  EXPECT_EQ(accessor->mode(), OutputMode::kSync);
  EXPECT_FALSE(accessor->cache().bytes.has_value());

  Artifact first = (*accessor)();
  ASSERT_TRUE(std::holds_alternative<WasmBytes>(first));
  EXPECT_EQ(*std::get<WasmBytes>(first), kAddModule);

  // Decoded once, the same bytes every time.
  Artifact second = (*accessor)();
  EXPECT_EQ(std::get<WasmBytes>(first), std::get<WasmBytes>(second));
  EXPECT_TRUE(accessor->cache().bytes.has_value());
  EXPECT_FALSE(accessor->cache().module.has_value());
}

TEST_F(LoaderTest, ModuleAccessorBeforeEngineExists) {
  std::unique_ptr<FakeEngine> engine;
  std::optional<Accessor> accessor =
      Load(CompiledDefinition{OutputType::kModule, true, kAddModuleBase64},
           [&engine]() -> inwasm::WasmEngine* { return engine.get(); });
  ASSERT_TRUE(accessor.has_value());

  try {
    (*accessor)();
    FAIL() << "expected ERR_INWASM_NO_ENGINE";
  } catch (const inwasm::Error& e) {
    EXPECT_STREQ(e.code(), inwasm::kERR_INWASM_NO_ENGINE);
  }
  EXPECT_FALSE(accessor->cache().module.has_value());

  engine = std::make_unique<FakeEngine>();
  Artifact artifact = (*accessor)();
  ASSERT_TRUE(std::holds_alternative<ModuleRef>(artifact));
  EXPECT_EQ(engine->compile_sync_calls, 1);
  EXPECT_TRUE(accessor->cache().module.has_value());
}

TEST_F(LoaderTest, NullEngineOnlyFailsOnUse) {
  std::optional<Accessor> module = Load(
      CompiledDefinition{OutputType::kModule, false, kAddModuleBase64},
      nullptr);
  ASSERT_TRUE(module.has_value());
  EXPECT_THROW((*module)(), inwasm::Error);

  std::optional<Accessor> instance = Load(
      CompiledDefinition{OutputType::kInstance, true, kLogModuleBase64, "env"},
      nullptr);
  ASSERT_TRUE(instance.has_value());
  EXPECT_THROW((*instance)(), inwasm::Error);
  EXPECT_FALSE(instance->cache().bytes.has_value());
}

TEST_F(LoaderTest, BytesAsync) {
  Accessor accessor = MustLoad(
      CompiledDefinition{OutputType::kBytes, false, kAddModuleBase64});
  Artifact artifact = accessor();
  ASSERT_TRUE(
      std::holds_alternative<std::shared_future<WasmBytes>>(artifact));
  auto future = std::get<std::shared_future<WasmBytes>>(artifact);
  EXPECT_TRUE(IsReady(future));
  EXPECT_EQ(*future.get(), kAddModule);

  auto again = std::get<std::shared_future<WasmBytes>>(accessor());
  EXPECT_EQ(future.get(), again.get());
  EXPECT_EQ(engine_.total_calls(), 0);
}

TEST_F(LoaderTest, CopiesShareOneCache) {
  Accessor accessor = MustLoad(
      CompiledDefinition{OutputType::kBytes, true, kAddModuleBase64});
  Accessor copy = accessor;
  WasmBytes bytes = std::get<WasmBytes>(accessor());
  EXPECT_TRUE(copy.cache().bytes.has_value());
  EXPECT_EQ(std::get<WasmBytes>(copy()), bytes);

  // A second Load() of the same definition gets a cache of its own.
  Accessor other = MustLoad(
      CompiledDefinition{OutputType::kBytes, true, kAddModuleBase64});
  EXPECT_FALSE(other.cache().bytes.has_value());
  EXPECT_NE(std::get<WasmBytes>(other()), bytes);
}

TEST_F(LoaderTest, ModuleSyncCompilesOnce) {
  Accessor accessor = MustLoad(
      CompiledDefinition{OutputType::kModule, true, kAddModuleBase64});
  ModuleRef first = std::get<ModuleRef>(accessor());
  ModuleRef second = std::get<ModuleRef>(accessor());
  EXPECT_EQ(first, second);
  EXPECT_EQ(engine_.compile_sync_calls, 1);

  auto* module = dynamic_cast<FakeEngine::Module*>(first.get());
  ASSERT_NE(module, nullptr);
  EXPECT_EQ(*module->bytes, kAddModule);
}

TEST_F(LoaderTest, ModuleSyncFailureLeavesSlotEmpty) {
  Accessor accessor = MustLoad(
      CompiledDefinition{OutputType::kModule, true, kAddModuleBase64});
  engine_.fail_compile = true;
  try {
    accessor();
    FAIL() << "expected CompileError";
  } catch (const EngineError& e) {
    EXPECT_EQ(e.name(), "CompileError");
  }
  EXPECT_FALSE(accessor.cache().module.has_value());
  // Bytes are still decoded once.
  EXPECT_TRUE(accessor.cache().bytes.has_value());

  engine_.fail_compile = false;
  EXPECT_TRUE(std::get<ModuleRef>(accessor()));
  EXPECT_EQ(engine_.compile_sync_calls, 2);
}

TEST_F(LoaderTest, ModuleAsync) {
  Accessor accessor = MustLoad(
      CompiledDefinition{OutputType::kModule, false, kAddModuleBase64});
  auto future = std::get<std::shared_future<ModuleRef>>(accessor());
  EXPECT_FALSE(IsReady(future));
  EXPECT_FALSE(accessor.cache().module.has_value());

  EXPECT_EQ(engine_.RunPending(), 1u);
  ASSERT_TRUE(IsReady(future));
  ModuleRef module = future.get();
  EXPECT_EQ(accessor.cache().module.get(), module);

  // Served from the cache without another compile.
  auto cached = std::get<std::shared_future<ModuleRef>>(accessor());
  EXPECT_TRUE(IsReady(cached));
  EXPECT_EQ(cached.get(), module);
  EXPECT_EQ(engine_.compile_async_calls, 1);
  EXPECT_EQ(engine_.compile_sync_calls, 0);
}

// Both callers start a compile; the first result to arrive is cached.
TEST_F(LoaderTest, ConcurrentModuleAsyncCallsCompileIndependently) {
  Accessor accessor = MustLoad(
      CompiledDefinition{OutputType::kModule, false, kAddModuleBase64});
  auto first = std::get<std::shared_future<ModuleRef>>(accessor());
  auto second = std::get<std::shared_future<ModuleRef>>(accessor());
  EXPECT_EQ(engine_.compile_async_calls, 2);

  engine_.RunPending();
  ModuleRef first_module = first.get();
  ModuleRef second_module = second.get();
  EXPECT_NE(first_module, second_module);
  // The first completion owns the slot.
  EXPECT_EQ(accessor.cache().module.get(), first_module);

  auto* a = dynamic_cast<FakeEngine::Module*>(first_module.get());
  auto* b = dynamic_cast<FakeEngine::Module*>(second_module.get());
  ASSERT_NE(a, nullptr);
  ASSERT_NE(b, nullptr);
  EXPECT_EQ(*a->bytes, *b->bytes);
}

TEST_F(LoaderTest, ModuleAsyncFailure) {
  Accessor accessor = MustLoad(
      CompiledDefinition{OutputType::kModule, false, kAddModuleBase64});
  engine_.fail_compile = true;
  auto future = std::get<std::shared_future<ModuleRef>>(accessor());
  engine_.RunPending();
  EXPECT_THROW(future.get(), EngineError);
  EXPECT_FALSE(accessor.cache().module.has_value());

  engine_.fail_compile = false;
  auto retry = std::get<std::shared_future<ModuleRef>>(accessor());
  engine_.RunPending();
  EXPECT_TRUE(retry.get());
  EXPECT_TRUE(accessor.cache().module.has_value());
}

TEST_F(LoaderTest, InstanceSyncCreatesNewInstances) {
  Accessor accessor = MustLoad(
      CompiledDefinition{OutputType::kInstance, true, kAddModuleBase64});
  InstanceRef first = std::get<InstanceRef>(accessor());
  InstanceRef second = std::get<InstanceRef>(accessor());
  EXPECT_NE(first, second);
  EXPECT_EQ(engine_.compile_sync_calls, 1);
  EXPECT_EQ(engine_.instantiate_sync_calls, 2);
  // Only the first instance is kept.
  EXPECT_EQ(accessor.cache().instance.get(), first);

  auto* a = dynamic_cast<FakeEngine::Instance*>(first.get());
  auto* b = dynamic_cast<FakeEngine::Instance*>(second.get());
  ASSERT_NE(a, nullptr);
  ASSERT_NE(b, nullptr);
  EXPECT_EQ(a->module, b->module);
}

TEST_F(LoaderTest, ImportObjectAbsentWithoutKey) {
  engine_.SetEnvironment("env");
  Accessor accessor = MustLoad(
      CompiledDefinition{OutputType::kInstance, true, kAddModuleBase64});
  accessor();
  EXPECT_FALSE(engine_.last_imports.has_value());
  EXPECT_EQ(engine_.lookup_calls, 0);
}

TEST_F(LoaderTest, ImportObjectAbsentWithoutHostValue) {
  Accessor accessor = MustLoad(CompiledDefinition{
      OutputType::kInstance, true, kLogModuleBase64, "env"});
  accessor();
  EXPECT_EQ(engine_.lookup_calls, 1);
  EXPECT_FALSE(engine_.last_imports.has_value());
}

TEST_F(LoaderTest, ImportObjectResolvedOnEveryInstantiation) {
  Accessor accessor = MustLoad(CompiledDefinition{
      OutputType::kInstance, true, kLogModuleBase64, "env"});
  auto env = engine_.SetEnvironment("env");
  accessor();
  ASSERT_TRUE(engine_.last_imports.has_value());
  EXPECT_EQ(engine_.last_imports->key, "env");
  EXPECT_EQ(engine_.last_imports->value, env);

  auto replaced = engine_.SetEnvironment("env");
  accessor();
  EXPECT_EQ(engine_.last_imports->value, replaced);
  EXPECT_EQ(engine_.lookup_calls, 2);
}

TEST_F(LoaderTest, InstanceSyncLinkError) {
  Accessor accessor = MustLoad(CompiledDefinition{
      OutputType::kInstance, true, kLogModuleBase64, "env"});
  engine_.fail_instantiate = true;
  EXPECT_THROW(accessor(), EngineError);
  // The module compiled fine and stays cached.
  EXPECT_TRUE(accessor.cache().module.has_value());
  EXPECT_FALSE(accessor.cache().instance.has_value());
}

TEST_F(LoaderTest, InstanceAsyncFromBytesThenFromModule) {
  auto env = engine_.SetEnvironment("env");
  Accessor accessor = MustLoad(CompiledDefinition{
      OutputType::kInstance, false, kLogModuleBase64, "env"});

  auto first = std::get<std::shared_future<InstanceRef>>(accessor());
  EXPECT_EQ(engine_.instantiate_bytes_async_calls, 1);
  EXPECT_FALSE(IsReady(first));
  engine_.RunPending();
  InstanceRef instance = first.get();
  ASSERT_TRUE(instance);
  std::vector<std::string> exports = instance->GetExportNames();
  EXPECT_NE(std::find(exports.begin(), exports.end(), "memory"), exports.end());
  EXPECT_TRUE(accessor.cache().module.has_value());

  auto* fake = dynamic_cast<FakeEngine::Instance*>(instance.get());
  ASSERT_NE(fake, nullptr);
  ASSERT_TRUE(fake->imports.has_value());
  EXPECT_EQ(fake->imports->value, env);

  // The cached module is instantiated directly.
  auto second = std::get<std::shared_future<InstanceRef>>(accessor());
  EXPECT_EQ(engine_.instantiate_module_async_calls, 1);
  engine_.RunPending();
  InstanceRef other = second.get();
  EXPECT_NE(other, instance);
  EXPECT_EQ(dynamic_cast<FakeEngine::Instance*>(other.get())->module,
            accessor.cache().module.get());
  EXPECT_EQ(engine_.instantiate_bytes_async_calls, 1);
}

TEST_F(LoaderTest, InstanceAsyncCompilesAndInstantiatesInOneStep) {
  Accessor accessor = MustLoad(
      CompiledDefinition{OutputType::kInstance, false, kAddModuleBase64});
  auto future = std::get<std::shared_future<InstanceRef>>(accessor());
  engine_.RunPending();
  future.get();
  EXPECT_EQ(engine_.compile_sync_calls, 0);
  EXPECT_EQ(engine_.compile_async_calls, 0);
}

TEST_F(LoaderTest, InstanceAsyncFailure) {
  Accessor accessor = MustLoad(CompiledDefinition{
      OutputType::kInstance, false, kLogModuleBase64, "env"});
  engine_.fail_instantiate = true;
  auto future = std::get<std::shared_future<InstanceRef>>(accessor());
  engine_.RunPending();
  EXPECT_THROW(future.get(), EngineError);
  EXPECT_FALSE(accessor.cache().module.has_value());
  EXPECT_FALSE(accessor.cache().instance.has_value());
}

TEST_F(LoaderTest, TypedAccessor) {
  std::optional<inwasm::TypedAccessor<OutputType::kModule, OutputMode::kSync>>
      typed = inwasm::LoadTyped<OutputType::kModule, OutputMode::kSync>(
          CompiledDefinition{OutputType::kModule, true, kAddModuleBase64},
          &engine_);
  ASSERT_TRUE(typed.has_value());
  static_assert(std::is_same_v<decltype((*typed)()), ModuleRef>);
  EXPECT_TRUE((*typed)());

  using AsyncBytes =
      inwasm::TypedAccessor<OutputType::kBytes, OutputMode::kAsync>;
  static_assert(std::is_same_v<AsyncBytes::result_type,
                               std::shared_future<WasmBytes>>);
}

TEST_F(LoaderTest, TypedAccessorRejectsOtherTags) {
  EXPECT_THROW(
      (inwasm::LoadTyped<OutputType::kModule, OutputMode::kSync>(
          CompiledDefinition{OutputType::kModule, false, kAddModuleBase64},
          &engine_)),
      inwasm::TypeError);
  EXPECT_THROW(
      (inwasm::LoadTyped<OutputType::kBytes, OutputMode::kSync>(
          CompiledDefinition{OutputType::kModule, true, kAddModuleBase64},
          &engine_)),
      inwasm::TypeError);
}
