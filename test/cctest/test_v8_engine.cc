#include "inwasm_loader.h"
#include "inwasm_typed.h"
#include "inwasm_v8_engine.h"
#include "inwasm_v8_host.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <future>

#include "gtest/gtest.h"
#include "wasm_fixtures.h"

using inwasm::CompiledDefinition;
using inwasm::InstanceRef;
using inwasm::ModuleRef;
using inwasm::OutputMode;
using inwasm::OutputType;
using inwasm::V8Engine;
using inwasm::V8Host;

namespace {

class V8ProcessEnvironment : public ::testing::Environment {
 public:
  void SetUp() override {
    V8Host::InitializeProcess(inwasm::HostOptions::FromEnvironment());
  }
  void TearDown() override { V8Host::TearDownProcess(); }
};

::testing::Environment* const v8_process_environment =
    ::testing::AddGlobalTestEnvironment(new V8ProcessEnvironment());

template <typename T>
bool IsReady(const std::shared_future<T>& future) {
  return future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

bool HasExport(const InstanceRef& instance, const std::string& name) {
  std::vector<std::string> names = instance->GetExportNames();
  return std::find(names.begin(), names.end(), name) != names.end();
}

}  // namespace

class V8EngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(V8Host::IsProcessInitialized());
    host_ = V8Host::Create(inwasm::HostOptions());
    engine_ = std::make_unique<V8Engine>(host_.get());
  }

  void TearDown() override {
    engine_.reset();
    host_.reset();
  }

  std::unique_ptr<V8Host> host_;
  std::unique_ptr<V8Engine> engine_;
};

TEST_F(V8EngineTest, RunScript) {
  EXPECT_EQ(host_->RunScript("1 + 2"), "3");
  try {
    host_->RunScript("throw new RangeError('nope')");
    FAIL() << "expected EngineError";
  } catch (const inwasm::EngineError& e) {
    EXPECT_EQ(e.name(), "RangeError");
    EXPECT_STREQ(e.what(), "nope");
  }
}

TEST_F(V8EngineTest, Validate) {
  EXPECT_TRUE(engine_->Validate(
      std::make_shared<const std::vector<uint8_t>>(kAddModule)));
  EXPECT_FALSE(engine_->Validate(
      std::make_shared<const std::vector<uint8_t>>(std::vector<uint8_t>{
          0x00, 0x61, 0x73, 0x6d, 0x02, 0x00, 0x00, 0x00})));
}

TEST_F(V8EngineTest, CompileErrorIsReported) {
  auto bytes = std::make_shared<const std::vector<uint8_t>>(
      std::vector<uint8_t>{0x00, 0x61, 0x73, 0x6d, 0x01, 0x00, 0x00, 0x00,
                           0x01, 0xff});
  try {
    engine_->CompileSync(bytes);
    FAIL() << "expected EngineError";
  } catch (const inwasm::EngineError& e) {
    EXPECT_EQ(e.name(), "CompileError");
  }
}

TEST_F(V8EngineTest, ModuleSync) {
  std::optional<inwasm::Accessor> accessor = inwasm::Load(
      CompiledDefinition{OutputType::kModule, true, kAddModuleBase64},
      engine_.get());
  ASSERT_TRUE(accessor.has_value());
  ModuleRef first = std::get<ModuleRef>((*accessor)());
  ModuleRef second = std::get<ModuleRef>((*accessor)());
  EXPECT_EQ(first, second);

  InstanceRef instance = engine_->InstantiateSync(first, std::nullopt);
  EXPECT_EQ(engine_->CallExport(instance, "add", {2, 3}), 5);
}

TEST_F(V8EngineTest, InstanceSync) {
  auto accessor = inwasm::LoadTyped<OutputType::kInstance, OutputMode::kSync>(
      CompiledDefinition{OutputType::kInstance, true, kAddModuleBase64},
      engine_.get());
  ASSERT_TRUE(accessor.has_value());
  InstanceRef first = (*accessor)();
  InstanceRef second = (*accessor)();
  EXPECT_NE(first, second);
  EXPECT_TRUE(HasExport(first, "memory"));
  EXPECT_TRUE(HasExport(first, "add"));
  EXPECT_EQ(engine_->CallExport(second, "add", {40, 2}), 42);
}

TEST_F(V8EngineTest, MissingImportObjectIsATypeError) {
  std::optional<inwasm::Accessor> accessor = inwasm::Load(
      CompiledDefinition{OutputType::kInstance, true, kLogModuleBase64, "env"},
      engine_.get());
  ASSERT_TRUE(accessor.has_value());
  try {
    (*accessor)();
    FAIL() << "expected EngineError";
  } catch (const inwasm::EngineError& e) {
    EXPECT_EQ(e.name(), "TypeError");
  }
}

// An async instance with an import object taken from a global at call time.
TEST_F(V8EngineTest, InstanceAsyncWithImports) {
  host_->RunScript(
      "globalThis.env = { log: (x) => { globalThis.logged = x; } }");

  auto accessor = inwasm::LoadTyped<OutputType::kInstance, OutputMode::kAsync>(
      CompiledDefinition{OutputType::kInstance, false, kLogModuleBase64, "env"},
      engine_.get());
  ASSERT_TRUE(accessor.has_value());

  std::shared_future<InstanceRef> first = (*accessor)();
  EXPECT_GT(engine_->pending_operations(), 0u);
  engine_->RunUntilSettled();
  EXPECT_EQ(engine_->pending_operations(), 0u);
  ASSERT_TRUE(IsReady(first));

  InstanceRef instance = first.get();
  EXPECT_TRUE(HasExport(instance, "memory"));
  EXPECT_TRUE(HasExport(instance, "run"));
  EXPECT_TRUE(std::isnan(engine_->CallExport(instance, "run", {})));
  EXPECT_EQ(host_->RunScript("globalThis.logged"), "42");

  // The module is cached now; the second call only instantiates.
  EXPECT_TRUE(accessor->accessor().cache().module.has_value());
  std::shared_future<InstanceRef> second = (*accessor)();
  engine_->RunUntilSettled();
  ASSERT_TRUE(IsReady(second));
  EXPECT_NE(second.get(), instance);
}

TEST_F(V8EngineTest, ModuleAsyncFailure) {
  std::optional<inwasm::Accessor> accessor = inwasm::Load(
      CompiledDefinition{OutputType::kModule, false, "AGFzbQIAAAA="},
      engine_.get());
  ASSERT_TRUE(accessor.has_value());
  auto future = std::get<std::shared_future<ModuleRef>>((*accessor)());
  engine_->RunUntilSettled();
  ASSERT_TRUE(IsReady(future));
  EXPECT_THROW(future.get(), inwasm::EngineError);
  EXPECT_FALSE(accessor->cache().module.has_value());
}
