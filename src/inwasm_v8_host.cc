#include "inwasm_v8_host.h"
#include "debug_utils-inl.h"
#include "inwasm_errors.h"
#include "util.h"
#include "uv.h"

#include <vector>

namespace inwasm {

using node::CommonEnvironmentSetup;
using node::MultiIsolatePlatform;
using v8::Context;
using v8::HandleScope;
using v8::Isolate;
using v8::Local;
using v8::Locker;
using v8::NewStringType;
using v8::Object;
using v8::Script;
using v8::String;
using v8::TryCatch;
using v8::V8;
using v8::Value;

namespace {

constexpr char kArgv0[] = "inwasm";

std::unique_ptr<MultiIsolatePlatform> platform;

std::string JoinErrors(const std::vector<std::string>& errors) {
  std::string joined;
  for (const std::string& error : errors) {
    if (!joined.empty()) joined += "; ";
    joined += error;
  }
  return joined;
}

}  // anonymous namespace

std::string ToUtf8String(Isolate* isolate, Local<Value> value) {
  String::Utf8Value utf8(isolate, value);
  if (*utf8 == nullptr) return std::string();
  return std::string(*utf8, utf8.length());
}

EngineError ErrorFromException(Isolate* isolate,
                               Local<Context> context,
                               Local<Value> exception) {
  if (!exception->IsObject())
    return EngineError("Error", ToUtf8String(isolate, exception));

  // Accessors on the thrown object may throw themselves.
  TryCatch try_catch(isolate);
  Local<Object> object = exception.As<Object>();
  std::string name = "Error";
  std::string message;
  Local<Value> value;
  if (object->Get(context, OneByteString(isolate, "name")).ToLocal(&value) &&
      value->IsString()) {
    name = ToUtf8String(isolate, value);
  }
  if (object->Get(context, OneByteString(isolate, "message")).ToLocal(&value) &&
      value->IsString()) {
    message = ToUtf8String(isolate, value);
  }
  return EngineError(name, message);
}

EngineError ErrorFromTryCatch(Isolate* isolate,
                              Local<Context> context,
                              const TryCatch& try_catch) {
  if (try_catch.HasTerminated())
    return EngineError("Error", "Script execution was terminated");
  CHECK(try_catch.HasCaught());
  return ErrorFromException(isolate, context, try_catch.Exception());
}

void V8Host::InitializeProcess(const HostOptions& options) {
  CHECK(!IsProcessInitialized());

  std::vector<std::string> args = {kArgv0};
  std::unique_ptr<node::InitializationResult> result =
      node::InitializeOncePerProcess(
          args,
          {node::ProcessInitializationFlags::kNoInitializeV8,
           node::ProcessInitializationFlags::kNoInitializeNodeV8Platform,
           node::ProcessInitializationFlags::kDisableNodeOptionsEnv});
  for (const std::string& error : result->errors())
    per_process::Debug(DebugCategory::HOST, "initialization: %s\n", error);
  if (result->early_return()) {
    THROW_ERR_INWASM_HOST_INITIALIZATION_FAILED(
        "Node.js initialization failed with exit code %d: %s",
        result->exit_code(),
        JoinErrors(result->errors()));
  }

  if (!options.v8_flags.empty()) {
    V8::SetFlagsFromString(options.v8_flags.c_str(), options.v8_flags.size());
  }

  platform = MultiIsolatePlatform::Create(options.thread_pool_size);
  V8::InitializePlatform(platform.get());
  V8::Initialize();
  per_process::Debug(DebugCategory::HOST,
                     "process initialized with %d platform threads\n",
                     options.thread_pool_size);
}

void V8Host::TearDownProcess() {
  if (!IsProcessInitialized()) return;
  V8::Dispose();
  V8::DisposePlatform();
  node::TearDownOncePerProcess();
  platform.reset();
  per_process::Debug(DebugCategory::HOST, "process torn down\n");
}

bool V8Host::IsProcessInitialized() {
  return platform != nullptr;
}

std::unique_ptr<V8Host> V8Host::Create(const HostOptions& options) {
  CHECK(IsProcessInitialized());

  std::vector<std::string> errors;
  std::vector<std::string> args = {kArgv0};
  std::unique_ptr<CommonEnvironmentSetup> setup =
      CommonEnvironmentSetup::Create(
          platform.get(), &errors, args, options.exec_args);
  if (!setup) {
    THROW_ERR_INWASM_HOST_INITIALIZATION_FAILED(
        "Cannot create environment: %s", JoinErrors(errors));
  }

  {
    Isolate* isolate = setup->isolate();
    Locker locker(isolate);
    Isolate::Scope isolate_scope(isolate);
    HandleScope handle_scope(isolate);
    Context::Scope context_scope(setup->context());
    if (node::LoadEnvironment(setup->env(), "").IsEmpty()) {
      THROW_ERR_INWASM_HOST_INITIALIZATION_FAILED(
          "Cannot load environment");
    }
  }

  return std::unique_ptr<V8Host>(new V8Host(std::move(setup)));
}

V8Host::V8Host(std::unique_ptr<CommonEnvironmentSetup> setup)
    : setup_(std::move(setup)) {}

V8Host::~V8Host() {
  Isolate* isolate = setup_->isolate();
  {
    Locker locker(isolate);
    node::Stop(setup_->env());
  }
  setup_.reset();
}

Isolate* V8Host::isolate() const {
  return setup_->isolate();
}

Local<Context> V8Host::context() const {
  return setup_->context();
}

node::Environment* V8Host::env() const {
  return setup_->env();
}

std::string V8Host::RunScript(const std::string& source) {
  Isolate* isolate = setup_->isolate();
  Locker locker(isolate);
  Isolate::Scope isolate_scope(isolate);
  HandleScope handle_scope(isolate);
  Local<Context> context = setup_->context();
  Context::Scope context_scope(context);
  TryCatch try_catch(isolate);

  Local<String> code;
  Local<Script> script;
  Local<Value> result;
  if (!String::NewFromUtf8(
           isolate, source.data(), NewStringType::kNormal, source.size())
           .ToLocal(&code) ||
      !Script::Compile(context, code).ToLocal(&script) ||
      !script->Run(context).ToLocal(&result)) {
    throw ErrorFromTryCatch(isolate, context, try_catch);
  }
  return ToUtf8String(isolate, result);
}

void V8Host::RunUntilIdle() {
  Isolate* isolate = setup_->isolate();
  Locker locker(isolate);
  Isolate::Scope isolate_scope(isolate);
  HandleScope handle_scope(isolate);
  Context::Scope context_scope(setup_->context());

  uv_loop_t* loop = setup_->event_loop();
  do {
    uv_run(loop, UV_RUN_DEFAULT);
    platform->DrainTasks(isolate);
    isolate->PerformMicrotaskCheckpoint();
  } while (uv_loop_alive(loop));
}

}  // namespace inwasm
