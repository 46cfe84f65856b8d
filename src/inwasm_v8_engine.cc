#include "inwasm_v8_engine.h"
#include "debug_utils-inl.h"
#include "util.h"

#include <cmath>
#include <cstring>
#include <limits>
#include <utility>

namespace inwasm {

using v8::Array;
using v8::ArrayBuffer;
using v8::BackingStore;
using v8::Context;
using v8::External;
using v8::Function;
using v8::FunctionCallbackInfo;
using v8::HandleScope;
using v8::Isolate;
using v8::Local;
using v8::Locker;
using v8::MaybeLocal;
using v8::MemorySpan;
using v8::Number;
using v8::Object;
using v8::Promise;
using v8::String;
using v8::TryCatch;
using v8::Uint8Array;
using v8::Undefined;
using v8::Value;
using v8::WasmModuleObject;

struct V8Engine::PendingOperation {
  V8Engine* engine;
  Settle settle;
};

namespace {

// Enters the host's isolate and main context for the lifetime of the object.
class HostScope {
 public:
  explicit HostScope(V8Host* host)
      : isolate_(host->isolate()),
        locker_(isolate_),
        isolate_scope_(isolate_),
        handle_scope_(isolate_),
        context_(host->context()),
        context_scope_(context_) {}

  Isolate* isolate() const { return isolate_; }
  Local<Context> context() const { return context_; }

 private:
  Isolate* isolate_;
  Locker locker_;
  Isolate::Scope isolate_scope_;
  HandleScope handle_scope_;
  Local<Context> context_;
  Context::Scope context_scope_;
};

MaybeLocal<Function> GetWebAssemblyFunction(Isolate* isolate,
                                            Local<Context> context,
                                            const char* name) {
  Local<Value> web_assembly;
  Local<Value> member;
  if (!context->Global()
           ->Get(context, OneByteString(isolate, "WebAssembly"))
           .ToLocal(&web_assembly) ||
      !web_assembly->IsObject() ||
      !web_assembly.As<Object>()
           ->Get(context, OneByteString(isolate, name))
           .ToLocal(&member) ||
      !member->IsFunction()) {
    return MaybeLocal<Function>();
  }
  return member.As<Function>();
}

Local<Uint8Array> NewUint8Array(Isolate* isolate, const WasmBytes& bytes) {
  std::shared_ptr<BackingStore> store =
      ArrayBuffer::NewBackingStore(isolate, bytes->size());
  if (!bytes->empty()) memcpy(store->Data(), bytes->data(), bytes->size());
  Local<ArrayBuffer> buffer = ArrayBuffer::New(isolate, std::move(store));
  return Uint8Array::New(buffer, 0, bytes->size());
}

Local<WasmModuleObject> GetModule(Isolate* isolate, const ModuleRef& module) {
  auto* v8_module = dynamic_cast<const V8Module*>(module.get());
  CHECK_NOT_NULL(v8_module);
  return v8_module->Get(isolate);
}

// Returns undefined when there is nothing to import.
MaybeLocal<Value> NewImportObject(Isolate* isolate,
                                  Local<Context> context,
                                  const std::optional<ImportObject>& imports) {
  if (!imports.has_value()) return Undefined(isolate);
  auto* value = dynamic_cast<const V8HostValue*>(imports->value.get());
  CHECK_NOT_NULL(value);
  Local<Object> object = Object::New(isolate);
  Local<String> key;
  if (!String::NewFromUtf8(isolate,
                           imports->key.data(),
                           v8::NewStringType::kNormal,
                           imports->key.size())
           .ToLocal(&key) ||
      object->Set(context, key, value->Get(isolate)).IsNothing()) {
    return MaybeLocal<Value>();
  }
  return object;
}

EngineError UnexpectedResult(const char* operation) {
  return EngineError("TypeError",
                     SPrintF("WebAssembly.%s resolved to an unexpected value",
                             operation));
}

}  // anonymous namespace

std::vector<std::string> V8Instance::GetExportNames() const {
  HostScope scope(host_);
  Isolate* isolate = scope.isolate();
  Local<Context> context = scope.context();
  TryCatch try_catch(isolate);

  std::vector<std::string> names;
  Local<Value> exports;
  Local<Array> keys;
  if (!Get(isolate)
           ->Get(context, OneByteString(isolate, "exports"))
           .ToLocal(&exports) ||
      !exports->IsObject() ||
      !exports.As<Object>()->GetOwnPropertyNames(context).ToLocal(&keys)) {
    return names;
  }
  for (uint32_t i = 0; i < keys->Length(); i++) {
    Local<Value> key;
    if (!keys->Get(context, i).ToLocal(&key)) break;
    names.push_back(ToUtf8String(isolate, key));
  }
  return names;
}

V8Engine::V8Engine(V8Host* host) : host_(host) {
  CHECK_NOT_NULL(host);
}

V8Engine::~V8Engine() {
  // Promise reactions still point at the pending operations.
  RunUntilSettled();
}

std::shared_ptr<HostValue> V8Engine::LookupEnvironment(
    const std::string& name) {
  HostScope scope(host_);
  Isolate* isolate = scope.isolate();
  Local<Context> context = scope.context();
  TryCatch try_catch(isolate);

  Local<String> key;
  Local<Value> value;
  if (!String::NewFromUtf8(
           isolate, name.data(), v8::NewStringType::kNormal, name.size())
           .ToLocal(&key) ||
      !context->Global()->Get(context, key).ToLocal(&value)) {
    throw ErrorFromTryCatch(isolate, context, try_catch);
  }
  if (value->IsNullOrUndefined()) {
    per_process::Debug(DebugCategory::ENGINE,
                       "no global named %s in the host\n",
                       name);
    return nullptr;
  }
  return std::make_shared<V8HostValue>(isolate, value);
}

bool V8Engine::Validate(const WasmBytes& bytes) {
  HostScope scope(host_);
  Isolate* isolate = scope.isolate();
  Local<Context> context = scope.context();
  TryCatch try_catch(isolate);

  Local<Function> validate;
  Local<Value> argv[] = {NewUint8Array(isolate, bytes)};
  Local<Value> result;
  if (!GetWebAssemblyFunction(isolate, context, "validate")
           .ToLocal(&validate) ||
      !validate->Call(context, Undefined(isolate), arraysize(argv), argv)
           .ToLocal(&result)) {
    if (!try_catch.HasCaught())
      throw EngineError("TypeError", "WebAssembly.validate is not available");
    throw ErrorFromTryCatch(isolate, context, try_catch);
  }
  return result->BooleanValue(isolate);
}

ModuleRef V8Engine::CompileSync(const WasmBytes& bytes) {
  HostScope scope(host_);
  Isolate* isolate = scope.isolate();
  TryCatch try_catch(isolate);

  Local<WasmModuleObject> module;
  if (!WasmModuleObject::Compile(
           isolate, MemorySpan<const uint8_t>(bytes->data(), bytes->size()))
           .ToLocal(&module)) {
    throw ErrorFromTryCatch(isolate, scope.context(), try_catch);
  }
  per_process::Debug(DebugCategory::ENGINE,
                     "compiled %u bytes synchronously\n",
                     bytes->size());
  return std::make_shared<V8Module>(isolate, module);
}

void V8Engine::CompileAsync(const WasmBytes& bytes,
                            Callback<ModuleRef> callback) {
  HostScope scope(host_);
  Isolate* isolate = scope.isolate();
  CallAsync(
      "compile",
      {NewUint8Array(isolate, bytes)},
      [isolate, callback](Local<Value> value, std::exception_ptr error) {
        if (error) return callback(nullptr, error);
        if (!value->IsWasmModuleObject())
          return callback(nullptr,
                          std::make_exception_ptr(UnexpectedResult("compile")));
        callback(std::make_shared<V8Module>(isolate,
                                            value.As<WasmModuleObject>()),
                 nullptr);
      });
}

InstanceRef V8Engine::InstantiateSync(
    const ModuleRef& module, const std::optional<ImportObject>& imports) {
  HostScope scope(host_);
  Isolate* isolate = scope.isolate();
  Local<Context> context = scope.context();
  TryCatch try_catch(isolate);

  Local<Function> constructor;
  Local<Value> import_object;
  if (!GetWebAssemblyFunction(isolate, context, "Instance")
           .ToLocal(&constructor) ||
      !NewImportObject(isolate, context, imports).ToLocal(&import_object)) {
    if (!try_catch.HasCaught())
      throw EngineError("TypeError", "WebAssembly.Instance is not available");
    throw ErrorFromTryCatch(isolate, context, try_catch);
  }

  Local<Value> argv[] = {GetModule(isolate, module), import_object};
  Local<Object> instance;
  if (!constructor->NewInstance(context, arraysize(argv), argv)
           .ToLocal(&instance)) {
    throw ErrorFromTryCatch(isolate, context, try_catch);
  }
  return std::make_shared<V8Instance>(host_, instance);
}

void V8Engine::InstantiateModuleAsync(
    const ModuleRef& module,
    const std::optional<ImportObject>& imports,
    Callback<InstanceRef> callback) {
  HostScope scope(host_);
  Isolate* isolate = scope.isolate();
  Local<Context> context = scope.context();
  V8Host* host = host_;

  Local<Value> import_object;
  {
    TryCatch try_catch(isolate);
    if (!NewImportObject(isolate, context, imports).ToLocal(&import_object)) {
      return callback(nullptr,
                      std::make_exception_ptr(
                          ErrorFromTryCatch(isolate, context, try_catch)));
    }
  }
  CallAsync(
      "instantiate",
      {GetModule(isolate, module), import_object},
      [host, callback](Local<Value> value, std::exception_ptr error) {
        if (error) return callback(nullptr, error);
        if (!value->IsObject())
          return callback(
              nullptr,
              std::make_exception_ptr(UnexpectedResult("instantiate")));
        callback(std::make_shared<V8Instance>(host, value.As<Object>()),
                 nullptr);
      });
}

void V8Engine::InstantiateBytesAsync(
    const WasmBytes& bytes,
    const std::optional<ImportObject>& imports,
    Callback<InstantiatedSource> callback) {
  HostScope scope(host_);
  Isolate* isolate = scope.isolate();
  Local<Context> context = scope.context();
  V8Host* host = host_;

  Local<Value> import_object;
  {
    TryCatch try_catch(isolate);
    if (!NewImportObject(isolate, context, imports).ToLocal(&import_object)) {
      return callback(InstantiatedSource{},
                      std::make_exception_ptr(
                          ErrorFromTryCatch(isolate, context, try_catch)));
    }
  }
  CallAsync(
      "instantiate",
      {NewUint8Array(isolate, bytes), import_object},
      [host, callback](Local<Value> value, std::exception_ptr error) {
        if (error) return callback(InstantiatedSource{}, error);
        Isolate* isolate = host->isolate();
        Local<Context> context = isolate->GetCurrentContext();
        Local<Value> module;
        Local<Value> instance;
        if (!value->IsObject() ||
            !value.As<Object>()
                 ->Get(context, OneByteString(isolate, "module"))
                 .ToLocal(&module) ||
            !value.As<Object>()
                 ->Get(context, OneByteString(isolate, "instance"))
                 .ToLocal(&instance) ||
            !module->IsWasmModuleObject() || !instance->IsObject()) {
          return callback(
              InstantiatedSource{},
              std::make_exception_ptr(UnexpectedResult("instantiate")));
        }
        InstantiatedSource source;
        source.module =
            std::make_shared<V8Module>(isolate, module.As<WasmModuleObject>());
        source.instance =
            std::make_shared<V8Instance>(host, instance.As<Object>());
        callback(std::move(source), nullptr);
      });
}

double V8Engine::CallExport(const InstanceRef& instance,
                            const std::string& name,
                            const std::vector<double>& args) {
  auto* v8_instance = dynamic_cast<const V8Instance*>(instance.get());
  CHECK_NOT_NULL(v8_instance);

  HostScope scope(host_);
  Isolate* isolate = scope.isolate();
  Local<Context> context = scope.context();
  TryCatch try_catch(isolate);

  Local<Value> exports;
  Local<Value> function;
  Local<String> key;
  if (!v8_instance->Get(isolate)
           ->Get(context, OneByteString(isolate, "exports"))
           .ToLocal(&exports) ||
      !exports->IsObject() ||
      !String::NewFromUtf8(
           isolate, name.data(), v8::NewStringType::kNormal, name.size())
           .ToLocal(&key) ||
      !exports.As<Object>()->Get(context, key).ToLocal(&function)) {
    throw ErrorFromTryCatch(isolate, context, try_catch);
  }
  if (!function->IsFunction()) {
    throw EngineError("TypeError",
                      SPrintF("export %s is not a function", name));
  }

  std::vector<Local<Value>> argv;
  argv.reserve(args.size());
  for (double arg : args) argv.push_back(Number::New(isolate, arg));
  Local<Value> result;
  if (!function.As<Function>()
           ->Call(context, Undefined(isolate), argv.size(), argv.data())
           .ToLocal(&result)) {
    throw ErrorFromTryCatch(isolate, context, try_catch);
  }
  if (result->IsUndefined()) return std::numeric_limits<double>::quiet_NaN();
  return result->NumberValue(context).FromMaybe(
      std::numeric_limits<double>::quiet_NaN());
}

void V8Engine::RunUntilSettled() {
  while (!pending_.empty()) host_->RunUntilIdle();
}

void V8Engine::CallAsync(const char* name,
                         std::vector<Local<Value>> args,
                         Settle settle) {
  Isolate* isolate = host_->isolate();
  Local<Context> context = host_->context();
  TryCatch try_catch(isolate);

  Local<Function> function;
  Local<Value> result;
  if (!GetWebAssemblyFunction(isolate, context, name).ToLocal(&function) ||
      !function->Call(context, Undefined(isolate), args.size(), args.data())
           .ToLocal(&result) ||
      !result->IsPromise()) {
    EngineError error =
        try_catch.HasCaught()
            ? ErrorFromTryCatch(isolate, context, try_catch)
            : EngineError("TypeError",
                          SPrintF("WebAssembly.%s did not return a promise",
                                  name));
    settle(Local<Value>(), std::make_exception_ptr(error));
    return;
  }

  auto operation = std::make_unique<PendingOperation>();
  operation->engine = this;
  operation->settle = std::move(settle);
  Local<External> data = External::New(isolate, operation.get());

  Local<Function> on_fulfilled;
  Local<Function> on_rejected;
  if (!Function::New(context, OnFulfilled, data).ToLocal(&on_fulfilled) ||
      !Function::New(context, OnRejected, data).ToLocal(&on_rejected) ||
      result.As<Promise>()->Then(context, on_fulfilled, on_rejected)
          .IsEmpty()) {
    operation->settle(Local<Value>(),
                      std::make_exception_ptr(
                          ErrorFromTryCatch(isolate, context, try_catch)));
    return;
  }

  per_process::Debug(DebugCategory::ENGINE,
                     "WebAssembly.%s pending (%u in flight)\n",
                     name,
                     pending_.size() + 1);
  PendingOperation* key = operation.get();
  pending_.emplace(key, std::move(operation));
}

void V8Engine::OnFulfilled(const FunctionCallbackInfo<Value>& info) {
  auto* operation =
      static_cast<PendingOperation*>(info.Data().As<External>()->Value());
  operation->engine->Finish(operation, info[0], nullptr);
}

void V8Engine::OnRejected(const FunctionCallbackInfo<Value>& info) {
  auto* operation =
      static_cast<PendingOperation*>(info.Data().As<External>()->Value());
  Isolate* isolate = info.GetIsolate();
  EngineError error =
      ErrorFromException(isolate, isolate->GetCurrentContext(), info[0]);
  operation->engine->Finish(
      operation, Local<Value>(), std::make_exception_ptr(error));
}

void V8Engine::Finish(PendingOperation* operation,
                      Local<Value> value,
                      std::exception_ptr error) {
  auto it = pending_.find(operation);
  CHECK(it != pending_.end());
  std::unique_ptr<PendingOperation> owned = std::move(it->second);
  pending_.erase(it);
  per_process::Debug(DebugCategory::ENGINE,
                     "operation %s, %u still in flight\n",
                     error ? "rejected" : "fulfilled",
                     pending_.size());
  owned->settle(value, error);
}

}  // namespace inwasm
