#include "inwasm_compiler.h"
#include "debug_utils-inl.h"
#include "inwasm_codec.h"
#include "inwasm_errors.h"
#include "util.h"
#include "uv.h"

#include <sys/stat.h>
#include <cstring>

namespace inwasm {

namespace {

constexpr uint8_t kWasmMagic[] = {0x00, 0x61, 0x73, 0x6d};
constexpr uint8_t kWasmVersion[] = {0x01, 0x00, 0x00, 0x00};
constexpr int kBuildDirectoryMode = 0777;

#ifdef _WIN32
constexpr char kPathSeparator = '\\';
#else
constexpr char kPathSeparator = '/';
#endif

// Creates `path` and any missing parents. An existing directory is not an
// error; an existing file is reported as UV_EEXIST.
int MKDirp(const std::string& path, int mode) {
  std::vector<std::string> paths = {path};
  uv_fs_t req;
  while (!paths.empty()) {
    std::string next_path = std::move(paths.back());
    paths.pop_back();
    int err = uv_fs_mkdir(nullptr, &req, next_path.c_str(), mode, nullptr);
    uv_fs_req_cleanup(&req);
    switch (err) {
      case 0:
        break;
      case UV_ENOENT: {
        std::string dirname =
            next_path.substr(0, next_path.find_last_of(kPathSeparator));
        if (dirname.empty() || dirname == next_path) return err;
        paths.push_back(std::move(next_path));
        paths.push_back(std::move(dirname));
        break;
      }
      case UV_EEXIST: {
        err = uv_fs_stat(nullptr, &req, next_path.c_str(), nullptr);
        const bool is_directory = err == 0 && S_ISDIR(req.statbuf.st_mode);
        uv_fs_req_cleanup(&req);
        if (err < 0) return err;
        if (!is_directory) return UV_EEXIST;
        break;
      }
      default:
        return err;
    }
  }
  return 0;
}

std::string JoinPath(const std::string& parent, const std::string& child) {
  if (parent.empty() || parent.back() == kPathSeparator) return parent + child;
  return parent + kPathSeparator + child;
}

void CheckWasmHeader(const AuthoringDefinition& definition,
                     const std::vector<uint8_t>& bytes) {
  const size_t header_size = sizeof(kWasmMagic) + sizeof(kWasmVersion);
  if (bytes.size() < header_size ||
      memcmp(bytes.data(), kWasmMagic, sizeof(kWasmMagic)) != 0) {
    THROW_ERR_INWASM_INVALID_WASM_BINARY(
        "Compiler output of \"%s\" is not a WebAssembly binary",
        definition.name);
  }
  if (memcmp(bytes.data() + sizeof(kWasmMagic),
             kWasmVersion,
             sizeof(kWasmVersion)) != 0) {
    THROW_ERR_INWASM_INVALID_WASM_BINARY(
        "Compiler output of \"%s\" has unsupported WebAssembly version %u",
        definition.name,
        static_cast<unsigned>(bytes[4]));
  }
}

// Only the import key can carry user text; the payload is base64.
std::string QuoteString(const std::string& text) {
  std::string quoted = "\"";
  for (char c : text) {
    switch (c) {
      case '"':
      case '\\':
        quoted += '\\';
        quoted += c;
        break;
      case '\n':
        quoted += "\\n";
        break;
      default:
        quoted += c;
    }
  }
  quoted += '"';
  return quoted;
}

const char* OutputTypeEnumerator(OutputType type) {
  switch (type) {
    case OutputType::kInstance:
      return "inwasm::OutputType::kInstance";
    case OutputType::kModule:
      return "inwasm::OutputType::kModule";
    case OutputType::kBytes:
      return "inwasm::OutputType::kBytes";
    default:
      UNREACHABLE();
  }
}

}  // anonymous namespace

void CompilerRegistry::Register(SourceKind kind,
                                std::shared_ptr<CompilerBackend> backend) {
  CHECK(backend);
  backends_[kind] = std::move(backend);
}

CompilerBackend* CompilerRegistry::Get(SourceKind kind) const {
  auto it = backends_.find(kind);
  return it == backends_.end() ? nullptr : it->second.get();
}

CompiledDefinition CompileDefinition(const AuthoringDefinition& definition,
                                     const std::string& build_root,
                                     const CompilerRegistry& registry,
                                     WasmEngine* validator) {
  ValidateDefinition(definition);

  const std::string build_dir = JoinPath(build_root, definition.name);
  const int err = MKDirp(build_dir, kBuildDirectoryMode);
  if (err != 0) {
    THROW_ERR_INWASM_BUILD_DIRECTORY("Cannot create build directory %s: %s",
                                     build_dir,
                                     uv_strerror(err));
  }

  per_process::Debug(DebugCategory::COMPILER,
                     "compiling %s (%s) in %s\n",
                     definition.name,
                     SourceKindName(definition.source_kind),
                     build_dir);

  std::vector<uint8_t> bytes;
  if (definition.source_kind == SourceKind::kCustom) {
    bytes = definition.custom_runner(definition, build_dir);
  } else {
    CompilerBackend* backend = registry.Get(definition.source_kind);
    if (backend == nullptr) {
      THROW_ERR_INWASM_UNSUPPORTED_SOURCE_KIND(
          "No compiler registered for source kind \"%s\" of \"%s\"",
          SourceKindName(definition.source_kind),
          definition.name);
    }
    bytes = backend->Compile(definition, build_dir);
  }
  CheckWasmHeader(definition, bytes);
  if (validator != nullptr &&
      !validator->Validate(
          std::make_shared<const std::vector<uint8_t>>(bytes))) {
    THROW_ERR_INWASM_INVALID_WASM_BINARY(
        "Compiler output of \"%s\" failed WebAssembly validation",
        definition.name);
  }

  CompiledDefinition compiled;
  compiled.t = definition.type;
  compiled.s = definition.mode == OutputMode::kSync;
  compiled.d = EncodeBase64(bytes.data(), bytes.size());
  if (definition.type == OutputType::kInstance) compiled.e = definition.imports;

  per_process::Debug(DebugCategory::COMPILER,
                     "compiled %s: %u bytes\n",
                     definition.name,
                     bytes.size());
  return compiled;
}

std::vector<CompiledDefinition> CompileCaptured(
    const CaptureContext& capture,
    const std::string& build_root,
    const CompilerRegistry& registry,
    WasmEngine* validator) {
  std::vector<CompiledDefinition> compiled;
  compiled.reserve(capture.size());
  for (const AuthoringDefinition& definition : capture.definitions()) {
    compiled.push_back(
        CompileDefinition(definition, build_root, registry, validator));
  }
  return compiled;
}

std::string EmitCompiledDefinition(const CompiledDefinition& compiled) {
  std::string text = "inwasm::CompiledDefinition{";
  text += OutputTypeEnumerator(compiled.t);
  text += compiled.s ? ", true, " : ", false, ";
  text += QuoteString(compiled.d);
  if (compiled.e.has_value()) {
    text += ", ";
    text += QuoteString(*compiled.e);
  }
  text += "}";
  return text;
}

}  // namespace inwasm
