#ifndef SRC_INWASM_CAPTURE_H_
#define SRC_INWASM_CAPTURE_H_

#include <exception>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "inwasm_definition.h"

namespace inwasm {

// Receives authoring definitions while the compile pipeline walks the
// program. Passed explicitly to Load(); there is no process-wide sink.
class CaptureSink {
 public:
  virtual ~CaptureSink() = default;

  virtual void Add(const AuthoringDefinition& definition) = 0;
};

// Raised after a definition was captured so the calling path does not go on
// to use an accessor that does not exist yet. This is control flow, not an
// inwasm::Error.
class CaptureSignal : public std::exception {
 public:
  explicit CaptureSignal(std::string definition_name)
      : definition_name_(std::move(definition_name)) {}

  const char* what() const noexcept override {
    return "inwasm definition captured";
  }
  const std::string& definition_name() const { return definition_name_; }

 private:
  std::string definition_name_;
};

enum class CaptureMode {
  // Raise CaptureSignal after every recorded definition.
  kRaise,
  // Record silently, so one pass can collect several definitions.
  kCollect
};

class CaptureContext final : public CaptureSink {
 public:
  explicit CaptureContext(CaptureMode mode = CaptureMode::kRaise)
      : mode_(mode) {}

  CaptureContext(const CaptureContext&) = delete;
  CaptureContext& operator=(const CaptureContext&) = delete;

  // Throws ERR_INWASM_INVALID_DEFINITION or ERR_INWASM_DUPLICATE_DEFINITION,
  // otherwise records `definition` and, in kRaise mode, throws CaptureSignal.
  void Add(const AuthoringDefinition& definition) override;

  // In capture order.
  const std::vector<AuthoringDefinition>& definitions() const {
    return definitions_;
  }
  std::vector<AuthoringDefinition> TakeDefinitions();

  size_t size() const { return definitions_.size(); }
  bool Contains(const std::string& name) const {
    return names_.count(name) > 0;
  }
  CaptureMode mode() const { return mode_; }

 private:
  const CaptureMode mode_;
  std::vector<AuthoringDefinition> definitions_;
  std::unordered_set<std::string> names_;
};

}  // namespace inwasm

#endif  // SRC_INWASM_CAPTURE_H_
