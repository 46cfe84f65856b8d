#ifndef SRC_INWASM_CODEC_H_
#define SRC_INWASM_CODEC_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "inwasm_engine.h"

namespace inwasm {

// Decodes the embedded base64 payload of a compiled definition. Input that is
// not forgiving-base64 is decoded leniently: characters outside either
// alphabet are skipped and decoding ends at the first '='.
WasmBytes DecodeBase64(std::string_view encoded);

// Standard alphabet with padding.
std::string EncodeBase64(const uint8_t* data, size_t size);

// Returns `{ [key]: value }`, or nothing when either side is missing.
std::optional<ImportObject> BuildImportObject(
    const std::optional<std::string>& key, std::shared_ptr<HostValue> value);

}  // namespace inwasm

#endif  // SRC_INWASM_CODEC_H_
