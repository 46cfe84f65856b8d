#include "inwasm_codec.h"
#include "debug_utils-inl.h"
#include "nbytes.h"
#include "simdutf.h"
#include "util.h"

#include <vector>

namespace inwasm {

WasmBytes DecodeBase64(std::string_view encoded) {
  auto bytes = std::make_shared<std::vector<uint8_t>>(
      simdutf::maximal_binary_length_from_base64(encoded.data(),
                                                 encoded.size()));
  size_t written = bytes->size();
  simdutf::result result =
      simdutf::base64_to_binary_safe(encoded.data(),
                                     encoded.size(),
                                     reinterpret_cast<char*>(bytes->data()),
                                     written);
  if (result.error != simdutf::error_code::SUCCESS) {
    // Not forgiving-base64; decode the way the platform's lenient decoder
    // does, skipping unknown characters and stopping at padding.
    bytes->resize(nbytes::Base64DecodedSize(encoded.data(), encoded.size()));
    written = nbytes::Base64Decode(reinterpret_cast<char*>(bytes->data()),
                                   bytes->size(),
                                   encoded.data(),
                                   encoded.size());
    per_process::Debug(DebugCategory::CODEC,
                       "lenient decode after error %d at %u\n",
                       static_cast<int>(result.error),
                       result.count);
  }
  bytes->resize(written);
  per_process::Debug(DebugCategory::CODEC,
                     "decoded %u base64 characters into %u bytes\n",
                     encoded.size(),
                     written);
  return bytes;
}

std::string EncodeBase64(const uint8_t* data, size_t size) {
  std::string encoded(simdutf::base64_length_from_binary(size), '\0');
  const size_t written = simdutf::binary_to_base64(
      reinterpret_cast<const char*>(data), size, encoded.data());
  CHECK_EQ(written, encoded.size());
  return encoded;
}

std::optional<ImportObject> BuildImportObject(
    const std::optional<std::string>& key, std::shared_ptr<HostValue> value) {
  if (!key.has_value() || !value) {
    if (key.has_value()) {
      per_process::Debug(DebugCategory::CODEC,
                         "no host value for import key %s\n",
                         *key);
    }
    return std::nullopt;
  }
  return ImportObject{*key, std::move(value)};
}

}  // namespace inwasm
