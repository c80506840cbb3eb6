//===- wire.h - JSON text ⇄ bytes for the JER wire form ---------*- C++ -*-===//
//
// The last step of encode and the first of decode: compact UTF-8 JSON text
// (no whitespace between tokens) to and from bytes.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace asn1jer {

/// Render compact JSON as UTF-8 bytes.
/// Throws Error(MalformedWire) if a string holds invalid UTF-8.
std::vector<uint8_t> serialize(const nlohmann::ordered_json &document);

/// Parse UTF-8 JSON text.
/// Throws Error(MalformedWire) on invalid UTF-8 or invalid JSON syntax.
nlohmann::ordered_json deserialize(const uint8_t *data, size_t size);

} // namespace asn1jer
