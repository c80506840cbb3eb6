//===- descriptor_reader.h - Deserialize descriptor files -------*- C++ -*-===//
//
// Reads the descriptor records emitted by the ASN.1 front end into a
// Specification. The encoding is msgpack; JSON is accepted too and goes through
// the same reader.
//
//   { "<Module>": {
//       "types":   { "<Type>": <descriptor>, ... },
//       "values":  { "<name>": <integer>, ... },          (optional)
//       "imports": { "<FromModule>": ["<Type>", ...] } }  (optional)
//   }
//
//   <descriptor> = { "type": "SEQUENCE" | "INTEGER" | ... | "<TypeName>",
//                    "members": [<member>...], "element": <descriptor>,
//                    "values": [["name", ordinal], ..., "..."],
//                    "size": [n | "name" | [lo, hi]] }
//   <member>     = <descriptor> + { "name": ..., "optional": bool,
//                                   "default": value }
//
//===----------------------------------------------------------------------===//

#pragma once

#include "asn1jer/descriptor.h"

#include <cstddef>
#include <cstdint>

namespace asn1jer {

/// Parse a msgpack-encoded specification.
/// Throws Error(InvalidDescriptor) on malformed input.
Specification parseMsgpackSpecification(const uint8_t *data, size_t size);

/// Parse a JSON-encoded specification.
///
/// The JSON is converted to msgpack bytes and fed through
/// parseMsgpackSpecification, so both inputs share one reader.
///
/// Throws Error(InvalidDescriptor) on malformed input.
Specification parseJsonSpecification(const uint8_t *data, size_t size);

} // namespace asn1jer
