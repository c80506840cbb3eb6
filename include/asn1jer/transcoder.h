//===- transcoder.h - TypeNode-driven Value ⇄ JSON transcoding --*- C++ -*-===//
//
// Walks a compiled Schema against a native Value (encode) or a parsed JSON
// document (decode). Dispatch is a std::visit over the TypeNode variant with
// one overload per alternative, in each direction.
//
// The JSON side uses nlohmann::ordered_json so objects keep the declared
// member order on output.
//
//===----------------------------------------------------------------------===//

#ifndef ASN1JER_TRANSCODER_H
#define ASN1JER_TRANSCODER_H

#include "asn1jer/error.h"
#include "asn1jer/type_node.h"
#include "asn1jer/value.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace asn1jer {

/// How a present SEQUENCE/SET member equal to its DEFAULT is encoded.
enum class DefaultEncoding {
  ElideEqual, // leave it off the wire
  Emit,       // write it like any other member
};

/// How decode treats a required member missing from the wire.
enum class MissingFieldDecoding {
  Omit,   // leave it out of the result (lenient)
  Reject, // fail with MissingRequiredField
};

struct CodecOptions {
  DefaultEncoding defaults = DefaultEncoding::ElideEqual;
  MissingFieldDecoding missing_fields = MissingFieldDecoding::Omit;
  unsigned max_depth = 256; // value nesting limit for encode and decode
};

/// One transcoding pass. Holds a path stack for diagnostics, so use one
/// instance per call; the Schema itself is only read.
class Transcoder {
public:
  Transcoder(const Schema &schema, const CodecOptions &options, std::string rootName = {});

  /// Native value → JSON document. Throws asn1jer::Error.
  nlohmann::ordered_json encode(NodeId id, const Value &value);

  /// JSON document → native value. Throws asn1jer::Error.
  Value decode(NodeId id, const nlohmann::ordered_json &json);

private:
  using json = nlohmann::ordered_json;

  json encodeNode(NodeId id, const Value &value, unsigned depth);
  Value decodeNode(NodeId id, const json &j, unsigned depth);

  // ── Encode, one overload per node variant ─────────────────────────
  json encodeAs(const IntegerType &, const Value &value, unsigned depth);
  json encodeAs(const RealType &, const Value &value, unsigned depth);
  json encodeAs(const BooleanType &, const Value &value, unsigned depth);
  json encodeAs(const NullType &, const Value &value, unsigned depth);
  json encodeAs(const EnumeratedType &type, const Value &value, unsigned depth);
  json encodeAs(const StringType &type, const Value &value, unsigned depth);
  json encodeAs(const BitStringType &, const Value &value, unsigned depth);
  json encodeAs(const OctetStringType &, const Value &value, unsigned depth);
  json encodeAs(const ObjectIdentifierType &, const Value &value, unsigned depth);
  json encodeAs(const SequenceType &type, const Value &value, unsigned depth);
  json encodeAs(const SetType &type, const Value &value, unsigned depth);
  json encodeAs(const ChoiceType &type, const Value &value, unsigned depth);
  json encodeAs(const SequenceOfType &type, const Value &value, unsigned depth);
  json encodeAs(const SetOfType &type, const Value &value, unsigned depth);
  json encodeAs(const AnyType &, const Value &value, unsigned depth);

  // ── Decode, one overload per node variant ─────────────────────────
  Value decodeAs(const IntegerType &, const json &j, unsigned depth);
  Value decodeAs(const RealType &, const json &j, unsigned depth);
  Value decodeAs(const BooleanType &, const json &j, unsigned depth);
  Value decodeAs(const NullType &, const json &j, unsigned depth);
  Value decodeAs(const EnumeratedType &type, const json &j, unsigned depth);
  Value decodeAs(const StringType &type, const json &j, unsigned depth);
  Value decodeAs(const BitStringType &, const json &j, unsigned depth);
  Value decodeAs(const OctetStringType &, const json &j, unsigned depth);
  Value decodeAs(const ObjectIdentifierType &, const json &j, unsigned depth);
  Value decodeAs(const SequenceType &type, const json &j, unsigned depth);
  Value decodeAs(const SetType &type, const json &j, unsigned depth);
  Value decodeAs(const ChoiceType &type, const json &j, unsigned depth);
  Value decodeAs(const SequenceOfType &type, const json &j, unsigned depth);
  Value decodeAs(const SetOfType &type, const json &j, unsigned depth);
  Value decodeAs(const AnyType &, const json &j, unsigned depth);

  // ── Shared member and element handling ────────────────────────────
  json encodeMembers(const char *what, const std::vector<Field> &fields, const Value &value,
                     unsigned depth);
  Value decodeMembers(const char *what, const std::vector<Field> &fields, const json &j,
                      unsigned depth);
  json encodeElements(NodeId element, const Value &value, unsigned depth);
  Value decodeElements(NodeId element, const json &j, unsigned depth);

  // ── Diagnostics ───────────────────────────────────────────────────
  class PathScope;
  std::string currentPath() const;
  [[noreturn]] void fail(ErrorKind kind, const std::string &msg) const;
  [[noreturn]] void expected(const char *what, const Value &got) const;
  [[noreturn]] void expected(const char *what, const json &got) const;

  const Schema &schema;
  const CodecOptions &options;
  std::vector<std::string> path;
};

} // namespace asn1jer

#endif // ASN1JER_TRANSCODER_H
