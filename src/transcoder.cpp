//===- transcoder.cpp - TypeNode-driven Value ⇄ JSON transcoding ----------===//
//
// Wire forms:
//   INTEGER, REAL, BOOLEAN, NULL   JSON number / number / true,false / null
//                                  (REAL ±∞ and NaN as "INF", "-INF", "NaN")
//   ENUMERATED                     the identifier as a string
//   character strings, times       JSON string
//   OBJECT IDENTIFIER              dotted decimal string
//   OCTET STRING                   hex string
//   BIT STRING                     {"value": hex, "length": bits}
//   SEQUENCE, SET                  object, members in declared order
//   CHOICE                         single-member object {alternative: value}
//   SEQUENCE OF, SET OF            array, order preserved
//
//===----------------------------------------------------------------------===//

#include "asn1jer/transcoder.h"

#include "text_helpers.h"

#include <cmath>
#include <limits>
#include <utility>

namespace asn1jer {

// ── Path tracking ───────────────────────────────────────────────────────────

class Transcoder::PathScope {
public:
  PathScope(Transcoder &t, std::string part) : t(t) { t.path.push_back(std::move(part)); }
  ~PathScope() { t.path.pop_back(); }
  PathScope(const PathScope &) = delete;
  PathScope &operator=(const PathScope &) = delete;

private:
  Transcoder &t;
};

Transcoder::Transcoder(const Schema &schema, const CodecOptions &options, std::string rootName)
    : schema(schema), options(options) {
  if (!rootName.empty())
    path.push_back(std::move(rootName));
}

std::string Transcoder::currentPath() const {
  std::string out;
  for (const auto &part : path) {
    if (!out.empty() && part[0] != '[')
      out += '.';
    out += part;
  }
  return out;
}

void Transcoder::fail(ErrorKind kind, const std::string &msg) const {
  throw Error(kind, msg, currentPath());
}

void Transcoder::expected(const char *what, const Value &got) const {
  fail(ErrorKind::EncodeError,
       std::string("expected ") + what + ", got " + valueKindName(got) + " " + formatValue(got));
}

void Transcoder::expected(const char *what, const json &got) const {
  fail(ErrorKind::DecodeError, std::string("expected ") + what + ", got " + got.type_name() +
                                   " " + got.dump(-1, ' ', false, json::error_handler_t::replace));
}

static std::string joinNames(const std::vector<Field> &fields) {
  std::string out = "[";
  for (size_t i = 0; i < fields.size(); ++i) {
    if (i)
      out += ", ";
    out += "'" + fields[i].name + "'";
  }
  return out + "]";
}

// ── Entry points ────────────────────────────────────────────────────────────

nlohmann::ordered_json Transcoder::encode(NodeId id, const Value &value) {
  return encodeNode(id, value, 0);
}

Value Transcoder::decode(NodeId id, const nlohmann::ordered_json &j) {
  return decodeNode(id, j, 0);
}

Transcoder::json Transcoder::encodeNode(NodeId id, const Value &value, unsigned depth) {
  if (depth > options.max_depth)
    fail(ErrorKind::DepthLimitExceeded,
         "value nesting exceeds " + std::to_string(options.max_depth) + " levels");
  return std::visit([&](const auto &node) { return encodeAs(node, value, depth); },
                    schema.node(id).kind);
}

Value Transcoder::decodeNode(NodeId id, const json &j, unsigned depth) {
  if (depth > options.max_depth)
    fail(ErrorKind::DepthLimitExceeded,
         "value nesting exceeds " + std::to_string(options.max_depth) + " levels");
  return std::visit([&](const auto &node) { return decodeAs(node, j, depth); },
                    schema.node(id).kind);
}

// ── Scalars ─────────────────────────────────────────────────────────────────

Transcoder::json Transcoder::encodeAs(const IntegerType &, const Value &value, unsigned) {
  const auto *i = value.getIf<int64_t>();
  if (!i)
    expected("integer", value);
  return *i;
}

Value Transcoder::decodeAs(const IntegerType &, const json &j, unsigned) {
  if (j.is_number_unsigned()) {
    auto u = j.get<uint64_t>();
    if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
      fail(ErrorKind::DecodeError, "integer " + std::to_string(u) + " does not fit in 64 bits");
    return static_cast<int64_t>(u);
  }
  if (j.is_number_integer())
    return j.get<int64_t>();
  expected("integer", j);
}

Transcoder::json Transcoder::encodeAs(const RealType &, const Value &value, unsigned) {
  if (const auto *i = value.getIf<int64_t>())
    return *i;
  const auto *d = value.getIf<double>();
  if (!d)
    expected("real", value);
  // JSON has no literal for these; use the X.697 special-value strings.
  if (std::isnan(*d))
    return "NaN";
  if (std::isinf(*d))
    return *d > 0 ? "INF" : "-INF";
  return *d;
}

Value Transcoder::decodeAs(const RealType &, const json &j, unsigned) {
  if (j.is_number())
    return j.get<double>();
  if (j.is_string()) {
    const auto &s = j.get_ref<const std::string &>();
    if (s == "INF")
      return std::numeric_limits<double>::infinity();
    if (s == "-INF")
      return -std::numeric_limits<double>::infinity();
    if (s == "NaN")
      return std::numeric_limits<double>::quiet_NaN();
    if (s == "-0")
      return -0.0;
  }
  expected("real", j);
}

Transcoder::json Transcoder::encodeAs(const BooleanType &, const Value &value, unsigned) {
  const auto *b = value.getIf<bool>();
  if (!b)
    expected("boolean", value);
  return *b;
}

Value Transcoder::decodeAs(const BooleanType &, const json &j, unsigned) {
  if (!j.is_boolean())
    expected("boolean", j);
  return j.get<bool>();
}

Transcoder::json Transcoder::encodeAs(const NullType &, const Value &value, unsigned) {
  if (!value.isNull())
    expected("null", value);
  return nullptr;
}

Value Transcoder::decodeAs(const NullType &, const json &j, unsigned) {
  if (!j.is_null())
    expected("null", j);
  return Null{};
}

Transcoder::json Transcoder::encodeAs(const EnumeratedType &type, const Value &value, unsigned) {
  const auto *name = value.getIf<std::string>();
  if (!name)
    expected("enumeration identifier", value);
  if (!type.ordinals.count(*name)) {
    std::string known;
    for (const auto &[ordinal, n] : type.values)
      known += (known.empty() ? "'" : ", '") + n + "'";
    fail(ErrorKind::EncodeError,
         "enumeration value '" + *name + "' not found in [" + known + "]");
  }
  return *name;
}

Value Transcoder::decodeAs(const EnumeratedType &type, const json &j, unsigned) {
  if (!j.is_string())
    expected("enumeration identifier", j);
  const auto &name = j.get_ref<const std::string &>();
  if (!type.ordinals.count(name))
    fail(ErrorKind::DecodeError, "enumeration value '" + name + "' not found");
  return name;
}

Transcoder::json Transcoder::encodeAs(const StringType &type, const Value &value, unsigned) {
  const auto *s = value.getIf<std::string>();
  if (!s)
    expected(stringKindName(type.kind), value);
  return *s;
}

Value Transcoder::decodeAs(const StringType &type, const json &j, unsigned) {
  if (!j.is_string())
    expected(stringKindName(type.kind), j);
  return j.get<std::string>();
}

Transcoder::json Transcoder::encodeAs(const ObjectIdentifierType &, const Value &value,
                                      unsigned) {
  const auto *s = value.getIf<std::string>();
  if (!s)
    expected("object identifier", value);
  if (!isDottedObjectIdentifier(*s))
    fail(ErrorKind::EncodeError, "'" + *s + "' is not a dotted-decimal object identifier");
  return *s;
}

Value Transcoder::decodeAs(const ObjectIdentifierType &, const json &j, unsigned) {
  if (!j.is_string())
    expected("object identifier", j);
  const auto &s = j.get_ref<const std::string &>();
  if (!isDottedObjectIdentifier(s))
    fail(ErrorKind::DecodeError, "'" + s + "' is not a dotted-decimal object identifier");
  return s;
}

// ── Binary strings ──────────────────────────────────────────────────────────

Transcoder::json Transcoder::encodeAs(const OctetStringType &, const Value &value, unsigned) {
  const auto *bytes = value.getIf<Bytes>();
  if (!bytes)
    expected("octet string", value);
  return encodeHex(*bytes);
}

Value Transcoder::decodeAs(const OctetStringType &, const json &j, unsigned) {
  if (!j.is_string())
    expected("hex string", j);
  auto bytes = decodeHex(j.get_ref<const std::string &>());
  if (!bytes)
    fail(ErrorKind::DecodeError, "'" + j.get<std::string>() + "' is not a valid hex string");
  return std::move(*bytes);
}

Transcoder::json Transcoder::encodeAs(const BitStringType &, const Value &value, unsigned) {
  const auto *bits = value.getIf<BitString>();
  if (!bits)
    expected("bit string", value);
  if (bits->bytes.size() != bitStringByteCount(bits->length))
    fail(ErrorKind::EncodeError, std::to_string(bits->bytes.size()) + " bytes cannot hold " +
                                     std::to_string(bits->length) + " bits");
  if (!isWellFormedBitString(*bits))
    fail(ErrorKind::EncodeError, "bit string has nonzero bits past bit " +
                                     std::to_string(bits->length));
  json out = json::object();
  out["value"] = encodeHex(bits->bytes);
  out["length"] = bits->length;
  return out;
}

Value Transcoder::decodeAs(const BitStringType &, const json &j, unsigned) {
  if (!j.is_object() || !j.contains("value") || !j.contains("length"))
    expected("{\"value\": hex, \"length\": bits}", j);
  const auto &hex = j.at("value");
  const auto &length = j.at("length");
  if (!hex.is_string() || !length.is_number_unsigned())
    expected("{\"value\": hex, \"length\": bits}", j);

  BitString bits;
  bits.length = length.get<uint64_t>();
  auto bytes = decodeHex(hex.get_ref<const std::string &>());
  if (!bytes || bytes->size() != bitStringByteCount(bits.length))
    fail(ErrorKind::DecodeError, "bit string value does not hold " +
                                     std::to_string(bits.length) + " bits");
  bits.bytes = std::move(*bytes);
  if (!isWellFormedBitString(bits))
    fail(ErrorKind::DecodeError, "bit string has nonzero bits past bit " +
                                     std::to_string(bits.length));
  return bits;
}

// ── SEQUENCE / SET ──────────────────────────────────────────────────────────

// Encode is strict: a required member must be present. A present member equal
// to its DEFAULT is left off the wire unless the options ask otherwise.
Transcoder::json Transcoder::encodeMembers(const char *what, const std::vector<Field> &fields,
                                           const Value &value, unsigned depth) {
  const auto *record = value.getIf<Record>();
  if (!record)
    expected("record", value);

  json out = json::object();
  for (const auto &field : fields) {
    const Value *member = record->find(field.name);
    if (!member) {
      if (field.optional || field.default_value)
        continue;
      fail(ErrorKind::MissingRequiredField,
           std::string(what) + " member '" + field.name + "' not found in " +
               formatValue(value));
    }
    if (field.default_value && options.defaults == DefaultEncoding::ElideEqual &&
        *member == *field.default_value)
      continue;
    PathScope scope(*this, field.name);
    out[field.name] = encodeNode(field.node, *member, depth + 1);
  }
  return out;
}

// Decode is lenient by default: an absent required member is left out of the
// result instead of failing. Absent defaulted members take their DEFAULT.
Value Transcoder::decodeMembers(const char *what, const std::vector<Field> &fields, const json &j,
                                unsigned depth) {
  if (!j.is_object())
    expected("object", j);

  Record out;
  for (const auto &field : fields) {
    auto it = j.find(field.name);
    if (it != j.end()) {
      PathScope scope(*this, field.name);
      out.set(field.name, decodeNode(field.node, *it, depth + 1));
    } else if (field.optional) {
      continue;
    } else if (field.default_value) {
      out.set(field.name, *field.default_value);
    } else if (options.missing_fields == MissingFieldDecoding::Reject) {
      fail(ErrorKind::MissingRequiredField,
           std::string(what) + " member '" + field.name + "' not found");
    }
  }
  return out;
}

Transcoder::json Transcoder::encodeAs(const SequenceType &type, const Value &value,
                                      unsigned depth) {
  return encodeMembers("Sequence", type.fields, value, depth);
}

Value Transcoder::decodeAs(const SequenceType &type, const json &j, unsigned depth) {
  return decodeMembers("Sequence", type.fields, j, depth);
}

Transcoder::json Transcoder::encodeAs(const SetType &type, const Value &value, unsigned depth) {
  return encodeMembers("Set", type.fields, value, depth);
}

Value Transcoder::decodeAs(const SetType &type, const json &j, unsigned depth) {
  return decodeMembers("Set", type.fields, j, depth);
}

// ── CHOICE ──────────────────────────────────────────────────────────────────

Transcoder::json Transcoder::encodeAs(const ChoiceType &type, const Value &value,
                                      unsigned depth) {
  const auto *record = value.getIf<Record>();
  if (!record)
    expected("record", value);

  const Field *chosen = nullptr;
  if (record->size() == 1) {
    const auto &name = record->entries.front().name;
    for (const auto &alt : type.alternatives)
      if (alt.name == name)
        chosen = &alt;
  }
  if (!chosen) {
    std::string got;
    for (const auto &entry : record->entries)
      got += (got.empty() ? "'" : ", '") + entry.name + "'";
    fail(ErrorKind::EncodeError, "expected exactly one of " + joinNames(type.alternatives) +
                                     ", but got [" + got + "]");
  }

  json out = json::object();
  PathScope scope(*this, chosen->name);
  out[chosen->name] = encodeNode(chosen->node, record->entries.front().value, depth + 1);
  return out;
}

Value Transcoder::decodeAs(const ChoiceType &type, const json &j, unsigned depth) {
  if (!j.is_object() || j.size() != 1)
    expected("single-member object", j);
  const auto &key = j.begin().key();
  for (const auto &alt : type.alternatives) {
    if (alt.name != key)
      continue;
    PathScope scope(*this, alt.name);
    Record out;
    out.set(alt.name, decodeNode(alt.node, j.begin().value(), depth + 1));
    return out;
  }
  fail(ErrorKind::DecodeError,
       "unknown alternative '" + key + "', expected one of " + joinNames(type.alternatives));
}

// ── SEQUENCE OF / SET OF ────────────────────────────────────────────────────

// SET OF keeps the caller's element order; JSON arrays are ordered.
Transcoder::json Transcoder::encodeElements(NodeId element, const Value &value, unsigned depth) {
  const auto *list = value.getIf<List>();
  if (!list)
    expected("list", value);
  json out = json::array();
  for (size_t i = 0; i < list->size(); ++i) {
    PathScope scope(*this, "[" + std::to_string(i) + "]");
    out.push_back(encodeNode(element, (*list)[i], depth + 1));
  }
  return out;
}

Value Transcoder::decodeElements(NodeId element, const json &j, unsigned depth) {
  if (!j.is_array())
    expected("array", j);
  List out;
  out.reserve(j.size());
  for (size_t i = 0; i < j.size(); ++i) {
    PathScope scope(*this, "[" + std::to_string(i) + "]");
    out.push_back(decodeNode(element, j[i], depth + 1));
  }
  return out;
}

Transcoder::json Transcoder::encodeAs(const SequenceOfType &type, const Value &value,
                                      unsigned depth) {
  return encodeElements(type.element, value, depth);
}

Value Transcoder::decodeAs(const SequenceOfType &type, const json &j, unsigned depth) {
  return decodeElements(type.element, j, depth);
}

Transcoder::json Transcoder::encodeAs(const SetOfType &type, const Value &value,
                                      unsigned depth) {
  return encodeElements(type.element, value, depth);
}

Value Transcoder::decodeAs(const SetOfType &type, const json &j, unsigned depth) {
  return decodeElements(type.element, j, depth);
}

// ── ANY ─────────────────────────────────────────────────────────────────────

// Open types have no schema to follow, so values map structurally.
Transcoder::json Transcoder::encodeAs(const AnyType &any, const Value &value, unsigned depth) {
  if (depth > options.max_depth)
    fail(ErrorKind::DepthLimitExceeded,
         "value nesting exceeds " + std::to_string(options.max_depth) + " levels");
  if (value.isNull())
    return nullptr;
  if (const auto *b = value.getIf<bool>())
    return *b;
  if (const auto *i = value.getIf<int64_t>())
    return *i;
  if (const auto *d = value.getIf<double>())
    return encodeAs(RealType{}, *d, depth);
  if (const auto *s = value.getIf<std::string>())
    return *s;
  if (const auto *bytes = value.getIf<Bytes>())
    return encodeHex(*bytes);
  if (value.getIf<BitString>())
    return encodeAs(BitStringType{}, value, depth);
  if (const auto *list = value.getIf<List>()) {
    json out = json::array();
    for (const auto &element : *list)
      out.push_back(encodeAs(any, element, depth + 1));
    return out;
  }
  json out = json::object();
  for (const auto &entry : value.getIf<Record>()->entries) {
    PathScope scope(*this, entry.name);
    out[entry.name] = encodeAs(any, entry.value, depth + 1);
  }
  return out;
}

Value Transcoder::decodeAs(const AnyType &any, const json &j, unsigned depth) {
  if (depth > options.max_depth)
    fail(ErrorKind::DepthLimitExceeded,
         "value nesting exceeds " + std::to_string(options.max_depth) + " levels");
  switch (j.type()) {
  case json::value_t::null:
    return Null{};
  case json::value_t::boolean:
    return j.get<bool>();
  case json::value_t::number_integer:
    return j.get<int64_t>();
  case json::value_t::number_unsigned:
    if (j.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
      return j.get<double>();
    return j.get<int64_t>();
  case json::value_t::number_float:
    return j.get<double>();
  case json::value_t::string:
    return j.get<std::string>();
  case json::value_t::array: {
    List out;
    for (const auto &element : j)
      out.push_back(decodeAs(any, element, depth + 1));
    return out;
  }
  case json::value_t::object: {
    Record out;
    for (auto it = j.begin(); it != j.end(); ++it) {
      PathScope scope(*this, it.key());
      out.set(it.key(), decodeAs(any, it.value(), depth + 1));
    }
    return out;
  }
  case json::value_t::binary:
  case json::value_t::discarded:
    break;
  }
  expected("JSON value", j);
}

} // namespace asn1jer
