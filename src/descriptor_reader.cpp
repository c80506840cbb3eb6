//===- descriptor_reader.cpp - Deserialize descriptor files ---------------===//
//
// Reads msgpack maps with string keys into TypeDescriptor records. JSON input
// is converted to msgpack first, so every rule here applies to both.
//
//===----------------------------------------------------------------------===//

#include "asn1jer/descriptor_reader.h"
#include "asn1jer/error.h"

#include "text_helpers.h"

#include <msgpack.hpp>
#include <nlohmann/json.hpp>

#include <limits>
#include <string>
#include <string_view>
#include <utility>

namespace asn1jer {

// ── Error helper ────────────────────────────────────────────────────────────

[[noreturn]] static void fail(const std::string &msg) {
  throw Error(ErrorKind::InvalidDescriptor, "descriptor parse error: " + msg);
}

// ── msgpack object helpers ──────────────────────────────────────────────────

/// Get a string from a msgpack object.
static std::string getString(const msgpack::object &obj) {
  if (obj.type != msgpack::type::STR)
    fail("expected string, got type " + std::to_string(obj.type));
  return std::string(obj.via.str.ptr, obj.via.str.size);
}

/// Get integer from msgpack object.
static int64_t getInt(const msgpack::object &obj) {
  if (obj.type == msgpack::type::POSITIVE_INTEGER) {
    if (obj.via.u64 > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
      fail("unsigned value " + std::to_string(obj.via.u64) + " overflows int64_t");
    return static_cast<int64_t>(obj.via.u64);
  }
  if (obj.type == msgpack::type::NEGATIVE_INTEGER)
    return obj.via.i64;
  fail("expected integer, got type " + std::to_string(obj.type));
}

static bool isInt(const msgpack::object &obj) {
  return obj.type == msgpack::type::POSITIVE_INTEGER ||
         obj.type == msgpack::type::NEGATIVE_INTEGER;
}

/// Get bool from msgpack object.
static bool getBool(const msgpack::object &obj) {
  if (obj.type == msgpack::type::BOOLEAN)
    return obj.via.boolean;
  fail("expected bool, got type " + std::to_string(obj.type));
}

/// Check if msgpack object is nil.
static bool isNil(const msgpack::object &obj) {
  return obj.type == msgpack::type::NIL;
}

/// Interpret a msgpack object as a map and find a key.
/// Returns nullptr if not found.
static const msgpack::object *mapGet(const msgpack::object &obj, std::string_view key) {
  if (obj.type != msgpack::type::MAP)
    fail("expected map, got type " + std::to_string(obj.type));
  for (uint32_t i = 0; i < obj.via.map.size; ++i) {
    const auto &kv = obj.via.map.ptr[i];
    if (kv.key.type == msgpack::type::STR &&
        std::string_view(kv.key.via.str.ptr, kv.key.via.str.size) == key)
      return &kv.val;
  }
  return nullptr;
}

/// Interpret a msgpack object as a map and get a required key.
static const msgpack::object &mapReq(const msgpack::object &obj, std::string_view key) {
  const auto *v = mapGet(obj, key);
  if (!v)
    fail("missing required key: " + std::string(key));
  return *v;
}

/// Get an array from a msgpack object.
static const msgpack::object *arrayData(const msgpack::object &obj, uint32_t &size) {
  if (obj.type != msgpack::type::ARRAY)
    fail("expected array, got type " + std::to_string(obj.type));
  size = obj.via.array.size;
  return obj.via.array.ptr;
}

/// Call `fn(key, value)` for every entry of a string-keyed map.
template <typename Fn> static void forEachEntry(const msgpack::object &obj, Fn fn) {
  if (obj.type != msgpack::type::MAP)
    fail("expected map, got type " + std::to_string(obj.type));
  for (uint32_t i = 0; i < obj.via.map.size; ++i)
    fn(getString(obj.via.map.ptr[i].key), obj.via.map.ptr[i].val);
}

// ── Values (DEFAULT clauses) ────────────────────────────────────────────────

static Value parseValue(const msgpack::object &obj) {
  switch (obj.type) {
  case msgpack::type::NIL:
    return Null{};
  case msgpack::type::BOOLEAN:
    return obj.via.boolean;
  case msgpack::type::POSITIVE_INTEGER:
  case msgpack::type::NEGATIVE_INTEGER:
    return getInt(obj);
  case msgpack::type::FLOAT32:
  case msgpack::type::FLOAT64:
    return obj.via.f64;
  case msgpack::type::STR:
    return getString(obj);
  case msgpack::type::BIN:
    return Bytes(obj.via.bin.ptr, obj.via.bin.ptr + obj.via.bin.size);
  case msgpack::type::ARRAY: {
    List list;
    for (uint32_t i = 0; i < obj.via.array.size; ++i)
      list.push_back(parseValue(obj.via.array.ptr[i]));
    return list;
  }
  case msgpack::type::MAP: {
    Record record;
    forEachEntry(obj, [&](std::string key, const msgpack::object &val) {
      record.set(std::move(key), parseValue(val));
    });
    return record;
  }
  default:
    break;
  }
  fail("unsupported value of type " + std::to_string(obj.type));
}

/// Octets given as msgpack bin or, for JSON input, as a hex string.
static Bytes parseOctets(const msgpack::object &obj) {
  if (obj.type == msgpack::type::BIN)
    return Bytes(obj.via.bin.ptr, obj.via.bin.ptr + obj.via.bin.size);
  auto bytes = decodeHex(getString(obj));
  if (!bytes)
    fail("expected hex string, got '" + getString(obj) + "'");
  return std::move(*bytes);
}

/// DEFAULT values are read with the member's keyword as a hint, since msgpack
/// and JSON have no BIT STRING and JSON has no binary type.
static Value parseDefault(const msgpack::object &obj, std::string_view kind) {
  if (kind == "OCTET STRING")
    return parseOctets(obj);
  if (kind == "BIT STRING") {
    // [contents, number of bits]
    uint32_t size;
    const auto *arr = arrayData(obj, size);
    if (size != 2)
      fail("BIT STRING default should be [bytes, length]");
    int64_t length = getInt(arr[1]);
    if (length < 0)
      fail("BIT STRING default length is negative");
    BitString bits{parseOctets(arr[0]), static_cast<uint64_t>(length)};
    if (!isWellFormedBitString(bits))
      fail("BIT STRING default does not hold " + std::to_string(bits.length) + " bits");
    return bits;
  }
  if (kind == "REAL" && isInt(obj))
    return static_cast<double>(getInt(obj));
  return parseValue(obj);
}

// ── Size constraints ────────────────────────────────────────────────────────

static SizeBound parseSizeBound(const msgpack::object &obj) {
  if (isInt(obj))
    return getInt(obj);
  auto s = getString(obj);
  if (s == "MIN")
    return SizeMin{};
  if (s == "MAX")
    return SizeMax{};
  return s;
}

static SizeConstraint parseSizeConstraint(const msgpack::object &obj) {
  if (obj.type == msgpack::type::ARRAY) {
    uint32_t size;
    const auto *arr = arrayData(obj, size);
    if (size != 2)
      fail("size range should be [lower, upper]");
    return SizeConstraint{parseSizeBound(arr[0]), parseSizeBound(arr[1])};
  }
  SizeBound single = parseSizeBound(obj);
  return SizeConstraint{single, single};
}

// ── Descriptors ─────────────────────────────────────────────────────────────

static TypeDescriptor parseDescriptor(const msgpack::object &obj);

static MemberDescriptor parseMember(const msgpack::object &obj) {
  MemberDescriptor member;
  member.name = getString(mapReq(obj, "name"));
  if (member.isExtensionMarker())
    return member;

  member.descriptor = parseDescriptor(obj);
  const auto *opt = mapGet(obj, "optional");
  if (opt && !isNil(*opt))
    member.optional = getBool(*opt);
  const auto *def = mapGet(obj, "default");
  if (def && !isNil(*def))
    member.default_value = parseDefault(*def, member.descriptor.kind);
  return member;
}

static void parseEnumValues(const msgpack::object &obj, TypeDescriptor &d) {
  uint32_t size;
  const auto *arr = arrayData(obj, size);
  int64_t next = 0;
  for (uint32_t i = 0; i < size; ++i) {
    const auto &entry = arr[i];
    if (entry.type == msgpack::type::STR) {
      auto name = getString(entry);
      if (name == kExtensionMarker) {
        d.values_extensible = true;
        continue;
      }
      // A bare identifier takes the next ordinal.
      d.values.push_back(EnumValue{std::move(name), next++});
      continue;
    }
    uint32_t pairSize;
    const auto *pair = arrayData(entry, pairSize);
    if (pairSize != 2)
      fail("enumeration entry should be [name, ordinal]");
    EnumValue v{getString(pair[0]), getInt(pair[1])};
    next = v.ordinal + 1;
    d.values.push_back(std::move(v));
  }
}

static TypeDescriptor parseDescriptor(const msgpack::object &obj) {
  TypeDescriptor d(getString(mapReq(obj, "type")));

  const auto *members = mapGet(obj, "members");
  if (members && !isNil(*members)) {
    uint32_t size;
    const auto *arr = arrayData(*members, size);
    d.members.reserve(size);
    for (uint32_t i = 0; i < size; ++i)
      d.members.push_back(parseMember(arr[i]));
  }

  const auto *element = mapGet(obj, "element");
  if (element && !isNil(*element))
    d.element = std::make_unique<TypeDescriptor>(parseDescriptor(*element));

  const auto *values = mapGet(obj, "values");
  if (values && !isNil(*values))
    parseEnumValues(*values, d);

  const auto *size = mapGet(obj, "size");
  if (size && !isNil(*size)) {
    uint32_t count;
    const auto *arr = arrayData(*size, count);
    for (uint32_t i = 0; i < count; ++i)
      d.size.push_back(parseSizeConstraint(arr[i]));
  }
  return d;
}

// ── Modules ─────────────────────────────────────────────────────────────────

static ModuleDescriptor parseModule(const msgpack::object &obj) {
  ModuleDescriptor m;
  forEachEntry(mapReq(obj, "types"), [&](std::string name, const msgpack::object &val) {
    m.types.emplace(std::move(name), parseDescriptor(val));
  });

  const auto *values = mapGet(obj, "values");
  if (values && !isNil(*values)) {
    // Only integer value assignments matter here (SIZE bounds); skip others.
    forEachEntry(*values, [&](std::string name, const msgpack::object &val) {
      if (isInt(val))
        m.values.emplace(std::move(name), getInt(val));
    });
  }

  const auto *imports = mapGet(obj, "imports");
  if (imports && !isNil(*imports)) {
    forEachEntry(*imports, [&](std::string from, const msgpack::object &val) {
      uint32_t size;
      const auto *arr = arrayData(val, size);
      auto &names = m.imports[std::move(from)];
      for (uint32_t i = 0; i < size; ++i)
        names.push_back(getString(arr[i]));
    });
  }
  return m;
}

static Specification parseSpecification(const msgpack::object &obj) {
  Specification spec;
  forEachEntry(obj, [&](std::string name, const msgpack::object &val) {
    spec.emplace(std::move(name), parseModule(val));
  });
  return spec;
}

// ── Public API ──────────────────────────────────────────────────────────────

Specification parseMsgpackSpecification(const uint8_t *data, size_t size) {
  try {
    msgpack::object_handle oh = msgpack::unpack(reinterpret_cast<const char *>(data), size);
    return parseSpecification(oh.get());
  } catch (const msgpack::unpack_error &e) {
    fail(std::string("invalid msgpack: ") + e.what());
  } catch (const msgpack::size_overflow &e) {
    fail(std::string("invalid msgpack: ") + e.what());
  }
}

Specification parseJsonSpecification(const uint8_t *data, size_t size) {
  // Parse JSON, convert to msgpack bytes, then reuse the msgpack reader.
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(data, data + size);
  } catch (const nlohmann::json::exception &e) {
    fail(std::string("invalid JSON: ") + e.what());
  }
  auto msgpackBytes = nlohmann::json::to_msgpack(j);
  return parseMsgpackSpecification(msgpackBytes.data(), msgpackBytes.size());
}

} // namespace asn1jer
