//===- value.h - Native value model for asn1jer -----------------*- C++ -*-===//
//
// Values handed to and returned by the codec. A Value is a tagged variant that
// mirrors the shapes ASN.1 types take:
//
//   INTEGER / REAL / BOOLEAN / NULL  → int64_t / double / bool / Null
//   string kinds, ENUMERATED, OID    → std::string
//   OCTET STRING                     → Bytes
//   BIT STRING                       → BitString (bytes + bit length)
//   SEQUENCE OF / SET OF             → List
//   SEQUENCE / SET / CHOICE          → Record (ordered name → Value entries)
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace asn1jer {

struct Null {
  bool operator==(const Null &) const = default;
};

using Bytes = std::vector<uint8_t>;

/// BIT STRING contents. Bits are packed MSB-first; `length` counts bits and
/// the unused trailing bits of the last byte are zero.
struct BitString {
  Bytes bytes;
  uint64_t length = 0;

  bool operator==(const BitString &) const = default;
};

struct Value;
struct RecordEntry;

using List = std::vector<Value>;

/// Ordered field mapping. Names are unique; lookups are linear, which is fine
/// for the member counts ASN.1 schemas have.
struct Record {
  std::vector<RecordEntry> entries;

  Record() = default;
  Record(std::initializer_list<RecordEntry> init);

  bool empty() const { return entries.empty(); }
  size_t size() const { return entries.size(); }

  bool contains(std::string_view name) const { return find(name) != nullptr; }
  const Value *find(std::string_view name) const;
  Value *find(std::string_view name);

  /// Insert or replace `name`, keeping first-insertion order.
  void set(std::string name, Value value);

  bool operator==(const Record &other) const;
};

struct Value {
  std::variant<Null, bool, int64_t, double, std::string, Bytes, BitString, List, Record> kind;

  Value() : kind(Null{}) {}
  Value(Null) : kind(Null{}) {}
  Value(std::nullptr_t) : kind(Null{}) {}
  Value(bool b) : kind(b) {}
  Value(int i) : kind(static_cast<int64_t>(i)) {}
  Value(int64_t i) : kind(i) {}
  Value(double d) : kind(d) {}
  Value(const char *s) : kind(std::string(s)) {}
  Value(std::string s) : kind(std::move(s)) {}
  Value(Bytes b) : kind(std::move(b)) {}
  Value(BitString b) : kind(std::move(b)) {}
  Value(List l) : kind(std::move(l)) {}
  Value(Record r) : kind(std::move(r)) {}

  bool isNull() const { return std::holds_alternative<Null>(kind); }
  bool isRecord() const { return std::holds_alternative<Record>(kind); }
  bool isList() const { return std::holds_alternative<List>(kind); }

  template <typename T> const T *getIf() const { return std::get_if<T>(&kind); }
  template <typename T> T *getIf() { return std::get_if<T>(&kind); }

  bool operator==(const Value &other) const { return kind == other.kind; }
  bool operator!=(const Value &other) const { return !(*this == other); }
};

struct RecordEntry {
  std::string name;
  Value value;

  bool operator==(const RecordEntry &) const = default;
};

/// Short name of the alternative a value holds ("integer", "record", ...).
const char *valueKindName(const Value &value);

/// Render a value in ASN.1 value notation, e.g. `{ id 7, tag '0A'H }`.
std::string formatValue(const Value &value);

} // namespace asn1jer
