//===- type_node.h - Compiled ASN.1 type nodes ------------------*- C++ -*-===//
//
// The schema compiler turns descriptors into TypeNodes stored in a Schema
// arena. Nodes refer to their children by NodeId rather than owning them, so a
// named type used in several places is compiled once, and a recursive type
// (`A ::= SEQUENCE { next A OPTIONAL }`) refers back to its own slot.
//
// A Schema is immutable once compiled and may be shared between threads.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "asn1jer/resolver.h"
#include "asn1jer/value.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace asn1jer {

using NodeId = uint32_t;

// ── Fields ────────────────────────────────────────────────────────────────

/// A named member of a SEQUENCE, SET or CHOICE. The name lives here rather
/// than on the node because a node may be shared by several members.
struct Field {
  std::string name;
  NodeId node;
  bool optional = false;
  std::optional<Value> default_value;
};

// ── Node variants ─────────────────────────────────────────────────────────

struct IntegerType {};
struct RealType {};
struct BooleanType {};
struct NullType {};

/// ENUMERATED: the declared (ordinal, name) pairs, indexed both ways.
struct EnumeratedType {
  std::vector<std::pair<int64_t, std::string>> values; // declaration order
  std::map<int64_t, std::string> names;
  std::unordered_map<std::string, int64_t> ordinals;
  bool extensible = false;
};

/// Character string and time types. All share the pass-through mapping; the
/// kind is kept so a compiled type reports what it was declared as.
enum class StringKind {
  IA5String,
  NumericString,
  PrintableString,
  UniversalString,
  VisibleString,
  UTF8String,
  BMPString,
  TeletexString,
  UTCTime,
  GeneralizedTime,
};

struct StringType {
  StringKind kind;
};

struct BitStringType {
  SizeRange size;
};
struct OctetStringType {
  SizeRange size;
};
struct ObjectIdentifierType {};

struct SequenceType {
  std::vector<Field> fields;
  bool extensible = false;
};
struct SetType {
  std::vector<Field> fields;
  bool extensible = false;
};
struct ChoiceType {
  std::vector<Field> alternatives;
  bool extensible = false;
};

/// The size range is kept for the binary encodings sharing these nodes; the
/// JSON mapping does not use it.
struct SequenceOfType {
  NodeId element;
  SizeRange size;
};
struct SetOfType {
  NodeId element;
  SizeRange size;
};

/// ANY / ANY DEFINED BY: an open type carried through unchanged.
struct AnyType {};

struct TypeNode {
  std::variant<IntegerType, RealType, BooleanType, NullType, EnumeratedType, StringType,
               BitStringType, OctetStringType, ObjectIdentifierType, SequenceType, SetType,
               ChoiceType, SequenceOfType, SetOfType, AnyType>
      kind;
};

/// ASN.1 keyword of a compiled node ("SEQUENCE OF", "UTF8String", ...).
const char *typeNodeKeyword(const TypeNode &node);
const char *stringKindName(StringKind kind);

// ── Schema ────────────────────────────────────────────────────────────────

class Schema {
public:
  const TypeNode &node(NodeId id) const { return nodes.at(id); }
  size_t size() const { return nodes.size(); }

  /// Top-level type lookup; returns nullopt if the type was not compiled.
  std::optional<NodeId> find(const std::string &moduleName, const std::string &typeName) const;

  /// Module name → type name → root node of every compiled top-level type.
  const std::map<std::string, std::map<std::string, NodeId>> &types() const { return roots; }

  /// Render the tree below `id`, e.g. `Sequence([Integer(a), Boolean(b) OPTIONAL])`.
  /// A node reached again through recursion prints as `<#id>`.
  std::string describe(NodeId id, const std::string &name = {}) const;

private:
  friend class SchemaCompiler;

  std::vector<TypeNode> nodes;
  std::map<std::string, std::map<std::string, NodeId>> roots;
};

} // namespace asn1jer
