//===- descriptor.h - ASN.1 type descriptor records -------------*- C++ -*-===//
//
// The schema front end parses ASN.1 modules into these records. They are the
// input of the schema compiler and are never modified by it.
//
// A TypeDescriptor whose `kind` is not a built-in ASN.1 keyword refers to a
// type by name; `kind` then holds the referenced type name, which is looked up
// in the owning module and its imports.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "asn1jer/value.h"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace asn1jer {

/// Member name that marks the start of the extension addition group.
inline constexpr std::string_view kExtensionMarker = "...";

// ── Size constraints ──────────────────────────────────────────────────────

struct SizeMin {};
struct SizeMax {};

/// One bound of a SIZE constraint: a number, a named value defined in the
/// module (e.g. `ub-name`), or MIN/MAX.
using SizeBound = std::variant<int64_t, std::string, SizeMin, SizeMax>;

/// SIZE (n) has lower == upper; SIZE (a..b) has both.
struct SizeConstraint {
  SizeBound lower;
  SizeBound upper;
};

// ── Type descriptors ──────────────────────────────────────────────────────

struct MemberDescriptor;

struct EnumValue {
  std::string name;
  int64_t ordinal;
};

struct TypeDescriptor {
  std::string kind;
  std::vector<MemberDescriptor> members;   // SEQUENCE, SET, CHOICE
  std::unique_ptr<TypeDescriptor> element; // SEQUENCE OF, SET OF
  std::vector<EnumValue> values;           // ENUMERATED
  bool values_extensible = false;          // ENUMERATED { a, b, ... }
  std::vector<SizeConstraint> size;

  TypeDescriptor() = default;
  explicit TypeDescriptor(std::string kind) : kind(std::move(kind)) {}
};

struct MemberDescriptor {
  std::string name;
  TypeDescriptor descriptor;
  bool optional = false;
  std::optional<Value> default_value;

  bool isExtensionMarker() const { return name == kExtensionMarker; }
};

struct ModuleDescriptor {
  std::map<std::string, TypeDescriptor> types;
  std::map<std::string, int64_t> values;
  /// Source module → type names imported from it.
  std::map<std::string, std::vector<std::string>> imports;
};

/// Module name → module.
using Specification = std::map<std::string, ModuleDescriptor>;

/// True if `kind` is an ASN.1 keyword handled by the compiler, false if it
/// names a type.
bool isBuiltinKind(std::string_view kind);

} // namespace asn1jer
