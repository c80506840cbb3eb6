//===- type_node.cpp - Compiled ASN.1 type nodes --------------------------===//

#include "asn1jer/type_node.h"

#include <set>
#include <type_traits>

namespace asn1jer {

const char *stringKindName(StringKind kind) {
  switch (kind) {
  case StringKind::IA5String:
    return "IA5String";
  case StringKind::NumericString:
    return "NumericString";
  case StringKind::PrintableString:
    return "PrintableString";
  case StringKind::UniversalString:
    return "UniversalString";
  case StringKind::VisibleString:
    return "VisibleString";
  case StringKind::UTF8String:
    return "UTF8String";
  case StringKind::BMPString:
    return "BMPString";
  case StringKind::TeletexString:
    return "TeletexString";
  case StringKind::UTCTime:
    return "UTCTime";
  case StringKind::GeneralizedTime:
    return "GeneralizedTime";
  }
  return "?";
}

const char *typeNodeKeyword(const TypeNode &node) {
  return std::visit(
      [](const auto &n) -> const char * {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, IntegerType>)
          return "INTEGER";
        else if constexpr (std::is_same_v<T, RealType>)
          return "REAL";
        else if constexpr (std::is_same_v<T, BooleanType>)
          return "BOOLEAN";
        else if constexpr (std::is_same_v<T, NullType>)
          return "NULL";
        else if constexpr (std::is_same_v<T, EnumeratedType>)
          return "ENUMERATED";
        else if constexpr (std::is_same_v<T, StringType>)
          return stringKindName(n.kind);
        else if constexpr (std::is_same_v<T, BitStringType>)
          return "BIT STRING";
        else if constexpr (std::is_same_v<T, OctetStringType>)
          return "OCTET STRING";
        else if constexpr (std::is_same_v<T, ObjectIdentifierType>)
          return "OBJECT IDENTIFIER";
        else if constexpr (std::is_same_v<T, SequenceType>)
          return "SEQUENCE";
        else if constexpr (std::is_same_v<T, SetType>)
          return "SET";
        else if constexpr (std::is_same_v<T, ChoiceType>)
          return "CHOICE";
        else if constexpr (std::is_same_v<T, SequenceOfType>)
          return "SEQUENCE OF";
        else if constexpr (std::is_same_v<T, SetOfType>)
          return "SET OF";
        else if constexpr (std::is_same_v<T, AnyType>)
          return "ANY";
        else
          static_assert(sizeof(T) == 0, "unhandled TypeNode variant");
      },
      node.kind);
}

std::optional<NodeId> Schema::find(const std::string &moduleName,
                                   const std::string &typeName) const {
  auto mod = roots.find(moduleName);
  if (mod == roots.end())
    return std::nullopt;
  auto it = mod->second.find(typeName);
  if (it == mod->second.end())
    return std::nullopt;
  return it->second;
}

// ── describe() ──────────────────────────────────────────────────────────────

namespace {

class Describer {
public:
  explicit Describer(const Schema &schema) : schema(schema) {}

  void node(NodeId id, const std::string &name) {
    if (active.count(id)) {
      out += "<#" + std::to_string(id) + ">";
      if (!name.empty())
        out += "(" + name + ")";
      return;
    }
    active.insert(id);
    std::visit([&](const auto &n) { visit(n, name); }, schema.node(id).kind);
    active.erase(id);
  }

  std::string out;

private:
  void leaf(const char *label, const std::string &name) {
    out += label;
    out += "(" + name + ")";
  }

  void fields(const char *label, const std::string &name, const std::vector<Field> &list,
              bool extensible) {
    out += label;
    out += "(";
    if (!name.empty())
      out += name + ", ";
    out += "[";
    for (size_t i = 0; i < list.size(); ++i) {
      if (i)
        out += ", ";
      node(list[i].node, list[i].name);
      if (list[i].optional)
        out += " OPTIONAL";
      if (list[i].default_value)
        out += " DEFAULT " + formatValue(*list[i].default_value);
    }
    if (extensible)
      out += list.empty() ? "..." : ", ...";
    out += "])";
  }

  void visit(const IntegerType &, const std::string &name) { leaf("Integer", name); }
  void visit(const RealType &, const std::string &name) { leaf("Real", name); }
  void visit(const BooleanType &, const std::string &name) { leaf("Boolean", name); }
  void visit(const NullType &, const std::string &name) { leaf("Null", name); }
  void visit(const EnumeratedType &, const std::string &name) { leaf("Enumerated", name); }
  void visit(const StringType &n, const std::string &name) { leaf(stringKindName(n.kind), name); }
  void visit(const BitStringType &, const std::string &name) { leaf("BitString", name); }
  void visit(const OctetStringType &, const std::string &name) { leaf("OctetString", name); }
  void visit(const ObjectIdentifierType &, const std::string &name) {
    leaf("ObjectIdentifier", name);
  }
  void visit(const AnyType &, const std::string &name) { leaf("Any", name); }

  void visit(const SequenceType &n, const std::string &name) {
    fields("Sequence", name, n.fields, n.extensible);
  }
  void visit(const SetType &n, const std::string &name) {
    fields("Set", name, n.fields, n.extensible);
  }
  void visit(const ChoiceType &n, const std::string &name) {
    fields("Choice", name, n.alternatives, n.extensible);
  }

  void visit(const SequenceOfType &n, const std::string &name) {
    out += "SequenceOf(" + name + ", ";
    node(n.element, "");
    out += ")";
  }
  void visit(const SetOfType &n, const std::string &name) {
    out += "SetOf(" + name + ", ";
    node(n.element, "");
    out += ")";
  }

  const Schema &schema;
  std::set<NodeId> active;
};

} // namespace

std::string Schema::describe(NodeId id, const std::string &name) const {
  Describer d(*this);
  d.node(id, name);
  return d.out;
}

} // namespace asn1jer
