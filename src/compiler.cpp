//===- compiler.cpp - Descriptor-to-TypeNode schema compiler --------------===//
//
// Recursive descent over TypeDescriptors. Built-in keywords compile to their
// node variant; any other kind is a named-type reference resolved through the
// TypeResolver and memoized, so every named type gets exactly one node.
//
// Slots are reserved before their contents are compiled. A reference back to
// a type still being compiled therefore finds its (not yet filled) slot and
// the recursion stops there.
//
//===----------------------------------------------------------------------===//

#include "asn1jer/compiler.h"
#include "text_helpers.h"

#include <algorithm>
#include <set>
#include <utility>

namespace asn1jer {

// ── Keywords ────────────────────────────────────────────────────────────────

namespace {

enum class Keyword {
  Integer,
  Real,
  Boolean,
  Null,
  Enumerated,
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
  BitString,
  OctetString,
  ObjectIdentifier,
  Sequence,
  Set,
  Choice,
  SequenceOf,
  SetOf,
  Any,
};

std::optional<Keyword> keywordOf(std::string_view s) {
  if (s == "INTEGER")
    return Keyword::Integer;
  if (s == "REAL")
    return Keyword::Real;
  if (s == "BOOLEAN")
    return Keyword::Boolean;
  if (s == "NULL")
    return Keyword::Null;
  if (s == "ENUMERATED")
    return Keyword::Enumerated;
  if (s == "IA5String")
    return Keyword::IA5String;
  if (s == "NumericString")
    return Keyword::NumericString;
  if (s == "PrintableString")
    return Keyword::PrintableString;
  if (s == "UniversalString")
    return Keyword::UniversalString;
  if (s == "VisibleString")
    return Keyword::VisibleString;
  if (s == "UTF8String")
    return Keyword::UTF8String;
  if (s == "BMPString")
    return Keyword::BMPString;
  if (s == "TeletexString")
    return Keyword::TeletexString;
  if (s == "UTCTime")
    return Keyword::UTCTime;
  if (s == "GeneralizedTime")
    return Keyword::GeneralizedTime;
  if (s == "BIT STRING")
    return Keyword::BitString;
  if (s == "OCTET STRING")
    return Keyword::OctetString;
  if (s == "OBJECT IDENTIFIER")
    return Keyword::ObjectIdentifier;
  if (s == "SEQUENCE")
    return Keyword::Sequence;
  if (s == "SET")
    return Keyword::Set;
  if (s == "CHOICE")
    return Keyword::Choice;
  if (s == "SEQUENCE OF")
    return Keyword::SequenceOf;
  if (s == "SET OF")
    return Keyword::SetOf;
  if (s == "ANY" || s == "ANY DEFINED BY")
    return Keyword::Any;
  return std::nullopt;
}

TypeNode stringNode(StringKind kind) {
  return TypeNode{StringType{kind}};
}

} // namespace

bool isBuiltinKind(std::string_view kind) {
  return keywordOf(kind).has_value();
}

// ── SchemaCompiler ──────────────────────────────────────────────────────────

SchemaCompiler::SchemaCompiler(const TypeResolver &resolver, const SizeConstraintExtractor &sizes,
                               CompileOptions options)
    : resolver(resolver), sizes(sizes), options(options) {}

NodeId SchemaCompiler::compile(const std::string &moduleName, const std::string &typeName,
                               const TypeDescriptor &descriptor) {
  auto key = std::make_pair(moduleName, typeName);
  if (auto it = memo.find(key); it != memo.end()) {
    // Already compiled as the target of an earlier reference.
    roots[moduleName][typeName] = it->second;
    return it->second;
  }

  const size_t mark = slots.size();
  path.assign(1, moduleName + "." + typeName);
  try {
    NodeId id;
    if (isBuiltinKind(descriptor.kind)) {
      id = reserve();
      memo[key] = id;
      compileInto(id, descriptor, moduleName, 0);
    } else {
      // `A ::= B`: A shares B's node.
      id = compileNamed(descriptor.kind, moduleName, 0);
      memo[key] = id;
    }
    roots[moduleName][typeName] = id;
    path.clear();
    return id;
  } catch (...) {
    // Discard everything compiled during this attempt: the reserved slots may
    // be unfilled, and finished nodes may point at them.
    for (auto it = memo.begin(); it != memo.end();) {
      if (it->second >= mark)
        it = memo.erase(it);
      else
        ++it;
    }
    slots.resize(mark);
    path.clear();
    throw;
  }
}

std::shared_ptr<const Schema> SchemaCompiler::finish() {
  auto schema = std::make_shared<Schema>();
  schema->nodes.reserve(slots.size());
  for (size_t i = 0; i < slots.size(); ++i) {
    if (!slots[i])
      throw Error(ErrorKind::InvalidDescriptor,
                  "internal: node #" + std::to_string(i) + " was never compiled");
    schema->nodes.push_back(std::move(*slots[i]));
  }
  schema->roots = std::move(roots);
  slots.clear();
  memo.clear();
  return schema;
}

NodeId SchemaCompiler::compileType(const TypeDescriptor &descriptor,
                                   const std::string &moduleName, unsigned depth) {
  if (!isBuiltinKind(descriptor.kind))
    return compileNamed(descriptor.kind, moduleName, depth + 1);
  NodeId id = reserve();
  compileInto(id, descriptor, moduleName, depth + 1);
  return id;
}

NodeId SchemaCompiler::compileNamed(const std::string &typeName, const std::string &moduleName,
                                    unsigned depth) {
  checkDepth(depth);

  // Follow alias chains (`A ::= B`, `B ::= C`) to the first constructed or
  // built-in type. Every name on the chain ends up sharing that node.
  std::vector<std::pair<std::string, std::string>> chain;
  std::string name = typeName;
  std::string module = moduleName;
  NodeId id;
  for (;;) {
    ResolvedType resolved{nullptr, {}};
    try {
      resolved = resolver.resolve(name, module);
    } catch (const Error &e) {
      fail(e.kind(), e.message());
    }

    auto key = std::make_pair(resolved.module, name);
    if (auto it = memo.find(key); it != memo.end()) {
      id = it->second;
      break;
    }
    if (std::find(chain.begin(), chain.end(), key) != chain.end())
      fail(ErrorKind::UnresolvedType, "circular type reference through '" + name + "'");
    chain.push_back(key);

    const TypeDescriptor &target = *resolved.descriptor;
    if (!isBuiltinKind(target.kind)) {
      name = target.kind;
      module = resolved.module;
      continue;
    }

    id = reserve();
    memo[key] = id;
    compileInto(id, target, resolved.module, depth + 1);
    break;
  }

  for (const auto &key : chain)
    memo[key] = id;
  return id;
}

void SchemaCompiler::compileInto(NodeId slot, const TypeDescriptor &descriptor,
                                 const std::string &moduleName, unsigned depth) {
  checkDepth(depth);
  auto keyword = keywordOf(descriptor.kind);
  if (!keyword)
    fail(ErrorKind::InvalidDescriptor, "'" + descriptor.kind + "' is not a built-in type");

  // Children are compiled before the slot is written: compiling them may grow
  // (and reallocate) the slot vector.
  TypeNode node;
  switch (*keyword) {
  case Keyword::Integer:
    node = TypeNode{IntegerType{}};
    break;
  case Keyword::Real:
    node = TypeNode{RealType{}};
    break;
  case Keyword::Boolean:
    node = TypeNode{BooleanType{}};
    break;
  case Keyword::Null:
    node = TypeNode{NullType{}};
    break;
  case Keyword::Enumerated:
    node = TypeNode{compileEnumerated(descriptor)};
    break;
  case Keyword::IA5String:
    node = stringNode(StringKind::IA5String);
    break;
  case Keyword::NumericString:
    node = stringNode(StringKind::NumericString);
    break;
  case Keyword::PrintableString:
    node = stringNode(StringKind::PrintableString);
    break;
  case Keyword::UniversalString:
    node = stringNode(StringKind::UniversalString);
    break;
  case Keyword::VisibleString:
    node = stringNode(StringKind::VisibleString);
    break;
  case Keyword::UTF8String:
    node = stringNode(StringKind::UTF8String);
    break;
  case Keyword::BMPString:
    node = stringNode(StringKind::BMPString);
    break;
  case Keyword::TeletexString:
    node = stringNode(StringKind::TeletexString);
    break;
  case Keyword::UTCTime:
    node = stringNode(StringKind::UTCTime);
    break;
  case Keyword::GeneralizedTime:
    node = stringNode(StringKind::GeneralizedTime);
    break;
  case Keyword::BitString:
    node = TypeNode{BitStringType{sizes.sizeRange(descriptor, moduleName)}};
    break;
  case Keyword::OctetString:
    node = TypeNode{OctetStringType{sizes.sizeRange(descriptor, moduleName)}};
    break;
  case Keyword::ObjectIdentifier:
    node = TypeNode{ObjectIdentifierType{}};
    break;
  case Keyword::Sequence: {
    auto members = compileMembers(descriptor.members, moduleName, false, depth);
    node = TypeNode{SequenceType{std::move(members.fields), members.extensible}};
    break;
  }
  case Keyword::Set: {
    auto members = compileMembers(descriptor.members, moduleName, false, depth);
    node = TypeNode{SetType{std::move(members.fields), members.extensible}};
    break;
  }
  case Keyword::Choice: {
    auto members = compileMembers(descriptor.members, moduleName, true, depth);
    node = TypeNode{ChoiceType{std::move(members.fields), members.extensible}};
    break;
  }
  case Keyword::SequenceOf:
  case Keyword::SetOf: {
    if (!descriptor.element)
      fail(ErrorKind::InvalidDescriptor, descriptor.kind + " has no element type");
    SizeRange size = sizes.sizeRange(descriptor, moduleName);
    NodeId element = compileType(*descriptor.element, moduleName, depth);
    if (*keyword == Keyword::SequenceOf)
      node = TypeNode{SequenceOfType{element, size}};
    else
      node = TypeNode{SetOfType{element, size}};
    break;
  }
  case Keyword::Any:
    node = TypeNode{AnyType{}};
    break;
  }
  slots[slot] = std::move(node);
}

SchemaCompiler::Members SchemaCompiler::compileMembers(const std::vector<MemberDescriptor> &members,
                                                       const std::string &moduleName,
                                                       bool isChoice, unsigned depth) {
  Members result;
  std::set<std::string> seen;
  for (const auto &member : members) {
    if (member.isExtensionMarker()) {
      result.extensible = true;
      continue;
    }
    if (result.extensible)
      fail(ErrorKind::UnsupportedExtension,
           "member '" + member.name + "' follows the extension marker");
    if (!isChoice && !seen.insert(member.name).second)
      fail(ErrorKind::InvalidDescriptor, "duplicate member '" + member.name + "'");

    path.push_back(member.name);
    Field field;
    field.name = member.name;
    field.node = compileType(member.descriptor, moduleName, depth);
    // CHOICE alternatives are never optional and never defaulted.
    if (!isChoice) {
      field.optional = member.optional;
      if (member.default_value)
        field.default_value = normalizeDefault(field.node, *member.default_value);
    }
    path.pop_back();
    result.fields.push_back(std::move(field));
  }
  return result;
}

// A DEFAULT on a member typed by reference is read without knowing what the
// reference resolves to, so hex text, plain integers and [bytes, length] pairs
// are given their native shape here.
Value SchemaCompiler::normalizeDefault(NodeId node, const Value &value) const {
  if (!slots[node])
    return value; // still being compiled: a constructed type
  const auto &kind = slots[node]->kind;

  if (std::holds_alternative<OctetStringType>(kind)) {
    if (value.getIf<Bytes>())
      return value;
    std::optional<Bytes> bytes;
    if (const auto *text = value.getIf<std::string>())
      bytes = decodeHex(*text);
    if (!bytes)
      fail(ErrorKind::InvalidDescriptor, "OCTET STRING default should be a hex string");
    return std::move(*bytes);
  }

  if (std::holds_alternative<RealType>(kind)) {
    if (const auto *i = value.getIf<int64_t>())
      return static_cast<double>(*i);
    return value;
  }

  if (std::holds_alternative<BitStringType>(kind)) {
    if (value.getIf<BitString>())
      return value;
    const auto *pair = value.getIf<List>();
    const int64_t *length = pair && pair->size() == 2 ? (*pair)[1].getIf<int64_t>() : nullptr;
    if (!length || *length < 0)
      fail(ErrorKind::InvalidDescriptor, "BIT STRING default should be [bytes, length]");
    std::optional<Bytes> bytes;
    if (const auto *raw = (*pair)[0].getIf<Bytes>())
      bytes = *raw;
    else if (const auto *text = (*pair)[0].getIf<std::string>())
      bytes = decodeHex(*text);
    BitString bits;
    bits.length = static_cast<uint64_t>(*length);
    if (bytes)
      bits.bytes = std::move(*bytes);
    if (!bytes || !isWellFormedBitString(bits))
      fail(ErrorKind::InvalidDescriptor,
           "BIT STRING default does not hold " + std::to_string(bits.length) + " bits");
    return bits;
  }

  return value;
}

EnumeratedType SchemaCompiler::compileEnumerated(const TypeDescriptor &descriptor) {
  EnumeratedType result;
  result.extensible = descriptor.values_extensible;
  for (const auto &v : descriptor.values) {
    if (!result.ordinals.emplace(v.name, v.ordinal).second)
      fail(ErrorKind::InvalidDescriptor, "duplicate enumeration name '" + v.name + "'");
    if (!result.names.emplace(v.ordinal, v.name).second)
      fail(ErrorKind::InvalidDescriptor,
           "duplicate enumeration ordinal " + std::to_string(v.ordinal));
    result.values.emplace_back(v.ordinal, v.name);
  }
  return result;
}

NodeId SchemaCompiler::reserve() {
  slots.emplace_back();
  return static_cast<NodeId>(slots.size() - 1);
}

void SchemaCompiler::checkDepth(unsigned depth) const {
  if (depth > options.max_depth)
    fail(ErrorKind::DepthLimitExceeded,
         "type nesting exceeds " + std::to_string(options.max_depth) + " levels");
}

void SchemaCompiler::fail(ErrorKind kind, const std::string &msg) const {
  throw Error(kind, msg, currentPath());
}

std::string SchemaCompiler::currentPath() const {
  std::string out;
  for (const auto &part : path) {
    if (!out.empty())
      out += '.';
    out += part;
  }
  return out;
}

} // namespace asn1jer
