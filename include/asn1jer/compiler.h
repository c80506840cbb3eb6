//===- compiler.h - Descriptor-to-TypeNode schema compiler ------*- C++ -*-===//
//
// Declares SchemaCompiler, which turns TypeDescriptors into TypeNodes in a
// Schema arena. Named-type references are memoized by (module, type name):
// each named type is compiled once and every reference to it shares the same
// node, which is what lets self-referential types compile.
//
//===----------------------------------------------------------------------===//

#ifndef ASN1JER_COMPILER_H
#define ASN1JER_COMPILER_H

#include "asn1jer/descriptor.h"
#include "asn1jer/error.h"
#include "asn1jer/resolver.h"
#include "asn1jer/type_node.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace asn1jer {

struct CompileOptions {
  unsigned max_depth = 512;         // descriptor nesting limit
  bool quarantine_failures = false; // record failing types and keep going
};

class SchemaCompiler {
public:
  SchemaCompiler(const TypeResolver &resolver, const SizeConstraintExtractor &sizes,
                 CompileOptions options = {});

  /// Compile one top-level type. If it fails, everything compiled during the
  /// attempt is discarded and types compiled earlier stay usable.
  /// Throws asn1jer::Error.
  NodeId compile(const std::string &moduleName, const std::string &typeName,
                 const TypeDescriptor &descriptor);

  /// Hand the compiled arena over. The compiler must not be used afterwards.
  std::shared_ptr<const Schema> finish();

private:
  NodeId compileType(const TypeDescriptor &descriptor, const std::string &moduleName,
                     unsigned depth);
  void compileInto(NodeId slot, const TypeDescriptor &descriptor, const std::string &moduleName,
                   unsigned depth);
  NodeId compileNamed(const std::string &typeName, const std::string &moduleName, unsigned depth);

  struct Members {
    std::vector<Field> fields;
    bool extensible = false;
  };
  Members compileMembers(const std::vector<MemberDescriptor> &members,
                         const std::string &moduleName, bool isChoice, unsigned depth);
  EnumeratedType compileEnumerated(const TypeDescriptor &descriptor);
  Value normalizeDefault(NodeId node, const Value &value) const;

  NodeId reserve();
  void checkDepth(unsigned depth) const;
  [[noreturn]] void fail(ErrorKind kind, const std::string &msg) const;
  std::string currentPath() const;

  const TypeResolver &resolver;
  const SizeConstraintExtractor &sizes;
  CompileOptions options;

  std::vector<std::optional<TypeNode>> slots;
  std::map<std::pair<std::string, std::string>, NodeId> memo; // (module, type) → node
  std::map<std::string, std::map<std::string, NodeId>> roots;
  std::vector<std::string> path; // Module.Type.member... for diagnostics
};

} // namespace asn1jer

#endif // ASN1JER_COMPILER_H
