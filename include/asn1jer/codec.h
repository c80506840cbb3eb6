//===- codec.h - Public JER codec API ----------------------------*- C++ -*-===//
//
// Compile a Specification once, then encode and decode any of its types:
//
//   auto compiled = asn1jer::compileSpecification(spec);
//   const auto &msg = compiled.type("Foo", "Message");
//   std::vector<uint8_t> wire = msg.encode(value);
//   asn1jer::Value back = msg.decode(wire);
//
// Compiled types share one immutable Schema and are safe to use from several
// threads at once.
//
//===----------------------------------------------------------------------===//

#ifndef ASN1JER_CODEC_H
#define ASN1JER_CODEC_H

#include "asn1jer/compiler.h"
#include "asn1jer/descriptor.h"
#include "asn1jer/error.h"
#include "asn1jer/transcoder.h"
#include "asn1jer/type_node.h"
#include "asn1jer/value.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace asn1jer {

class CompiledType {
public:
  CompiledType(std::shared_ptr<const Schema> schema, NodeId root, std::string name);

  /// Native value → compact UTF-8 JSON.
  std::vector<uint8_t> encode(const Value &value, const CodecOptions &options = {}) const;

  /// UTF-8 JSON → native value.
  Value decode(const uint8_t *data, size_t size, const CodecOptions &options = {}) const;
  Value decode(const std::vector<uint8_t> &data, const CodecOptions &options = {}) const {
    return decode(data.data(), data.size(), options);
  }

  /// The JSON document stage on its own, for callers that embed the value in
  /// a larger document.
  nlohmann::ordered_json encodeJson(const Value &value, const CodecOptions &options = {}) const;
  Value decodeJson(const nlohmann::ordered_json &document,
                   const CodecOptions &options = {}) const;

  const std::string &name() const { return typeName; }
  NodeId root() const { return rootId; }
  const TypeNode &node() const { return schema->node(rootId); }
  std::string describe() const { return schema->describe(rootId, typeName); }

private:
  std::shared_ptr<const Schema> schema;
  NodeId rootId;
  std::string typeName;
};

/// A type that failed to compile while quarantining failures.
struct CompileFailure {
  std::string module;
  std::string type;
  Error error;
};

class CompiledSpecification {
public:
  CompiledSpecification(std::shared_ptr<const Schema> schema,
                        std::map<std::string, std::map<std::string, CompiledType>> modules,
                        std::vector<CompileFailure> failures);

  /// Throws Error(UnresolvedType) if the type was not compiled.
  const CompiledType &type(const std::string &moduleName, const std::string &typeName) const;
  const CompiledType *find(const std::string &moduleName, const std::string &typeName) const;

  const std::map<std::string, std::map<std::string, CompiledType>> &modules() const {
    return compiled;
  }
  const std::vector<CompileFailure> &failures() const { return failed; }
  const Schema &schema() const { return *shared; }

private:
  std::shared_ptr<const Schema> shared;
  std::map<std::string, std::map<std::string, CompiledType>> compiled;
  std::vector<CompileFailure> failed;
};

/// Compile every type of every module using the default resolver and size
/// extractor. Throws asn1jer::Error on the first failure unless
/// `options.quarantine_failures` is set.
CompiledSpecification compileSpecification(const Specification &spec,
                                           const CompileOptions &options = {});

/// Same, with caller-supplied collaborators.
CompiledSpecification compileSpecification(const Specification &spec,
                                           const TypeResolver &resolver,
                                           const SizeConstraintExtractor &sizes,
                                           const CompileOptions &options = {});

} // namespace asn1jer

#endif // ASN1JER_CODEC_H
