//===- codec.cpp - Public JER codec API -----------------------------------===//

#include "asn1jer/codec.h"
#include "asn1jer/wire.h"

#include <utility>

namespace asn1jer {

// ── CompiledType ────────────────────────────────────────────────────────────

CompiledType::CompiledType(std::shared_ptr<const Schema> schema, NodeId root, std::string name)
    : schema(std::move(schema)), rootId(root), typeName(std::move(name)) {}

nlohmann::ordered_json CompiledType::encodeJson(const Value &value,
                                                const CodecOptions &options) const {
  Transcoder transcoder(*schema, options, typeName);
  return transcoder.encode(rootId, value);
}

Value CompiledType::decodeJson(const nlohmann::ordered_json &document,
                               const CodecOptions &options) const {
  Transcoder transcoder(*schema, options, typeName);
  return transcoder.decode(rootId, document);
}

std::vector<uint8_t> CompiledType::encode(const Value &value, const CodecOptions &options) const {
  return serialize(encodeJson(value, options));
}

Value CompiledType::decode(const uint8_t *data, size_t size, const CodecOptions &options) const {
  return decodeJson(deserialize(data, size), options);
}

// ── CompiledSpecification ───────────────────────────────────────────────────

CompiledSpecification::CompiledSpecification(
    std::shared_ptr<const Schema> schema,
    std::map<std::string, std::map<std::string, CompiledType>> modules,
    std::vector<CompileFailure> failures)
    : shared(std::move(schema)), compiled(std::move(modules)), failed(std::move(failures)) {}

const CompiledType *CompiledSpecification::find(const std::string &moduleName,
                                                const std::string &typeName) const {
  auto mod = compiled.find(moduleName);
  if (mod == compiled.end())
    return nullptr;
  auto it = mod->second.find(typeName);
  return it == mod->second.end() ? nullptr : &it->second;
}

const CompiledType &CompiledSpecification::type(const std::string &moduleName,
                                                const std::string &typeName) const {
  if (const auto *t = find(moduleName, typeName))
    return *t;
  throw Error(ErrorKind::UnresolvedType,
              "type '" + typeName + "' was not compiled in module '" + moduleName + "'");
}

// ── compileSpecification ────────────────────────────────────────────────────

CompiledSpecification compileSpecification(const Specification &spec,
                                           const TypeResolver &resolver,
                                           const SizeConstraintExtractor &sizes,
                                           const CompileOptions &options) {
  SchemaCompiler compiler(resolver, sizes, options);
  std::vector<CompileFailure> failures;

  for (const auto &[moduleName, module] : spec) {
    for (const auto &[typeName, descriptor] : module.types) {
      try {
        compiler.compile(moduleName, typeName, descriptor);
      } catch (const Error &e) {
        if (!options.quarantine_failures)
          throw;
        failures.push_back(CompileFailure{moduleName, typeName, e});
      }
    }
  }

  auto schema = compiler.finish();
  std::map<std::string, std::map<std::string, CompiledType>> modules;
  for (const auto &[moduleName, types] : schema->types())
    for (const auto &[typeName, id] : types)
      modules[moduleName].emplace(typeName, CompiledType(schema, id, typeName));
  return CompiledSpecification(std::move(schema), std::move(modules), std::move(failures));
}

CompiledSpecification compileSpecification(const Specification &spec,
                                           const CompileOptions &options) {
  SpecificationResolver resolver(spec);
  SpecificationSizeExtractor sizes(spec);
  return compileSpecification(spec, resolver, sizes, options);
}

} // namespace asn1jer
