//===- resolver.h - Named-type and size-constraint lookup -------*- C++ -*-===//
//
// Collaborators the schema compiler consults while compiling descriptors:
//
//   TypeResolver             (typeName, moduleName) → (descriptor, module)
//   SizeConstraintExtractor  (descriptor, moduleName) → SizeRange
//
// Both have default implementations over a Specification. A front end with its
// own module registry can supply its own.
//
//===----------------------------------------------------------------------===//

#ifndef ASN1JER_RESOLVER_H
#define ASN1JER_RESOLVER_H

#include "asn1jer/descriptor.h"

#include <cstdint>
#include <optional>
#include <string>

namespace asn1jer {

/// A named type found by the resolver. `descriptor` points into storage owned
/// by the resolver and outlives the compilation.
struct ResolvedType {
  const TypeDescriptor *descriptor;
  std::string module;
};

/// Inclusive size range; an absent bound is unconstrained (MIN/MAX).
struct SizeRange {
  std::optional<int64_t> min;
  std::optional<int64_t> max;

  bool isFixed() const { return min && max && *min == *max; }
  bool operator==(const SizeRange &) const = default;
};

class TypeResolver {
public:
  virtual ~TypeResolver() = default;

  /// Look up `typeName` as seen from `moduleName`.
  /// Throws Error(UnresolvedType) if the name is not visible there.
  virtual ResolvedType resolve(const std::string &typeName, const std::string &moduleName) const = 0;
};

class SizeConstraintExtractor {
public:
  virtual ~SizeConstraintExtractor() = default;

  virtual SizeRange sizeRange(const TypeDescriptor &descriptor,
                              const std::string &moduleName) const = 0;
};

/// Resolves names against a Specification: the module's own types first, then
/// the types it imports, following imports transitively.
class SpecificationResolver : public TypeResolver {
public:
  explicit SpecificationResolver(const Specification &spec) : spec(spec) {}

  ResolvedType resolve(const std::string &typeName, const std::string &moduleName) const override;

private:
  const Specification &spec;
};

/// Reads the first SIZE constraint of a descriptor, resolving named bounds
/// through the module's value assignments and imports.
class SpecificationSizeExtractor : public SizeConstraintExtractor {
public:
  explicit SpecificationSizeExtractor(const Specification &spec) : spec(spec) {}

  SizeRange sizeRange(const TypeDescriptor &descriptor,
                      const std::string &moduleName) const override;

private:
  std::optional<int64_t> bound(const SizeBound &b, const std::string &moduleName) const;
  std::optional<int64_t> lookupValue(const std::string &name, const std::string &moduleName,
                                     int hops) const;

  const Specification &spec;
};

} // namespace asn1jer

#endif // ASN1JER_RESOLVER_H
