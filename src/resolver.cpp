//===- resolver.cpp - Named-type and size-constraint lookup ---------------===//

#include "asn1jer/resolver.h"
#include "asn1jer/error.h"

#include <algorithm>
#include <set>
#include <type_traits>

namespace asn1jer {

// ── Named types ─────────────────────────────────────────────────────────────

static bool lookupType(const Specification &spec, const std::string &typeName,
                       const std::string &moduleName, std::set<std::string> &visited,
                       ResolvedType &out) {
  if (!visited.insert(moduleName).second)
    return false; // import cycle between modules
  auto mod = spec.find(moduleName);
  if (mod == spec.end())
    return false;

  auto it = mod->second.types.find(typeName);
  if (it != mod->second.types.end()) {
    out = ResolvedType{&it->second, moduleName};
    return true;
  }

  for (const auto &[fromModule, names] : mod->second.imports) {
    if (std::find(names.begin(), names.end(), typeName) == names.end())
      continue;
    if (lookupType(spec, typeName, fromModule, visited, out))
      return true;
  }
  return false;
}

ResolvedType SpecificationResolver::resolve(const std::string &typeName,
                                            const std::string &moduleName) const {
  if (spec.find(moduleName) == spec.end())
    throw Error(ErrorKind::UnresolvedType, "module '" + moduleName + "' not found");
  std::set<std::string> visited;
  ResolvedType result{nullptr, {}};
  if (!lookupType(spec, typeName, moduleName, visited, result))
    throw Error(ErrorKind::UnresolvedType,
                "type '" + typeName + "' not found in module '" + moduleName + "' or its imports");
  return result;
}

// ── Size constraints ────────────────────────────────────────────────────────

SizeRange SpecificationSizeExtractor::sizeRange(const TypeDescriptor &descriptor,
                                                const std::string &moduleName) const {
  if (descriptor.size.empty())
    return {};
  const auto &first = descriptor.size.front();
  return SizeRange{bound(first.lower, moduleName), bound(first.upper, moduleName)};
}

std::optional<int64_t> SpecificationSizeExtractor::bound(const SizeBound &b,
                                                         const std::string &moduleName) const {
  return std::visit(
      [&](const auto &v) -> std::optional<int64_t> {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, int64_t>) {
          return v;
        } else if constexpr (std::is_same_v<T, std::string>) {
          auto value = lookupValue(v, moduleName, 0);
          if (!value)
            throw Error(ErrorKind::InvalidDescriptor,
                        "size bound '" + v + "' is not a value defined in module '" + moduleName +
                            "'");
          return value;
        } else {
          return std::nullopt; // MIN / MAX
        }
      },
      b);
}

std::optional<int64_t> SpecificationSizeExtractor::lookupValue(const std::string &name,
                                                               const std::string &moduleName,
                                                               int hops) const {
  // Import chains are short; the hop limit only protects against cycles.
  if (hops > 16)
    return std::nullopt;
  auto mod = spec.find(moduleName);
  if (mod == spec.end())
    return std::nullopt;
  auto it = mod->second.values.find(name);
  if (it != mod->second.values.end())
    return it->second;
  for (const auto &[fromModule, names] : mod->second.imports) {
    if (std::find(names.begin(), names.end(), name) != names.end())
      if (auto value = lookupValue(name, fromModule, hops + 1))
        return value;
  }
  return std::nullopt;
}

} // namespace asn1jer
