//===- test_compiler.cpp - Tests for descriptor-to-TypeNode compilation ---===//
//
// Each test writes a small specification as JSON descriptor text, compiles it
// and inspects the resulting node tree.
//
//===----------------------------------------------------------------------===//

#include "asn1jer/codec.h"
#include "asn1jer/compiler.h"
#include "asn1jer/descriptor_reader.h"

#include <cstdio>
#include <optional>
#include <string>
#include <variant>

using namespace asn1jer;

static int tests_run = 0;
static int tests_passed = 0;

#define TEST(name)                                                                                 \
  do {                                                                                             \
    tests_run++;                                                                                   \
    printf("  test %s ... ", #name);                                                               \
  } while (0)

#define PASS()                                                                                     \
  do {                                                                                             \
    tests_passed++;                                                                                \
    printf("ok\n");                                                                                \
  } while (0)

#define FAIL(msg)                                                                                  \
  do {                                                                                             \
    printf("FAILED: %s\n", msg);                                                                   \
  } while (0)

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static Specification parseSpec(const std::string &text) {
  return parseJsonSpecification(reinterpret_cast<const uint8_t *>(text.data()), text.size());
}

static CompiledSpecification compileText(const std::string &text,
                                         const CompileOptions &options = {}) {
  return compileSpecification(parseSpec(text), options);
}

/// Run `fn`, returning the error it throws. Returns nullopt if it succeeds.
template <typename Fn> static std::optional<Error> errorOf(Fn fn) {
  try {
    fn();
  } catch (const Error &e) {
    return e;
  }
  return std::nullopt;
}

template <typename T> static const T *nodeAs(const CompiledSpecification &spec, NodeId id) {
  return std::get_if<T>(&spec.schema().node(id).kind);
}

// ============================================================================
// Test: every built-in keyword compiles to its node variant
// ============================================================================
static void test_builtin_keywords() {
  TEST(builtin_keywords);

  auto spec = compileText(R"({"M": {"types": {
    "I": {"type": "INTEGER"},
    "R": {"type": "REAL"},
    "B": {"type": "BOOLEAN"},
    "N": {"type": "NULL"},
    "S": {"type": "UTF8String"},
    "T": {"type": "GeneralizedTime"},
    "O": {"type": "OCTET STRING"},
    "X": {"type": "BIT STRING"},
    "D": {"type": "OBJECT IDENTIFIER"},
    "A": {"type": "ANY DEFINED BY"},
    "L": {"type": "SET OF", "element": {"type": "INTEGER"}}
  }}})");

  const auto &m = spec.modules().at("M");
  if (!nodeAs<IntegerType>(spec, m.at("I").root()) || !nodeAs<RealType>(spec, m.at("R").root()) ||
      !nodeAs<BooleanType>(spec, m.at("B").root()) || !nodeAs<NullType>(spec, m.at("N").root()) ||
      !nodeAs<OctetStringType>(spec, m.at("O").root()) ||
      !nodeAs<BitStringType>(spec, m.at("X").root()) ||
      !nodeAs<ObjectIdentifierType>(spec, m.at("D").root()) ||
      !nodeAs<AnyType>(spec, m.at("A").root())) {
    FAIL("scalar keyword compiled to the wrong node");
    return;
  }

  const auto *s = nodeAs<StringType>(spec, m.at("S").root());
  const auto *t = nodeAs<StringType>(spec, m.at("T").root());
  if (!s || s->kind != StringKind::UTF8String || !t || t->kind != StringKind::GeneralizedTime) {
    FAIL("string kind not preserved");
    return;
  }

  const auto *l = nodeAs<SetOfType>(spec, m.at("L").root());
  if (!l || !nodeAs<IntegerType>(spec, l->element)) {
    FAIL("SET OF INTEGER not compiled");
    return;
  }
  if (std::string(typeNodeKeyword(m.at("L").node())) != "SET OF") {
    FAIL("keyword of SET OF node");
    return;
  }

  PASS();
}

// ============================================================================
// Test: a named reference shares the referenced type's node
// ============================================================================
static void test_named_reference_shares_node() {
  TEST(named_reference_shares_node);

  auto spec = compileText(R"({"M": {"types": {
    "Id": {"type": "INTEGER"},
    "Msg": {"type": "SEQUENCE", "members": [
      {"name": "a", "type": "Id"},
      {"name": "b", "type": "Id", "optional": true}
    ]},
    "Other": {"type": "Id"}
  }}})");

  NodeId id = spec.type("M", "Id").root();
  const auto *seq = nodeAs<SequenceType>(spec, spec.type("M", "Msg").root());
  if (!seq || seq->fields.size() != 2) {
    FAIL("Msg should be a two-member SEQUENCE");
    return;
  }
  if (seq->fields[0].node != id || seq->fields[1].node != id) {
    FAIL("references to Id should share its node");
    return;
  }
  if (spec.type("M", "Other").root() != id) {
    FAIL("alias Other ::= Id should share Id's node");
    return;
  }
  if (seq->fields[0].optional || !seq->fields[1].optional) {
    FAIL("optional flags not preserved");
    return;
  }

  PASS();
}

// ============================================================================
// Test: imported types resolve through the importing module
// ============================================================================
static void test_imports() {
  TEST(imports);

  auto spec = compileText(R"({
    "Base": {"types": {"Name": {"type": "IA5String"}}},
    "Mid":  {"types": {}, "imports": {"Base": ["Name"]}},
    "Top":  {"types": {
              "Person": {"type": "SEQUENCE", "members": [{"name": "n", "type": "Name"}]}
            }, "imports": {"Mid": ["Name"]}}
  })");

  const auto *seq = nodeAs<SequenceType>(spec, spec.type("Top", "Person").root());
  if (!seq || seq->fields[0].node != spec.type("Base", "Name").root()) {
    FAIL("Name should resolve transitively to Base.Name");
    return;
  }

  PASS();
}

// ============================================================================
// Test: an unknown type name fails with UnresolvedType and a path
// ============================================================================
static void test_unresolved_type() {
  TEST(unresolved_type);

  auto err = errorOf([] {
    compileText(R"({"M": {"types": {
      "Msg": {"type": "SEQUENCE", "members": [{"name": "x", "type": "Missing"}]}
    }}})");
  });
  if (!err || err->kind() != ErrorKind::UnresolvedType) {
    FAIL("expected UnresolvedType");
    return;
  }
  if (err->path() != "M.Msg.x") {
    FAIL("error path should name the member");
    return;
  }

  PASS();
}

// ============================================================================
// Test: the extension marker sets the extensible flag
// ============================================================================
static void test_extension_marker() {
  TEST(extension_marker);

  auto spec = compileText(R"({"M": {"types": {
    "S": {"type": "SEQUENCE", "members": [
      {"name": "a", "type": "INTEGER"}, {"name": "..."}
    ]},
    "C": {"type": "CHOICE", "members": [
      {"name": "x", "type": "BOOLEAN"}, {"name": "..."}
    ]},
    "E": {"type": "ENUMERATED", "values": [["red", 0], ["green", 1], "..."]}
  }}})");

  const auto *s = nodeAs<SequenceType>(spec, spec.type("M", "S").root());
  const auto *c = nodeAs<ChoiceType>(spec, spec.type("M", "C").root());
  const auto *e = nodeAs<EnumeratedType>(spec, spec.type("M", "E").root());
  if (!s || !s->extensible || s->fields.size() != 1) {
    FAIL("SEQUENCE should be extensible with one root member");
    return;
  }
  if (!c || !c->extensible || c->alternatives.size() != 1) {
    FAIL("CHOICE should be extensible with one alternative");
    return;
  }
  if (!e || !e->extensible || e->values.size() != 2) {
    FAIL("ENUMERATED should be extensible with two values");
    return;
  }

  PASS();
}

// ============================================================================
// Test: a member after the extension marker is rejected
// ============================================================================
static void test_member_after_extension_marker() {
  TEST(member_after_extension_marker);

  auto err = errorOf([] {
    compileText(R"({"M": {"types": {
      "S": {"type": "SEQUENCE", "members": [
        {"name": "a", "type": "INTEGER"}, {"name": "..."}, {"name": "b", "type": "INTEGER"}
      ]}
    }}})");
  });
  if (!err || err->kind() != ErrorKind::UnsupportedExtension) {
    FAIL("expected UnsupportedExtension");
    return;
  }

  PASS();
}

// ============================================================================
// Test: A ::= SEQUENCE { next A OPTIONAL } compiles to a self-referencing node
// ============================================================================
static void test_recursive_sequence() {
  TEST(recursive_sequence);

  auto spec = compileText(R"({"M": {"types": {
    "A": {"type": "SEQUENCE", "members": [{"name": "next", "type": "A", "optional": true}]}
  }}})");

  NodeId root = spec.type("M", "A").root();
  const auto *seq = nodeAs<SequenceType>(spec, root);
  if (!seq || seq->fields.size() != 1 || seq->fields[0].node != root) {
    FAIL("A.next should point back at A");
    return;
  }
  if (spec.schema().size() != 1) {
    FAIL("recursive type should occupy a single node");
    return;
  }

  PASS();
}

// ============================================================================
// Test: mutually recursive types through SEQUENCE OF
// ============================================================================
static void test_mutual_recursion() {
  TEST(mutual_recursion);

  auto spec = compileText(R"({"M": {"types": {
    "Tree": {"type": "SEQUENCE", "members": [
      {"name": "label", "type": "UTF8String"},
      {"name": "children", "type": "Forest"}
    ]},
    "Forest": {"type": "SEQUENCE OF", "element": {"type": "Tree"}}
  }}})");

  NodeId tree = spec.type("M", "Tree").root();
  NodeId forest = spec.type("M", "Forest").root();
  const auto *t = nodeAs<SequenceType>(spec, tree);
  const auto *f = nodeAs<SequenceOfType>(spec, forest);
  if (!t || !f || t->fields[1].node != forest || f->element != tree) {
    FAIL("Tree and Forest should reference each other");
    return;
  }

  PASS();
}

// ============================================================================
// Test: an alias cycle fails, and other types survive under quarantine
// ============================================================================
static void test_alias_cycle() {
  TEST(alias_cycle);

  const char *text = R"({"M": {"types": {
    "A": {"type": "B"},
    "B": {"type": "A"},
    "C": {"type": "INTEGER"}
  }}})";

  auto err = errorOf([&] { compileText(text); });
  if (!err || err->kind() != ErrorKind::UnresolvedType ||
      err->message().find("circular") == std::string::npos) {
    FAIL("expected a circular UnresolvedType");
    return;
  }

  CompileOptions options;
  options.quarantine_failures = true;
  auto spec = compileText(text, options);
  if (spec.failures().size() != 2) {
    FAIL("both A and B should be quarantined");
    return;
  }
  if (spec.find("M", "A") || spec.find("M", "B") || !spec.find("M", "C")) {
    FAIL("only C should be compiled");
    return;
  }

  PASS();
}

// ============================================================================
// Test: a failed type leaves no half-compiled nodes behind
// ============================================================================
static void test_failure_rolls_back() {
  TEST(failure_rolls_back);

  CompileOptions options;
  options.quarantine_failures = true;
  auto spec = compileText(R"({"M": {"types": {
    "Bad": {"type": "SEQUENCE", "members": [
      {"name": "ok", "type": "Good"},
      {"name": "broken", "type": "Nowhere"}
    ]},
    "Good": {"type": "SEQUENCE", "members": [{"name": "v", "type": "INTEGER"}]}
  }}})",
                          options);

  if (spec.failures().size() != 1 || spec.failures()[0].type != "Bad") {
    FAIL("Bad should be the only failure");
    return;
  }
  if (spec.schema().size() != 2) {
    FAIL("only Good and its INTEGER member should remain");
    return;
  }
  auto wire = spec.type("M", "Good").encode(Record{{"v", 3}});
  if (std::string(wire.begin(), wire.end()) != R"({"v":3})") {
    FAIL("Good should still encode");
    return;
  }

  PASS();
}

// ============================================================================
// Test: CHOICE alternatives drop OPTIONAL and DEFAULT markings
// ============================================================================
static void test_choice_ignores_optional_and_default() {
  TEST(choice_ignores_optional_and_default);

  auto spec = compileText(R"({"M": {"types": {
    "C": {"type": "CHOICE", "members": [
      {"name": "a", "type": "INTEGER", "optional": true},
      {"name": "b", "type": "BOOLEAN", "default": true}
    ]}
  }}})");

  const auto *c = nodeAs<ChoiceType>(spec, spec.type("M", "C").root());
  if (!c || c->alternatives.size() != 2) {
    FAIL("expected two alternatives");
    return;
  }
  for (const auto &alt : c->alternatives) {
    if (alt.optional || alt.default_value) {
      FAIL("alternative kept optional/default");
      return;
    }
  }

  PASS();
}

// ============================================================================
// Test: SIZE constraints, including named bounds and MIN/MAX
// ============================================================================
static void test_size_constraints() {
  TEST(size_constraints);

  auto spec = compileText(R"({
    "Bounds": {"types": {}, "values": {"ub-name": 64}},
    "M": {"types": {
      "Fixed": {"type": "OCTET STRING", "size": [16]},
      "Named": {"type": "BIT STRING", "size": [[1, "ub-name"]]},
      "Open":  {"type": "SEQUENCE OF", "element": {"type": "INTEGER"}, "size": [["MIN", "MAX"]]},
      "None":  {"type": "OCTET STRING"}
    }, "imports": {"Bounds": ["ub-name"]}}
  })");

  const auto *fixed = nodeAs<OctetStringType>(spec, spec.type("M", "Fixed").root());
  const auto *named = nodeAs<BitStringType>(spec, spec.type("M", "Named").root());
  const auto *open = nodeAs<SequenceOfType>(spec, spec.type("M", "Open").root());
  const auto *none = nodeAs<OctetStringType>(spec, spec.type("M", "None").root());
  if (!fixed || !fixed->size.isFixed() || *fixed->size.min != 16) {
    FAIL("SIZE (16) should be a fixed range");
    return;
  }
  if (!named || named->size != SizeRange{1, 64}) {
    FAIL("SIZE (1..ub-name) should resolve the imported bound");
    return;
  }
  if (!open || open->size.min || open->size.max) {
    FAIL("SIZE (MIN..MAX) should be unbounded");
    return;
  }
  if (!none || none->size != SizeRange{}) {
    FAIL("no SIZE should be unbounded");
    return;
  }

  auto err = errorOf([] {
    compileText(R"({"M": {"types": {"S": {"type": "OCTET STRING", "size": ["ub-missing"]}}}})");
  });
  if (!err || err->kind() != ErrorKind::InvalidDescriptor) {
    FAIL("unknown size bound should be InvalidDescriptor");
    return;
  }

  PASS();
}

// ============================================================================
// Test: ENUMERATED tables, bare names and duplicates
// ============================================================================
static void test_enumerated_table() {
  TEST(enumerated_table);

  auto spec = compileText(R"({"M": {"types": {
    "E": {"type": "ENUMERATED", "values": [["low", 1], "mid", ["high", 10]]}
  }}})");

  const auto *e = nodeAs<EnumeratedType>(spec, spec.type("M", "E").root());
  if (!e || e->ordinals.at("low") != 1 || e->ordinals.at("mid") != 2 ||
      e->names.at(10) != "high") {
    FAIL("enumeration table incorrect");
    return;
  }

  auto err = errorOf([] {
    compileText(R"({"M": {"types": {
      "E": {"type": "ENUMERATED", "values": [["a", 0], ["b", 0]]}
    }}})");
  });
  if (!err || err->kind() != ErrorKind::InvalidDescriptor) {
    FAIL("duplicate ordinal should be InvalidDescriptor");
    return;
  }

  PASS();
}

// ============================================================================
// Test: duplicate SEQUENCE member names and element-less SEQUENCE OF
// ============================================================================
static void test_invalid_descriptors() {
  TEST(invalid_descriptors);

  auto dup = errorOf([] {
    compileText(R"({"M": {"types": {
      "S": {"type": "SEQUENCE", "members": [
        {"name": "a", "type": "INTEGER"}, {"name": "a", "type": "BOOLEAN"}
      ]}
    }}})");
  });
  if (!dup || dup->kind() != ErrorKind::InvalidDescriptor) {
    FAIL("duplicate member should be InvalidDescriptor");
    return;
  }

  auto noElement = errorOf([] { compileText(R"({"M": {"types": {"L": {"type": "SEQUENCE OF"}}}})"); });
  if (!noElement || noElement->kind() != ErrorKind::InvalidDescriptor) {
    FAIL("SEQUENCE OF without element should be InvalidDescriptor");
    return;
  }

  PASS();
}

// ============================================================================
// Test: descriptor nesting beyond max_depth fails with DepthLimitExceeded
// ============================================================================
static void test_compile_depth_limit() {
  TEST(compile_depth_limit);

  std::string element = R"({"type": "INTEGER"})";
  for (int i = 0; i < 10; ++i)
    element = R"({"type": "SEQUENCE OF", "element": )" + element + "}";
  std::string text = R"({"M": {"types": {"Deep": )" + element + "}}}";

  CompileOptions shallow;
  shallow.max_depth = 4;
  auto err = errorOf([&] { compileText(text, shallow); });
  if (!err || err->kind() != ErrorKind::DepthLimitExceeded) {
    FAIL("expected DepthLimitExceeded");
    return;
  }
  if (errorOf([&] { compileText(text); })) {
    FAIL("default depth limit should accept ten levels");
    return;
  }

  PASS();
}

// ============================================================================
// Test: a custom resolver is consulted for named types
// ============================================================================
class FixedResolver : public TypeResolver {
public:
  ResolvedType resolve(const std::string &typeName, const std::string &) const override {
    ++calls;
    if (typeName != "External")
      throw Error(ErrorKind::UnresolvedType, "unknown '" + typeName + "'");
    return ResolvedType{&external, "Registry"};
  }

  TypeDescriptor external{"BOOLEAN"};
  mutable int calls = 0;
};

static void test_custom_resolver() {
  TEST(custom_resolver);

  auto spec = parseSpec(R"({"M": {"types": {
    "S": {"type": "SEQUENCE", "members": [
      {"name": "a", "type": "External"}, {"name": "b", "type": "External"}
    ]}
  }}})");
  FixedResolver resolver;
  SpecificationSizeExtractor sizes(spec);
  auto compiled = compileSpecification(spec, resolver, sizes);

  const auto *s = nodeAs<SequenceType>(compiled, compiled.type("M", "S").root());
  if (!s || !nodeAs<BooleanType>(compiled, s->fields[0].node) ||
      s->fields[0].node != s->fields[1].node) {
    FAIL("External should resolve to one shared BOOLEAN node");
    return;
  }
  if (resolver.calls != 2) {
    FAIL("resolver should be asked once per reference");
    return;
  }

  PASS();
}

// ============================================================================
// Test: describe() renders the tree, and recursion as a back-reference
// ============================================================================
static void test_describe() {
  TEST(describe);

  auto spec = compileText(R"({"M": {"types": {
    "Foo": {"type": "SEQUENCE", "members": [
      {"name": "a", "type": "INTEGER"},
      {"name": "b", "type": "BOOLEAN", "optional": true},
      {"name": "c", "type": "OCTET STRING", "default": "0A"}
    ]}
  }}})");
  std::string foo = spec.type("M", "Foo").describe();
  if (foo != "Sequence(Foo, [Integer(a), Boolean(b) OPTIONAL, OctetString(c) DEFAULT '0A'H])") {
    printf("\n    got: %s\n  ", foo.c_str());
    FAIL("unexpected Foo description");
    return;
  }

  auto rec = compileText(R"({"M": {"types": {
    "A": {"type": "SEQUENCE", "members": [{"name": "next", "type": "A", "optional": true}]}
  }}})");
  std::string a = rec.type("M", "A").describe();
  if (a != "Sequence(A, [<#0>(next) OPTIONAL])") {
    printf("\n    got: %s\n  ", a.c_str());
    FAIL("unexpected recursive description");
    return;
  }

  PASS();
}

// ============================================================================
// Main
// ============================================================================

int main() {
  printf("=== asn1jer Compiler Tests ===\n");

  test_builtin_keywords();
  test_named_reference_shares_node();
  test_imports();
  test_unresolved_type();
  test_extension_marker();
  test_member_after_extension_marker();
  test_recursive_sequence();
  test_mutual_recursion();
  test_alias_cycle();
  test_failure_rolls_back();
  test_choice_ignores_optional_and_default();
  test_size_constraints();
  test_enumerated_table();
  test_invalid_descriptors();
  test_compile_depth_limit();
  test_custom_resolver();
  test_describe();

  printf("\n%d/%d tests passed.\n", tests_passed, tests_run);
  return (tests_passed == tests_run) ? 0 : 1;
}
