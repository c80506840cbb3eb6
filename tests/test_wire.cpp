//===- test_wire.cpp - Tests for the JSON text ⇄ bytes adapter ------------===//

#include "asn1jer/codec.h"
#include "asn1jer/descriptor_reader.h"
#include "asn1jer/wire.h"

#include <cstdio>
#include <optional>
#include <string>
#include <vector>

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

static std::string text(const std::vector<uint8_t> &bytes) {
  return std::string(bytes.begin(), bytes.end());
}

static std::optional<Error> deserializeError(const std::string &input) {
  try {
    deserialize(reinterpret_cast<const uint8_t *>(input.data()), input.size());
  } catch (const Error &e) {
    return e;
  }
  return std::nullopt;
}

// ============================================================================
// Test: output has no insignificant whitespace and keeps key order
// ============================================================================
static void test_compact_output() {
  TEST(compact_output);

  nlohmann::ordered_json doc;
  doc["zeta"] = 1;
  doc["alpha"] = nlohmann::ordered_json::array({1, 2});
  doc["mid"] = "a b";
  doc["empty"] = nlohmann::ordered_json::object();
  if (text(serialize(doc)) != R"({"zeta":1,"alpha":[1,2],"mid":"a b","empty":{}})") {
    FAIL("expected compact JSON in insertion order");
    return;
  }

  PASS();
}

// ============================================================================
// Test: control characters are escaped, non-ASCII text is written as UTF-8
// ============================================================================
static void test_string_escaping() {
  TEST(string_escaping);

  nlohmann::ordered_json doc = "line\n\"q\" \xC3\xA9";
  if (text(serialize(doc)) != "\"line\\n\\\"q\\\" \xC3\xA9\"") {
    FAIL("unexpected string escaping");
    return;
  }

  PASS();
}

// ============================================================================
// Test: a string holding invalid UTF-8 cannot be serialized
// ============================================================================
static void test_serialize_invalid_utf8() {
  TEST(serialize_invalid_utf8);

  nlohmann::ordered_json doc = {{"s", std::string("ok\xFF")}};
  try {
    serialize(doc);
  } catch (const Error &e) {
    if (e.kind() != ErrorKind::MalformedWire) {
      FAIL("expected MalformedWire");
      return;
    }
    PASS();
    return;
  }
  FAIL("serialize should reject invalid UTF-8");
}

// ============================================================================
// Test: standard JSON parses, including insignificant whitespace
// ============================================================================
static void test_deserialize() {
  TEST(deserialize);

  std::string input = " { \"a\" : [ 1 , true , null ] ,\n\"b\":\"\\u00e9\" } ";
  auto doc = deserialize(reinterpret_cast<const uint8_t *>(input.data()), input.size());
  if (!doc.is_object() || doc["a"].size() != 3 || doc["b"] != "\xC3\xA9") {
    FAIL("document not parsed as expected");
    return;
  }
  if (doc.begin().key() != "a") {
    FAIL("key order should be preserved");
    return;
  }

  PASS();
}

// ============================================================================
// Test: syntax errors, invalid UTF-8 and number overflow raise MalformedWire
// ============================================================================
static void test_deserialize_malformed() {
  TEST(deserialize_malformed);

  for (const char *bad : {"{\"a\":", "{} x", "[1,]", "{'a':1}", "", "\"\xC3\x28\"", "\"\xFF\"",
                          "1e999", "[-1e400]"}) {
    auto err = deserializeError(bad);
    if (!err || err->kind() != ErrorKind::MalformedWire) {
      printf("\n    input: %s\n  ", bad);
      FAIL("expected MalformedWire");
      return;
    }
  }

  PASS();
}

// ============================================================================
// Test: the codec surfaces wire errors from both directions
// ============================================================================
static void test_codec_wire_errors() {
  TEST(codec_wire_errors);

  std::string spec = R"({"M": {"types": {"S": {"type": "UTF8String"}}}})";
  auto compiled = compileSpecification(
      parseJsonSpecification(reinterpret_cast<const uint8_t *>(spec.data()), spec.size()));
  const auto &s = compiled.type("M", "S");

  bool encodeFailed = false;
  try {
    s.encode(std::string("\xC0\xAF"));
  } catch (const Error &e) {
    encodeFailed = e.kind() == ErrorKind::MalformedWire;
  }
  if (!encodeFailed) {
    FAIL("overlong UTF-8 should fail to encode");
    return;
  }

  bool decodeFailed = false;
  try {
    s.decode(std::vector<uint8_t>{'"', 'a'});
  } catch (const Error &e) {
    decodeFailed = e.kind() == ErrorKind::MalformedWire;
  }
  if (!decodeFailed) {
    FAIL("unterminated string should fail to decode");
    return;
  }

  std::string realSpec = R"({"M": {"types": {"R": {"type": "REAL"}}}})";
  auto reals = compileSpecification(parseJsonSpecification(
      reinterpret_cast<const uint8_t *>(realSpec.data()), realSpec.size()));
  bool overflowFailed = false;
  try {
    std::string huge = "1e999";
    reals.type("M", "R").decode(std::vector<uint8_t>(huge.begin(), huge.end()));
  } catch (const Error &e) {
    overflowFailed = e.kind() == ErrorKind::MalformedWire;
  }
  if (!overflowFailed) {
    FAIL("a number too large for a double should fail to decode");
    return;
  }

  if (text(s.encode(std::string("h\xC3\xA9llo"))) != "\"h\xC3\xA9llo\"") {
    FAIL("valid UTF-8 should pass through unchanged");
    return;
  }

  PASS();
}

// ============================================================================
// Main
// ============================================================================

int main() {
  printf("=== asn1jer Wire Tests ===\n");

  test_compact_output();
  test_string_escaping();
  test_serialize_invalid_utf8();
  test_deserialize();
  test_deserialize_malformed();
  test_codec_wire_errors();

  printf("\n%d/%d tests passed.\n", tests_passed, tests_run);
  return (tests_passed == tests_run) ? 0 : 1;
}
