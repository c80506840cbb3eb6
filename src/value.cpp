//===- value.cpp - Native value model for asn1jer -------------------------===//

#include "asn1jer/value.h"
#include "text_helpers.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <type_traits>
#include <utility>

namespace asn1jer {

// ── Record ──────────────────────────────────────────────────────────────────

Record::Record(std::initializer_list<RecordEntry> init) {
  for (const auto &entry : init)
    set(entry.name, entry.value);
}

const Value *Record::find(std::string_view name) const {
  for (const auto &entry : entries)
    if (entry.name == name)
      return &entry.value;
  return nullptr;
}

Value *Record::find(std::string_view name) {
  for (auto &entry : entries)
    if (entry.name == name)
      return &entry.value;
  return nullptr;
}

void Record::set(std::string name, Value value) {
  if (auto *existing = find(name)) {
    *existing = std::move(value);
    return;
  }
  entries.push_back(RecordEntry{std::move(name), std::move(value)});
}

bool Record::operator==(const Record &other) const {
  // Field mappings compare by content; insertion order is not significant.
  if (entries.size() != other.entries.size())
    return false;
  for (const auto &entry : entries) {
    const auto *theirs = other.find(entry.name);
    if (!theirs || *theirs != entry.value)
      return false;
  }
  return true;
}

// ── Formatting ──────────────────────────────────────────────────────────────

const char *valueKindName(const Value &value) {
  return std::visit(
      [](const auto &v) -> const char * {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Null>)
          return "null";
        else if constexpr (std::is_same_v<T, bool>)
          return "boolean";
        else if constexpr (std::is_same_v<T, int64_t>)
          return "integer";
        else if constexpr (std::is_same_v<T, double>)
          return "real";
        else if constexpr (std::is_same_v<T, std::string>)
          return "string";
        else if constexpr (std::is_same_v<T, Bytes>)
          return "bytes";
        else if constexpr (std::is_same_v<T, BitString>)
          return "bit string";
        else if constexpr (std::is_same_v<T, List>)
          return "list";
        else
          return "record";
      },
      value.kind);
}

static void appendQuoted(std::string &out, const std::string &s) {
  out += '"';
  for (char c : s) {
    if (c == '"')
      out += "\"\""; // ASN.1 doubles embedded quotes
    else
      out += c;
  }
  out += '"';
}

static void appendValue(std::string &out, const Value &value);

static void appendRecord(std::string &out, const Record &record) {
  if (record.empty()) {
    out += "{}";
    return;
  }
  out += "{ ";
  bool first = true;
  for (const auto &entry : record.entries) {
    if (!first)
      out += ", ";
    first = false;
    out += entry.name;
    out += ' ';
    appendValue(out, entry.value);
  }
  out += " }";
}

static void appendValue(std::string &out, const Value &value) {
  if (value.isNull()) {
    out += "NULL";
  } else if (const auto *b = value.getIf<bool>()) {
    out += *b ? "TRUE" : "FALSE";
  } else if (const auto *i = value.getIf<int64_t>()) {
    out += std::to_string(*i);
  } else if (const auto *d = value.getIf<double>()) {
    if (std::isnan(*d)) {
      out += "NOT-A-NUMBER";
    } else if (std::isinf(*d)) {
      out += *d > 0 ? "PLUS-INFINITY" : "MINUS-INFINITY";
    } else {
      char buf[32];
      std::snprintf(buf, sizeof(buf), "%.17g", *d);
      out += buf;
    }
  } else if (const auto *s = value.getIf<std::string>()) {
    appendQuoted(out, *s);
  } else if (const auto *bytes = value.getIf<Bytes>()) {
    out += '\'';
    out += encodeHex(*bytes);
    out += "'H";
  } else if (const auto *bits = value.getIf<BitString>()) {
    out += '\'';
    // Only the bits the bytes actually hold.
    uint64_t shown = std::min<uint64_t>(bits->length, uint64_t(bits->bytes.size()) * 8);
    for (uint64_t n = 0; n < shown; ++n)
      out += (bits->bytes[n / 8] & (0x80 >> (n % 8))) ? '1' : '0';
    out += "'B";
  } else if (const auto *list = value.getIf<List>()) {
    if (list->empty()) {
      out += "{}";
      return;
    }
    out += "{ ";
    for (size_t n = 0; n < list->size(); ++n) {
      if (n)
        out += ", ";
      appendValue(out, (*list)[n]);
    }
    out += " }";
  } else {
    appendRecord(out, *value.getIf<Record>());
  }
}

std::string formatValue(const Value &value) {
  std::string out;
  appendValue(out, value);
  return out;
}

} // namespace asn1jer
