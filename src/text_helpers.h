//===- text_helpers.h - Textual forms shared by the codec -------*- C++ -*-===//
//
// Hex and dotted-decimal helpers used by the transcoder (wire forms of OCTET
// STRING, BIT STRING and OBJECT IDENTIFIER) and by the descriptor reader
// (DEFAULT values given as text).
//
//===----------------------------------------------------------------------===//

#ifndef ASN1JER_TEXT_HELPERS_H
#define ASN1JER_TEXT_HELPERS_H

#include "asn1jer/value.h"

#include <optional>
#include <string>
#include <string_view>

namespace asn1jer {

/// Uppercase hex, two digits per byte.
inline std::string encodeHex(const Bytes &bytes) {
  static const char digits[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (uint8_t b : bytes) {
    out += digits[b >> 4];
    out += digits[b & 0x0f];
  }
  return out;
}

inline int hexDigit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

/// Accepts either case. Returns nullopt on odd length or a non-hex digit.
inline std::optional<Bytes> decodeHex(std::string_view text) {
  if (text.size() % 2)
    return std::nullopt;
  Bytes out;
  out.reserve(text.size() / 2);
  for (size_t i = 0; i < text.size(); i += 2) {
    int hi = hexDigit(text[i]);
    int lo = hexDigit(text[i + 1]);
    if (hi < 0 || lo < 0)
      return std::nullopt;
    out.push_back(static_cast<uint8_t>(hi << 4 | lo));
  }
  return out;
}

/// `arc(.arc)+` with decimal arcs and no leading zeros; the first arc is 0, 1
/// or 2.
inline bool isDottedObjectIdentifier(std::string_view text) {
  size_t arcs = 0;
  size_t pos = 0;
  while (pos <= text.size()) {
    size_t end = text.find('.', pos);
    if (end == std::string_view::npos)
      end = text.size();
    std::string_view arc = text.substr(pos, end - pos);
    if (arc.empty() || (arc.size() > 1 && arc[0] == '0'))
      return false;
    for (char c : arc)
      if (c < '0' || c > '9')
        return false;
    if (arcs == 0 && (arc.size() != 1 || arc[0] > '2'))
      return false;
    ++arcs;
    pos = end + 1;
  }
  return arcs >= 2;
}

/// Number of bytes needed for `bits` bits.
inline uint64_t bitStringByteCount(uint64_t bits) {
  return bits / 8 + (bits % 8 != 0);
}

/// True when `bits.bytes` holds exactly `bits.length` bits and the unused
/// trailing bits of the last byte are zero.
inline bool isWellFormedBitString(const BitString &bits) {
  if (bits.bytes.size() != bitStringByteCount(bits.length))
    return false;
  unsigned unused = bits.length % 8 ? 8 - bits.length % 8 : 0;
  return (bits.bytes.empty() || (bits.bytes.back() & ((1u << unused) - 1)) == 0);
}

} // namespace asn1jer

#endif // ASN1JER_TEXT_HELPERS_H
