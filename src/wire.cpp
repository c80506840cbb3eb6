//===- wire.cpp - JSON text ⇄ bytes for the JER wire form -----------------===//

#include "asn1jer/wire.h"
#include "asn1jer/error.h"

#include <string>

namespace asn1jer {

std::vector<uint8_t> serialize(const nlohmann::ordered_json &document) {
  std::string text;
  try {
    // indent -1 selects the compact form: "," and ":" with no spaces.
    text = document.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::strict);
  } catch (const nlohmann::json::exception &e) {
    throw Error(ErrorKind::MalformedWire, e.what());
  }
  return std::vector<uint8_t>(text.begin(), text.end());
}

nlohmann::ordered_json deserialize(const uint8_t *data, size_t size) {
  try {
    return nlohmann::ordered_json::parse(data, data + size);
  } catch (const nlohmann::json::exception &e) {
    throw Error(ErrorKind::MalformedWire, e.what());
  }
}

} // namespace asn1jer
