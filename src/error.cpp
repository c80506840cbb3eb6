//===- error.cpp - Error reporting for the asn1jer codec ------------------===//

#include "asn1jer/error.h"

#include <utility>

namespace asn1jer {

const char *errorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::UnresolvedType:
    return "UnresolvedType";
  case ErrorKind::UnsupportedExtension:
    return "UnsupportedExtension";
  case ErrorKind::InvalidDescriptor:
    return "InvalidDescriptor";
  case ErrorKind::MissingRequiredField:
    return "MissingRequiredField";
  case ErrorKind::EncodeError:
    return "EncodeError";
  case ErrorKind::DecodeError:
    return "DecodeError";
  case ErrorKind::MalformedWire:
    return "MalformedWire";
  case ErrorKind::DepthLimitExceeded:
    return "DepthLimitExceeded";
  }
  return "Error";
}

static std::string decorate(ErrorKind kind, const std::string &message, const std::string &path) {
  std::string out = errorKindName(kind);
  if (!path.empty())
    out += " at " + path;
  out += ": " + message;
  return out;
}

Error::Error(ErrorKind kind, const std::string &message, std::string path)
    : std::runtime_error(decorate(kind, message, path)), kind_(kind), message_(message),
      path_(std::move(path)) {}

} // namespace asn1jer
