//===- error.h - Error reporting for the asn1jer codec -----------*- C++ -*-===//
//
// Every failure raised by the compiler, the transcoder and the wire adapter is
// an asn1jer::Error carrying an ErrorKind and, where one is known, the path of
// the type or value being processed.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <stdexcept>
#include <string>

namespace asn1jer {

enum class ErrorKind {
  UnresolvedType,       // named-type reference not found (or circular)
  UnsupportedExtension, // members declared after an extension marker
  InvalidDescriptor,    // malformed descriptor record or descriptor file
  MissingRequiredField, // required Sequence/Set member absent
  EncodeError,          // native value does not fit the type
  DecodeError,          // wire value does not fit the type
  MalformedWire,        // invalid JSON text or invalid UTF-8
  DepthLimitExceeded,   // recursion guard tripped
};

/// Human-readable name of an error kind ("UnresolvedType", ...).
const char *errorKindName(ErrorKind kind);

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &message, std::string path = {});

  ErrorKind kind() const { return kind_; }

  /// Dotted path of the offending value or type, empty at the root.
  const std::string &path() const { return path_; }

  /// The message without the kind and path decoration.
  const std::string &message() const { return message_; }

private:
  ErrorKind kind_;
  std::string message_;
  std::string path_;
};

} // namespace asn1jer
