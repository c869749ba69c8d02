//===- error.h - Decode error kinds and the DecodeError exception -*- C++ -*-===//
//
// Every failure in the decoding pipeline is reported by throwing a
// DecodeError. The error carries its kind, the pipeline stage it came from,
// and enough context (shape, field path, discriminator) to tell which record
// and which field failed.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace polyrec {

enum class ErrorKind {
  ParseError,
  PreprocessorFailure,
  MissingDiscriminator,
  UnknownDiscriminator,
  DuplicateKey,
  FallbackAlreadySet,
  InvalidKey,
  TypeMismatch,
  MissingField,
  UnsupportedTimeFormat,
  DepthLimitExceeded,
};

/// Pipeline stage an error originates from. Derived from the error kind.
enum class Stage {
  Parse,
  Register,
  Preprocess,
  Resolve,
  Map,
};

const char *errorKindName(ErrorKind kind);
const char *stageName(Stage stage);
Stage stageOf(ErrorKind kind);

class DecodeError : public std::runtime_error {
public:
  DecodeError(ErrorKind kind, std::string message, std::string shape = {},
              std::string path = {}, std::string discriminator = {});

  ErrorKind kind() const { return kind_; }
  Stage stage() const { return stageOf(kind_); }

  /// The bare message, without the stage/shape/path decoration of what().
  const std::string &message() const { return message_; }
  /// Name of the shape being populated, empty outside of mapping.
  const std::string &shape() const { return shape_; }
  /// Field path from the top-level record, e.g. "blocks[1].width".
  const std::string &path() const { return path_; }
  /// Rendering of the offending discriminator value, if any.
  const std::string &discriminator() const { return discriminator_; }

private:
  ErrorKind kind_;
  std::string message_;
  std::string shape_;
  std::string path_;
  std::string discriminator_;
};

} // namespace polyrec
