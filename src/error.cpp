//===- error.cpp - DecodeError formatting ----------------------------------===//

#include "polyrec/error.h"

#include <utility>

namespace polyrec {

const char *errorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::ParseError:
    return "ParseError";
  case ErrorKind::PreprocessorFailure:
    return "PreprocessorFailure";
  case ErrorKind::MissingDiscriminator:
    return "MissingDiscriminator";
  case ErrorKind::UnknownDiscriminator:
    return "UnknownDiscriminator";
  case ErrorKind::DuplicateKey:
    return "DuplicateKey";
  case ErrorKind::FallbackAlreadySet:
    return "FallbackAlreadySet";
  case ErrorKind::InvalidKey:
    return "InvalidKey";
  case ErrorKind::TypeMismatch:
    return "TypeMismatch";
  case ErrorKind::MissingField:
    return "MissingField";
  case ErrorKind::UnsupportedTimeFormat:
    return "UnsupportedTimeFormat";
  case ErrorKind::DepthLimitExceeded:
    return "DepthLimitExceeded";
  }
  return "Unknown";
}

const char *stageName(Stage stage) {
  switch (stage) {
  case Stage::Parse:
    return "parse";
  case Stage::Register:
    return "register";
  case Stage::Preprocess:
    return "preprocess";
  case Stage::Resolve:
    return "resolve";
  case Stage::Map:
    return "map";
  }
  return "unknown";
}

Stage stageOf(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::ParseError:
    return Stage::Parse;
  case ErrorKind::DuplicateKey:
  case ErrorKind::FallbackAlreadySet:
  case ErrorKind::InvalidKey:
    return Stage::Register;
  case ErrorKind::PreprocessorFailure:
    return Stage::Preprocess;
  case ErrorKind::MissingDiscriminator:
  case ErrorKind::UnknownDiscriminator:
    return Stage::Resolve;
  case ErrorKind::TypeMismatch:
  case ErrorKind::MissingField:
  case ErrorKind::UnsupportedTimeFormat:
  case ErrorKind::DepthLimitExceeded:
    return Stage::Map;
  }
  return Stage::Map;
}

// "[map] TypeMismatch in ImageBlock at blocks[1].width: expected integer, got string"
static std::string formatMessage(ErrorKind kind, const std::string &message,
                                 const std::string &shape, const std::string &path,
                                 const std::string &discriminator) {
  std::string out = "[";
  out += stageName(stageOf(kind));
  out += "] ";
  out += errorKindName(kind);
  if (!shape.empty())
    out += " in " + shape;
  if (!path.empty())
    out += " at " + path;
  if (!discriminator.empty())
    out += " (discriminator " + discriminator + ")";
  out += ": ";
  out += message;
  return out;
}

DecodeError::DecodeError(ErrorKind kind, std::string message, std::string shape,
                         std::string path, std::string discriminator)
    : std::runtime_error(formatMessage(kind, message, shape, path, discriminator)), kind_(kind),
      message_(std::move(message)), shape_(std::move(shape)), path_(std::move(path)),
      discriminator_(std::move(discriminator)) {}

} // namespace polyrec
