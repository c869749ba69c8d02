//===- codec.h - Byte-level formats to and from Value -----------*- C++ -*-===//
//
// The boundary to the external codecs. MessagePack is read with msgpack-c;
// JSON is parsed with nlohmann/json, converted to msgpack bytes and fed
// through the same reader so both formats produce identical documents.
//
// Codec failures are rethrown as DecodeError(ParseError) without further
// interpretation.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "polyrec/value.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace polyrec {

enum class Format {
  Msgpack,
  Json,
};

/// Parse one msgpack-encoded document. Trailing bytes, non-string map keys
/// and duplicate keys are parse errors. The timestamp extension (type -1)
/// becomes a Timestamp value, bin becomes Binary.
Value parseMsgpack(const uint8_t *data, size_t size);

/// Parse one JSON document.
Value parseJson(const uint8_t *data, size_t size);

Value parseDocument(Format format, const uint8_t *data, size_t size);

/// Encode as msgpack; timestamps use the 96-bit timestamp extension.
std::vector<uint8_t> toMsgpack(const Value &value);

/// Render as JSON. Binary becomes a hex string, timestamps RFC 3339 text.
nlohmann::json toJson(const Value &value);

} // namespace polyrec
