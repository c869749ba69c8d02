//===- codec.cpp - Byte-level formats to and from Value --------------------===//
//
// Reads msgpack with msgpack-c into the generic Value model. JSON input goes
// through nlohmann/json and is re-encoded as msgpack first, so there is a
// single reader for both formats.
//
//===----------------------------------------------------------------------===//

#include "polyrec/codec.h"

#include "polyrec/error.h"
#include "polyrec/hooks.h"

#include <msgpack.hpp>

#include <chrono>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>

namespace polyrec {

// ── Error helper ────────────────────────────────────────────────────────────

[[noreturn]] static void fail(const std::string &msg) {
  throw DecodeError(ErrorKind::ParseError, msg);
}

// ── Reading ─────────────────────────────────────────────────────────────────

/// Deepest array/map nesting accepted from either format. Readers and the
/// Value model recurse per level, so unbounded input would exhaust the stack.
static constexpr std::size_t kMaxNesting = 512;

static uint64_t readBigEndian(const char *p, size_t n) {
  uint64_t v = 0;
  for (size_t i = 0; i < n; ++i)
    v = (v << 8) | static_cast<uint8_t>(p[i]);
  return v;
}

/// Decode the msgpack timestamp extension (type -1) in its 32, 64 and 96-bit
/// layouts.
static Timestamp parseTimestampExt(const msgpack::object_ext &ext) {
  const char *p = ext.data();
  int64_t secs = 0;
  uint64_t nanos = 0;
  switch (ext.size) {
  case 4:
    secs = static_cast<int64_t>(readBigEndian(p, 4));
    break;
  case 8: {
    uint64_t v = readBigEndian(p, 8);
    nanos = v >> 34;
    secs = static_cast<int64_t>(v & 0x3ffffffffULL);
    break;
  }
  case 12:
    nanos = readBigEndian(p, 4);
    secs = static_cast<int64_t>(readBigEndian(p + 4, 8));
    break;
  default:
    fail("timestamp extension has invalid length " + std::to_string(ext.size));
  }
  if (nanos > 999999999)
    fail("timestamp extension has nanoseconds out of range");
  auto ts = timestampFromEpoch(secs, static_cast<int64_t>(nanos));
  if (!ts)
    fail("timestamp extension " + std::to_string(secs) + "s is out of range");
  return *ts;
}

static Value toValue(const msgpack::object &obj) {
  switch (obj.type) {
  case msgpack::type::NIL:
    return Value();
  case msgpack::type::BOOLEAN:
    return Value(obj.via.boolean);
  case msgpack::type::POSITIVE_INTEGER:
    if (obj.via.u64 > static_cast<uint64_t>(INT64_MAX))
      fail("unsigned value " + std::to_string(obj.via.u64) + " overflows int64_t");
    return Value(static_cast<int64_t>(obj.via.u64));
  case msgpack::type::NEGATIVE_INTEGER:
    return Value(obj.via.i64);
  case msgpack::type::FLOAT32:
  case msgpack::type::FLOAT64:
    return Value(obj.via.f64);
  case msgpack::type::STR:
    return Value(std::string(obj.via.str.ptr, obj.via.str.size));
  case msgpack::type::BIN: {
    const auto *p = reinterpret_cast<const uint8_t *>(obj.via.bin.ptr);
    return Value(Bytes(p, p + obj.via.bin.size));
  }
  case msgpack::type::ARRAY: {
    Sequence seq;
    seq.reserve(obj.via.array.size);
    for (uint32_t i = 0; i < obj.via.array.size; ++i)
      seq.push_back(toValue(obj.via.array.ptr[i]));
    return Value(std::move(seq));
  }
  case msgpack::type::MAP: {
    Mapping map;
    map.reserve(obj.via.map.size);
    std::unordered_set<std::string_view> seen;
    for (uint32_t i = 0; i < obj.via.map.size; ++i) {
      const auto &kv = obj.via.map.ptr[i];
      if (kv.key.type != msgpack::type::STR)
        fail("mapping key must be a string, got type " + std::to_string(kv.key.type));
      std::string_view key(kv.key.via.str.ptr, kv.key.via.str.size);
      if (!seen.insert(key).second)
        fail("duplicate mapping key: " + std::string(key));
      map.emplace_back(std::string(key), toValue(kv.val));
    }
    return Value(std::move(map));
  }
  case msgpack::type::EXT:
    if (obj.via.ext.type() == -1)
      return Value(parseTimestampExt(obj.via.ext));
    fail("unsupported extension type " + std::to_string(obj.via.ext.type()));
  }
  fail("unexpected msgpack type " + std::to_string(obj.type));
}

Value parseMsgpack(const uint8_t *data, size_t size) {
  try {
    std::size_t offset = 0;
    msgpack::unpack_limit limit(0xffffffff, 0xffffffff, 0xffffffff, 0xffffffff, 0xffffffff,
                                kMaxNesting);
    msgpack::object_handle oh = msgpack::unpack(reinterpret_cast<const char *>(data), size, offset,
                                                nullptr, nullptr, limit);
    if (offset != size)
      fail(std::to_string(size - offset) + " trailing bytes after document");
    return toValue(oh.get());
  } catch (const msgpack::depth_size_overflow &) {
    fail("nesting exceeds " + std::to_string(kMaxNesting) + " levels");
  } catch (const msgpack::unpack_error &e) {
    fail(std::string("malformed msgpack: ") + e.what());
  }
}

Value parseJson(const uint8_t *data, size_t size) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(data, data + size,
                              [](int depth, nlohmann::json::parse_event_t, nlohmann::json &) {
                                if (static_cast<std::size_t>(depth) > kMaxNesting)
                                  fail("nesting exceeds " + std::to_string(kMaxNesting) +
                                       " levels");
                                return true;
                              });
  } catch (const nlohmann::json::parse_error &e) {
    fail(std::string("malformed JSON: ") + e.what());
  }
  auto msgpackBytes = nlohmann::json::to_msgpack(j);
  return parseMsgpack(msgpackBytes.data(), msgpackBytes.size());
}

Value parseDocument(Format format, const uint8_t *data, size_t size) {
  if (format == Format::Json)
    return parseJson(data, size);
  return parseMsgpack(data, size);
}

// ── Writing ─────────────────────────────────────────────────────────────────

static void writeBigEndian(char *p, uint64_t v, size_t n) {
  for (size_t i = 0; i < n; ++i)
    p[i] = static_cast<char>((v >> (8 * (n - 1 - i))) & 0xff);
}

static void pack(msgpack::packer<msgpack::sbuffer> &pk, const Value &value) {
  switch (value.kind()) {
  case ValueKind::Null:
    pk.pack_nil();
    return;
  case ValueKind::Bool:
    if (value.asBool())
      pk.pack_true();
    else
      pk.pack_false();
    return;
  case ValueKind::Integer:
    pk.pack_int64(value.asInteger());
    return;
  case ValueKind::Float:
    pk.pack_double(value.asFloat());
    return;
  case ValueKind::String: {
    const auto &s = value.asString();
    pk.pack_str(static_cast<uint32_t>(s.size()));
    pk.pack_str_body(s.data(), static_cast<uint32_t>(s.size()));
    return;
  }
  case ValueKind::Binary: {
    const auto &b = value.asBinary();
    pk.pack_bin(static_cast<uint32_t>(b.size()));
    pk.pack_bin_body(reinterpret_cast<const char *>(b.data()), static_cast<uint32_t>(b.size()));
    return;
  }
  case ValueKind::Timestamp: {
    auto ts = value.asTimestamp();
    auto secs = std::chrono::floor<std::chrono::seconds>(ts);
    auto nanos = (ts - secs).count();
    char body[12];
    writeBigEndian(body, static_cast<uint64_t>(nanos), 4);
    writeBigEndian(body + 4, static_cast<uint64_t>(secs.time_since_epoch().count()), 8);
    pk.pack_ext(sizeof(body), -1);
    pk.pack_ext_body(body, sizeof(body));
    return;
  }
  case ValueKind::Sequence: {
    const auto &seq = value.asSequence();
    pk.pack_array(static_cast<uint32_t>(seq.size()));
    for (const auto &item : seq)
      pack(pk, item);
    return;
  }
  case ValueKind::Mapping: {
    const auto &map = value.asMapping();
    pk.pack_map(static_cast<uint32_t>(map.size()));
    for (const auto &[key, item] : map) {
      pk.pack_str(static_cast<uint32_t>(key.size()));
      pk.pack_str_body(key.data(), static_cast<uint32_t>(key.size()));
      pack(pk, item);
    }
    return;
  }
  }
}

std::vector<uint8_t> toMsgpack(const Value &value) {
  msgpack::sbuffer buffer;
  msgpack::packer<msgpack::sbuffer> pk(&buffer);
  pack(pk, value);
  const auto *p = reinterpret_cast<const uint8_t *>(buffer.data());
  return std::vector<uint8_t>(p, p + buffer.size());
}

nlohmann::json toJson(const Value &value) {
  switch (value.kind()) {
  case ValueKind::Null:
    return nullptr;
  case ValueKind::Bool:
    return value.asBool();
  case ValueKind::Integer:
    return value.asInteger();
  case ValueKind::Float:
    return value.asFloat();
  case ValueKind::String:
    return value.asString();
  case ValueKind::Binary:
    return toHex(value.asBinary());
  case ValueKind::Timestamp:
    return formatRfc3339(value.asTimestamp());
  case ValueKind::Sequence: {
    auto arr = nlohmann::json::array();
    for (const auto &item : value.asSequence())
      arr.push_back(toJson(item));
    return arr;
  }
  case ValueKind::Mapping: {
    auto obj = nlohmann::json::object();
    for (const auto &[key, item] : value.asMapping())
      obj[key] = toJson(item);
    return obj;
  }
  }
  return nullptr;
}

} // namespace polyrec
