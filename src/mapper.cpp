//===- mapper.cpp - Scalar coercion for the structural mapper --------------===//

#include "polyrec/mapper.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <system_error>

namespace polyrec {
namespace detail {

static bool iequals(std::string_view a, std::string_view b) {
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

/// Parse the whole of \p text as T; partial matches fail.
template <typename T> static bool parseWhole(const std::string &text, T &out) {
  const char *first = text.data();
  const char *last = first + text.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}

void mismatch(const Value &value, SlotKind expected, DecodeContext &ctx) {
  ctx.fail(ErrorKind::TypeMismatch, std::string("expected ") + slotKindName(expected) + ", got " +
                                        valueKindName(value.kind()) + " " + value.describe());
}

void outOfRange(const Value &value, DecodeContext &ctx) {
  ctx.fail(ErrorKind::TypeMismatch, value.describe() + " is out of range for the field's type");
}

void unresolvedPolymorphic(const Value &value, DecodeContext &ctx) {
  if (!value.isMapping())
    ctx.fail(ErrorKind::TypeMismatch, "polymorphic record needs a mapping, got " +
                                          std::string(valueKindName(value.kind())) + " " +
                                          value.describe());
  ctx.fail(ErrorKind::TypeMismatch,
           "no hook resolves a polymorphic record from " + value.describe());
}

void requireMapping(const Value &doc, const ShapeDescriptor &shape, DecodeContext &ctx) {
  if (!doc.isMapping())
    ctx.fail(ErrorKind::TypeMismatch, "shape " + shape.name() + " needs a mapping, got " +
                                          valueKindName(doc.kind()) + " " + doc.describe());
}

bool coerceBool(const Value &value, DecodeContext &ctx) {
  if (value.isBool())
    return value.asBool();
  if (ctx.weakTyping() && value.isString()) {
    if (iequals(value.asString(), "true"))
      return true;
    if (iequals(value.asString(), "false"))
      return false;
  }
  mismatch(value, SlotKind::Bool, ctx);
}

int64_t coerceInteger(const Value &value, DecodeContext &ctx) {
  if (value.isInteger())
    return value.asInteger();
  if (ctx.weakTyping()) {
    if (value.isFloat()) {
      double d = value.asFloat();
      if (std::isfinite(d) && std::trunc(d) == d) {
        if (d < -9223372036854775808.0 || d >= 9223372036854775808.0)
          outOfRange(value, ctx);
        return static_cast<int64_t>(d);
      }
    } else if (value.isString()) {
      int64_t v;
      if (parseWhole(value.asString(), v))
        return v;
    }
  }
  mismatch(value, SlotKind::Integer, ctx);
}

double coerceFloat(const Value &value, DecodeContext &ctx) {
  if (value.isFloat())
    return value.asFloat();
  if (value.isInteger())
    return static_cast<double>(value.asInteger());
  if (ctx.weakTyping() && value.isString()) {
    double d;
    if (parseWhole(value.asString(), d))
      return d;
  }
  mismatch(value, SlotKind::Float, ctx);
}

std::string coerceString(const Value &value, DecodeContext &ctx) {
  if (value.isString())
    return value.asString();
  if (ctx.weakTyping()) {
    switch (value.kind()) {
    case ValueKind::Bool:
      return value.asBool() ? "true" : "false";
    case ValueKind::Integer:
      return std::to_string(value.asInteger());
    case ValueKind::Float: {
      char buf[32];
      auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value.asFloat());
      if (ec == std::errc())
        return std::string(buf, ptr);
      break;
    }
    default:
      break;
    }
  }
  mismatch(value, SlotKind::String, ctx);
}

Bytes coerceBinary(const Value &value, DecodeContext &ctx) {
  if (value.isBinary())
    return value.asBinary();
  mismatch(value, SlotKind::Binary, ctx);
}

Timestamp coerceTimestamp(const Value &value, DecodeContext &ctx) {
  if (value.isTimestamp())
    return value.asTimestamp();
  mismatch(value, SlotKind::Timestamp, ctx);
}

} // namespace detail
} // namespace polyrec
