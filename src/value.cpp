//===- value.cpp - Generic document model ----------------------------------===//

#include "polyrec/value.h"

#include <cmath>
#include <sstream>

namespace polyrec {

const char *valueKindName(ValueKind kind) {
  switch (kind) {
  case ValueKind::Null:
    return "null";
  case ValueKind::Bool:
    return "bool";
  case ValueKind::Integer:
    return "integer";
  case ValueKind::Float:
    return "float";
  case ValueKind::String:
    return "string";
  case ValueKind::Binary:
    return "binary";
  case ValueKind::Timestamp:
    return "timestamp";
  case ValueKind::Sequence:
    return "sequence";
  case ValueKind::Mapping:
    return "mapping";
  }
  return "unknown";
}

const Value *Value::find(std::string_view key) const {
  if (!isMapping())
    return nullptr;
  for (const auto &[k, v] : asMapping()) {
    if (k == key)
      return &v;
  }
  return nullptr;
}

Value &Value::set(std::string key, Value value) {
  if (isNull())
    storage_ = Mapping{};
  auto &entries = asMapping();
  for (auto &[k, v] : entries) {
    if (k == key) {
      v = std::move(value);
      return *this;
    }
  }
  entries.emplace_back(std::move(key), std::move(value));
  return *this;
}

Value &Value::push(Value value) {
  if (isNull())
    storage_ = Sequence{};
  asSequence().push_back(std::move(value));
  return *this;
}

std::string Value::describe() const {
  switch (kind()) {
  case ValueKind::Null:
    return "null";
  case ValueKind::Bool:
    return asBool() ? "true" : "false";
  case ValueKind::Integer:
    return std::to_string(asInteger());
  case ValueKind::Float: {
    std::ostringstream os;
    os << asFloat();
    return os.str();
  }
  case ValueKind::String:
    return "\"" + asString() + "\"";
  case ValueKind::Binary:
    return "binary(" + toHex(asBinary()) + ")";
  case ValueKind::Timestamp: {
    auto ns = asTimestamp().time_since_epoch().count();
    return "timestamp(" + std::to_string(ns) + "ns)";
  }
  case ValueKind::Sequence:
    return "sequence[" + std::to_string(asSequence().size()) + "]";
  case ValueKind::Mapping:
    return "mapping{" + std::to_string(asMapping().size()) + "}";
  }
  return "?";
}

std::string toHex(const Bytes &bytes) {
  static constexpr char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (uint8_t b : bytes) {
    out.push_back(digits[b >> 4]);
    out.push_back(digits[b & 0x0f]);
  }
  return out;
}

} // namespace polyrec
