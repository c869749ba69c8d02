//===- value.h - Generic document model --------------------------*- C++ -*-===//
//
// Value is the schema-less intermediate representation every input format is
// parsed into before the target shape is known:
//
//   - Null, Bool, Integer (int64), Float (double), String
//   - Binary     → raw byte string (msgpack bin)
//   - Timestamp  → structured point in time (msgpack timestamp extension)
//   - Sequence   → ordered list of values
//   - Mapping    → string-keyed entries; keys are unique, insertion order is
//                  preserved so diagnostics stay deterministic
//
//===----------------------------------------------------------------------===//

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace polyrec {

class Value;

using Bytes = std::vector<uint8_t>;
using Timestamp = std::chrono::sys_time<std::chrono::nanoseconds>;
using Sequence = std::vector<Value>;
using Mapping = std::vector<std::pair<std::string, Value>>;

enum class ValueKind {
  Null,
  Bool,
  Integer,
  Float,
  String,
  Binary,
  Timestamp,
  Sequence,
  Mapping,
};

/// Human-readable name of a value kind ("integer", "mapping", ...).
const char *valueKindName(ValueKind kind);

class Value {
public:
  Value() = default;
  Value(std::nullptr_t) {}
  Value(bool b) : storage_(b) {}
  template <typename I,
            std::enable_if_t<std::is_integral_v<I> && !std::is_same_v<I, bool>, int> = 0>
  Value(I v) : storage_(static_cast<int64_t>(v)) {}
  Value(double v) : storage_(v) {}
  Value(const char *s) : storage_(std::string(s)) {}
  Value(std::string s) : storage_(std::move(s)) {}
  Value(Bytes b) : storage_(std::move(b)) {}
  Value(Timestamp t) : storage_(t) {}
  Value(Sequence s) : storage_(std::move(s)) {}
  Value(Mapping m) : storage_(std::move(m)) {}

  ValueKind kind() const { return static_cast<ValueKind>(storage_.index()); }

  bool isNull() const { return kind() == ValueKind::Null; }
  bool isBool() const { return kind() == ValueKind::Bool; }
  bool isInteger() const { return kind() == ValueKind::Integer; }
  bool isFloat() const { return kind() == ValueKind::Float; }
  bool isNumber() const { return isInteger() || isFloat(); }
  bool isString() const { return kind() == ValueKind::String; }
  bool isBinary() const { return kind() == ValueKind::Binary; }
  bool isTimestamp() const { return kind() == ValueKind::Timestamp; }
  bool isSequence() const { return kind() == ValueKind::Sequence; }
  bool isMapping() const { return kind() == ValueKind::Mapping; }

  // Unchecked accessors; callers test the kind first.
  bool asBool() const { return std::get<bool>(storage_); }
  int64_t asInteger() const { return std::get<int64_t>(storage_); }
  double asFloat() const { return std::get<double>(storage_); }
  const std::string &asString() const { return std::get<std::string>(storage_); }
  const Bytes &asBinary() const { return std::get<Bytes>(storage_); }
  Timestamp asTimestamp() const { return std::get<Timestamp>(storage_); }
  const Sequence &asSequence() const { return std::get<Sequence>(storage_); }
  Sequence &asSequence() { return std::get<Sequence>(storage_); }
  const Mapping &asMapping() const { return std::get<Mapping>(storage_); }
  Mapping &asMapping() { return std::get<Mapping>(storage_); }

  /// Look up a mapping entry. Returns nullptr if this is not a mapping or the
  /// key is absent.
  const Value *find(std::string_view key) const;

  /// Insert or replace a mapping entry, keeping keys unique. Converts a Null
  /// value into an empty mapping first.
  Value &set(std::string key, Value value);

  /// Append to a sequence. Converts a Null value into an empty sequence first.
  Value &push(Value value);

  /// Short rendering for diagnostics: scalars verbatim (strings quoted),
  /// containers summarized by kind and size.
  std::string describe() const;

  friend bool operator==(const Value &a, const Value &b) { return a.storage_ == b.storage_; }
  friend bool operator!=(const Value &a, const Value &b) { return !(a == b); }

private:
  // Alternative order must match ValueKind.
  std::variant<std::monostate, bool, int64_t, double, std::string, Bytes, Timestamp, Sequence,
               Mapping>
      storage_;
};

/// Lowercase hex rendering of a byte string.
std::string toHex(const Bytes &bytes);

} // namespace polyrec
