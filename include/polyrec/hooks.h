//===- hooks.h - Value-level conversion hooks -------------------*- C++ -*-===//
//
// Before the structural mapper coerces a document value into its
// destination, the value is offered to the HookChain. Each hook looks at the
// value's kind and the destination's TypeTag and either passes, returns a
// converted value for the mapper to store, or writes the destination slot
// itself (polymorphic resolution does this, see registry.h).
//
// Hooks are tried in registration order and the first claim wins, so a
// format-specific hook placed earlier shadows a generic one.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "polyrec/context.h"
#include "polyrec/shape.h"
#include "polyrec/value.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace polyrec {

class HookResult {
public:
  enum class Status {
    PassThrough, // not handled; try the next hook
    Converted,   // value() replaces the document value
    Stored,      // the hook populated the slot itself
  };

  static HookResult passThrough() { return HookResult(Status::PassThrough, Value()); }
  static HookResult converted(Value value) { return HookResult(Status::Converted, std::move(value)); }
  static HookResult stored() { return HookResult(Status::Stored, Value()); }

  Status status() const { return status_; }
  bool claimed() const { return status_ != Status::PassThrough; }
  const Value &value() const { return value_; }

private:
  HookResult(Status status, Value value) : status_(status), value_(std::move(value)) {}

  Status status_;
  Value value_;
};

class Hook {
public:
  virtual ~Hook() = default;

  virtual std::string_view name() const = 0;

  /// Hooks must not keep per-call state: one hook instance serves every
  /// concurrent decode.
  virtual HookResult apply(const Value &value, Slot &dest, DecodeContext &ctx) const = 0;
};

/// Ordered, immutable list of hooks.
class HookChain {
public:
  HookChain() = default;
  explicit HookChain(std::vector<std::shared_ptr<const Hook>> hooks) : hooks_(std::move(hooks)) {}

  /// First claiming hook's result, or PassThrough if none claims.
  HookResult apply(const Value &value, Slot &dest, DecodeContext &ctx) const;

  size_t size() const { return hooks_.size(); }
  bool empty() const { return hooks_.empty(); }

private:
  std::vector<std::shared_ptr<const Hook>> hooks_;
};

// ── Stock hooks ─────────────────────────────────────────────────────────────

/// Converts timestamp encodings into Timestamp destinations:
///   - RFC 3339 text, first with fractional seconds, then without;
///   - an already structured timestamp;
///   - an integer: whole seconds since the Unix epoch;
///   - a float: fractional milliseconds since the Unix epoch.
/// Text in neither profile fails with UnsupportedTimeFormat; other kinds pass.
class TimestampHook final : public Hook {
public:
  std::string_view name() const override { return "timestamp"; }
  HookResult apply(const Value &value, Slot &dest, DecodeContext &ctx) const override;
};

/// Renders binary identifiers as lowercase hex into string destinations.
class IdentifierHook final : public Hook {
public:
  std::string_view name() const override { return "identifier"; }
  HookResult apply(const Value &value, Slot &dest, DecodeContext &ctx) const override;
};

/// Build a Timestamp from an epoch offset. Returns nullopt when the instant
/// falls outside what Timestamp can hold (roughly the years 1678 to 2262).
std::optional<Timestamp> timestampFromEpoch(int64_t seconds, int64_t nanos = 0);

/// Parse RFC 3339 text with a mandatory fractional-seconds part
/// ("2024-01-15T10:30:00.250Z").
std::optional<Timestamp> parseRfc3339Nano(std::string_view text);

/// Parse RFC 3339 text without fractional seconds ("2024-01-15T10:30:00Z").
std::optional<Timestamp> parseRfc3339(std::string_view text);

/// Format as RFC 3339 in UTC, with nanoseconds only when non-zero.
std::string formatRfc3339(Timestamp ts);

} // namespace polyrec
