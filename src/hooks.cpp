//===- hooks.cpp - Value-level conversion hooks ----------------------------===//

#include "polyrec/hooks.h"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <string>

namespace polyrec {

HookResult HookChain::apply(const Value &value, Slot &dest, DecodeContext &ctx) const {
  for (const auto &hook : hooks_) {
    HookResult result = hook->apply(value, dest, ctx);
    if (result.claimed()) {
      if (ctx.tracing())
        ctx.trace("hook '" + std::string(hook->name()) + "' claimed " + value.describe());
      return result;
    }
  }
  return HookResult::passThrough();
}

// ── Epoch offsets ───────────────────────────────────────────────────────────

std::optional<Timestamp> timestampFromEpoch(int64_t seconds, int64_t nanos) {
  constexpr int64_t kNanosPerSecond = 1000000000;
  constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
  constexpr int64_t kMin = std::numeric_limits<int64_t>::min();
  if (seconds > kMax / kNanosPerSecond || seconds < kMin / kNanosPerSecond)
    return std::nullopt;
  int64_t base = seconds * kNanosPerSecond;
  if ((nanos > 0 && base > kMax - nanos) || (nanos < 0 && base < kMin - nanos))
    return std::nullopt;
  return Timestamp(std::chrono::nanoseconds(base + nanos));
}

// ── RFC 3339 ────────────────────────────────────────────────────────────────

namespace {

bool readNumber(std::string_view text, size_t &pos, size_t width, int &out) {
  if (pos + width > text.size())
    return false;
  int v = 0;
  for (size_t i = 0; i < width; ++i) {
    char c = text[pos + i];
    if (c < '0' || c > '9')
      return false;
    v = v * 10 + (c - '0');
  }
  out = v;
  pos += width;
  return true;
}

bool expect(std::string_view text, size_t &pos, char c) {
  if (pos >= text.size() || text[pos] != c)
    return false;
  ++pos;
  return true;
}

std::optional<Timestamp> parseProfile(std::string_view text, bool withFraction) {
  using namespace std::chrono;

  size_t pos = 0;
  int y, mo, d, h, mi, s;
  if (!readNumber(text, pos, 4, y) || !expect(text, pos, '-') || !readNumber(text, pos, 2, mo) ||
      !expect(text, pos, '-') || !readNumber(text, pos, 2, d))
    return std::nullopt;
  if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't'))
    return std::nullopt;
  ++pos;
  if (!readNumber(text, pos, 2, h) || !expect(text, pos, ':') || !readNumber(text, pos, 2, mi) ||
      !expect(text, pos, ':') || !readNumber(text, pos, 2, s))
    return std::nullopt;

  int64_t nanos = 0;
  bool hasFraction = pos < text.size() && text[pos] == '.';
  if (hasFraction != withFraction)
    return std::nullopt;
  if (hasFraction) {
    ++pos;
    size_t digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      // Digits beyond nanosecond precision are accepted and truncated.
      if (digits < 9)
        nanos = nanos * 10 + (text[pos] - '0');
      ++digits;
      ++pos;
    }
    if (digits == 0)
      return std::nullopt;
    for (size_t i = digits; i < 9; ++i)
      nanos *= 10;
  }

  int offsetMinutes = 0;
  if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
    ++pos;
  } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
    int sign = text[pos] == '-' ? -1 : 1;
    ++pos;
    int oh, om;
    if (!readNumber(text, pos, 2, oh) || !expect(text, pos, ':') || !readNumber(text, pos, 2, om))
      return std::nullopt;
    if (oh > 23 || om > 59)
      return std::nullopt;
    offsetMinutes = sign * (oh * 60 + om);
  } else {
    return std::nullopt;
  }
  if (pos != text.size())
    return std::nullopt;

  year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
  if (!ymd.ok() || h > 23 || mi > 59 || s > 59)
    return std::nullopt;

  // Seconds first: converting sys_days to nanoseconds directly overflows
  // for years such as 0001 or 9999.
  int64_t secs = int64_t(sys_days{ymd}.time_since_epoch().count()) * 86400 + h * 3600 +
                 mi * 60 + s - int64_t(offsetMinutes) * 60;
  return timestampFromEpoch(secs, nanos);
}

} // namespace

std::optional<Timestamp> parseRfc3339Nano(std::string_view text) {
  return parseProfile(text, true);
}

std::optional<Timestamp> parseRfc3339(std::string_view text) {
  return parseProfile(text, false);
}

std::string formatRfc3339(Timestamp ts) {
  using namespace std::chrono;

  auto dayPoint = floor<days>(ts);
  year_month_day ymd{dayPoint};
  auto rem = ts - dayPoint;
  auto h = duration_cast<hours>(rem);
  rem -= h;
  auto mi = duration_cast<minutes>(rem);
  rem -= mi;
  auto s = duration_cast<seconds>(rem);
  rem -= s;

  char buf[64];
  int n = std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d", int(ymd.year()),
                        unsigned(ymd.month()), unsigned(ymd.day()), int(h.count()),
                        int(mi.count()), int(s.count()));
  std::string out(buf, n > 0 ? static_cast<size_t>(n) : 0);
  if (rem.count() != 0) {
    std::snprintf(buf, sizeof(buf), ".%09lld", static_cast<long long>(rem.count()));
    out += buf;
  }
  out += 'Z';
  return out;
}

// ── TimestampHook ───────────────────────────────────────────────────────────

HookResult TimestampHook::apply(const Value &value, Slot &dest, DecodeContext &ctx) const {
  if (dest.tag().kind != SlotKind::Timestamp)
    return HookResult::passThrough();

  switch (value.kind()) {
  case ValueKind::String: {
    const auto &text = value.asString();
    if (auto ts = parseRfc3339Nano(text))
      return HookResult::converted(*ts);
    if (auto ts = parseRfc3339(text))
      return HookResult::converted(*ts);
    ctx.fail(ErrorKind::UnsupportedTimeFormat,
             "\"" + text + "\" is not a representable RFC 3339 timestamp");
  }
  case ValueKind::Timestamp:
    return HookResult::converted(value);
  case ValueKind::Integer:
    // Whole seconds since the epoch.
    if (auto ts = timestampFromEpoch(value.asInteger()))
      return HookResult::converted(*ts);
    ctx.fail(ErrorKind::UnsupportedTimeFormat,
             "second offset " + value.describe() + " is out of range");
  case ValueKind::Float: {
    // Fractional milliseconds since the epoch.
    double ms = value.asFloat();
    if (!std::isfinite(ms) || std::fabs(ms) >= 9.2e12)
      ctx.fail(ErrorKind::UnsupportedTimeFormat,
               "millisecond offset " + value.describe() + " is out of range");
    double whole;
    double frac = std::modf(ms, &whole);
    auto nanos = static_cast<int64_t>(whole) * 1000000 + std::llround(frac * 1e6);
    return HookResult::converted(Timestamp(std::chrono::nanoseconds(nanos)));
  }
  default:
    return HookResult::passThrough();
  }
}

// ── IdentifierHook ──────────────────────────────────────────────────────────

HookResult IdentifierHook::apply(const Value &value, Slot &dest, DecodeContext &) const {
  if (dest.tag().kind != SlotKind::String || !value.isBinary())
    return HookResult::passThrough();
  return HookResult::converted(toHex(value.asBinary()));
}

} // namespace polyrec
