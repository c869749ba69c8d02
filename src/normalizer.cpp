//===- normalizer.cpp - Canonical discriminator keys -----------------------===//

#include "polyrec/normalizer.h"

#include <cmath>
#include <utility>

namespace polyrec {

DiscriminatorKey DiscriminatorKey::integer(int64_t v) {
  DiscriminatorKey key;
  key.form_ = Form::Integer;
  key.int_ = v;
  return key;
}

DiscriminatorKey DiscriminatorKey::string(std::string s) {
  DiscriminatorKey key;
  key.form_ = Form::String;
  key.str_ = std::move(s);
  return key;
}

DiscriminatorKey DiscriminatorKey::unnormalizable() {
  return DiscriminatorKey();
}

std::string DiscriminatorKey::str() const {
  switch (form_) {
  case Form::Integer:
    return std::to_string(int_);
  case Form::String:
    return "\"" + str_ + "\"";
  case Form::Unnormalizable:
    break;
  }
  return "<unnormalizable>";
}

bool operator==(const DiscriminatorKey &a, const DiscriminatorKey &b) {
  // Unnormalizable keys are never equal, not even to each other.
  if (a.form_ != b.form_ || a.form_ == DiscriminatorKey::Form::Unnormalizable)
    return false;
  if (a.form_ == DiscriminatorKey::Form::Integer)
    return a.int_ == b.int_;
  return a.str_ == b.str_;
}

DiscriminatorKey normalizeDiscriminator(const Value &raw) {
  switch (raw.kind()) {
  case ValueKind::Integer:
    return DiscriminatorKey::integer(raw.asInteger());
  case ValueKind::Float: {
    double d = raw.asFloat();
    // 2^63 is exactly representable; anything at or above it overflows int64.
    if (std::isfinite(d) && std::trunc(d) == d && d >= -9223372036854775808.0 &&
        d < 9223372036854775808.0)
      return DiscriminatorKey::integer(static_cast<int64_t>(d));
    return DiscriminatorKey::unnormalizable();
  }
  case ValueKind::String:
    return DiscriminatorKey::string(raw.asString());
  default:
    return DiscriminatorKey::unnormalizable();
  }
}

} // namespace polyrec

size_t std::hash<polyrec::DiscriminatorKey>::operator()(
    const polyrec::DiscriminatorKey &key) const noexcept {
  switch (key.form()) {
  case polyrec::DiscriminatorKey::Form::Integer:
    return std::hash<int64_t>()(key.intValue());
  case polyrec::DiscriminatorKey::Form::String:
    return std::hash<std::string>()(key.stringValue()) ^ 0x9e3779b97f4a7c15ULL;
  case polyrec::DiscriminatorKey::Form::Unnormalizable:
    break;
  }
  return 0;
}
