//===- normalizer.h - Canonical discriminator keys ---------------*- C++ -*-===//
//
// Discriminator values arrive in several representations depending on the
// encoder: a string tag, an integer code, the same code as a float, or (on
// the C++ side) an enumerator. normalizeDiscriminator() collapses them into
// one DiscriminatorKey so registry lookups compare canonical forms only.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "polyrec/value.h"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>

namespace polyrec {

class DiscriminatorKey {
public:
  enum class Form { Unnormalizable, Integer, String };

  DiscriminatorKey() = default;

  static DiscriminatorKey integer(int64_t v);
  static DiscriminatorKey string(std::string s);
  static DiscriminatorKey unnormalizable();

  Form form() const { return form_; }
  bool isNormalized() const { return form_ != Form::Unnormalizable; }
  int64_t intValue() const { return int_; }
  const std::string &stringValue() const { return str_; }

  /// Rendering used in diagnostics: 7, "text", or <unnormalizable>.
  std::string str() const;

  friend bool operator==(const DiscriminatorKey &a, const DiscriminatorKey &b);
  friend bool operator!=(const DiscriminatorKey &a, const DiscriminatorKey &b) {
    return !(a == b);
  }

private:
  Form form_ = Form::Unnormalizable;
  int64_t int_ = 0;
  std::string str_;
};

/// Total function from any document value to its canonical key. Values that
/// cannot name a shape (null, bool, non-integral float, containers, ...)
/// produce the unnormalizable key, which never matches a registry entry.
DiscriminatorKey normalizeDiscriminator(const Value &raw);

template <typename I,
          std::enable_if_t<std::is_integral_v<I> && !std::is_same_v<I, bool>, int> = 0>
DiscriminatorKey normalizeDiscriminator(I raw) {
  return DiscriminatorKey::integer(static_cast<int64_t>(raw));
}

inline DiscriminatorKey normalizeDiscriminator(double raw) {
  return normalizeDiscriminator(Value(raw));
}

inline DiscriminatorKey normalizeDiscriminator(bool) {
  return DiscriminatorKey::unnormalizable();
}

inline DiscriminatorKey normalizeDiscriminator(const std::string &raw) {
  return DiscriminatorKey::string(raw);
}

inline DiscriminatorKey normalizeDiscriminator(std::string_view raw) {
  return DiscriminatorKey::string(std::string(raw));
}

inline DiscriminatorKey normalizeDiscriminator(const char *raw) {
  return DiscriminatorKey::string(raw);
}

/// Symbolic constants normalize to their integer encoding.
template <typename E, std::enable_if_t<std::is_enum_v<E>, int> = 0>
DiscriminatorKey normalizeDiscriminator(E raw) {
  return DiscriminatorKey::integer(static_cast<int64_t>(static_cast<std::underlying_type_t<E>>(raw)));
}

} // namespace polyrec

template <> struct std::hash<polyrec::DiscriminatorKey> {
  size_t operator()(const polyrec::DiscriminatorKey &key) const noexcept;
};
