//===- registry.h - Discriminator registry and polymorphic hook --*- C++ -*-===//
//
// A polymorphic slot is a std::variant whose alternatives are record shapes.
// TypeRegistry<Variant> maps normalized discriminator keys to the
// alternative to build; PolymorphicHook<Variant> plugs the registry into the
// hook chain so that resolution happens once per polymorphic value, during
// ordinary field population:
//
//   registry (discriminator field "type")
//     "text", BlockType::Text  → TextBlock
//     "image", BlockType::Image → ImageBlock
//     fallback                 → UnknownBlock
//
// Registries are assembled with a Builder and sealed by build(); the sealed
// registry only answers queries, so it can be shared across threads.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "polyrec/context.h"
#include "polyrec/error.h"
#include "polyrec/hooks.h"
#include "polyrec/mapper.h"
#include "polyrec/normalizer.h"
#include "polyrec/shape.h"
#include "polyrec/value.h"

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace polyrec {

namespace detail {

template <typename T, typename Variant> struct IsAlternative : std::false_type {};
template <typename T, typename... Ts>
struct IsAlternative<T, std::variant<Ts...>> : std::bool_constant<(std::is_same_v<T, Ts> || ...)> {};

/// Key table shared by every registry instantiation; holds entry indices.
class KeyIndex {
public:
  /// Throws DuplicateKey on collision and InvalidKey for unnormalizable keys.
  void insert(const DiscriminatorKey &key, size_t entry, std::string_view shapeName);
  /// Throws FallbackAlreadySet on a second call.
  void setFallback(size_t entry, std::string_view shapeName);

  const size_t *find(const DiscriminatorKey &key) const;
  std::optional<size_t> fallback() const { return fallback_; }
  size_t size() const { return index_.size(); }

private:
  struct Owner {
    size_t entry;
    std::string shape;
  };

  std::unordered_map<DiscriminatorKey, Owner> index_;
  std::optional<size_t> fallback_;
  std::string fallbackShape_;
};

} // namespace detail

template <typename Variant> class TypeRegistry {
public:
  using Instantiate = std::function<Variant(const Value &, DecodeContext &)>;

  struct Entry {
    std::shared_ptr<const ShapeDescriptor> shape;
    Instantiate instantiate;
  };

  class Builder {
  public:
    explicit Builder(std::string discriminatorField)
        : field_(std::move(discriminatorField)) {}

    /// Map \p key (after normalization) to \p shape. Keys that collide with
    /// an already registered key fail with DuplicateKey, whichever
    /// representation registered it.
    template <typename Alt, typename Key>
    Builder &registerShape(const Key &key, const Shape<Alt> &shape = Describe<Alt>::shape()) {
      static_assert(detail::IsAlternative<Alt, Variant>::value,
                    "registered shape must be an alternative of the registry's variant");
      checkOpen();
      size_t entry = entryFor<Alt>(shape);
      index_.insert(normalizeDiscriminator(key), entry, shape.name());
      return *this;
    }

    /// Shape used when the discriminator is unknown or absent. A second call
    /// fails with FallbackAlreadySet.
    template <typename Alt> Builder &setFallback(const Shape<Alt> &shape = Describe<Alt>::shape()) {
      static_assert(detail::IsAlternative<Alt, Variant>::value,
                    "fallback shape must be an alternative of the registry's variant");
      checkOpen();
      size_t entry = entryFor<Alt>(shape);
      index_.setFallback(entry, shape.name());
      return *this;
    }

    /// Seal the registry. The builder is consumed: registering through it
    /// afterwards is a programming error and throws std::logic_error.
    TypeRegistry build() {
      checkOpen();
      sealed_ = true;
      return TypeRegistry(field_, std::move(entries_), std::move(index_));
    }

  private:
    void checkOpen() const {
      if (sealed_)
        throw std::logic_error("registry for '" + field_ + "' is already built");
    }

    // Several keys registered for the same shape share one entry.
    template <typename Alt> size_t entryFor(const Shape<Alt> &shape) {
      for (size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].shape->type() == shape.type() && entries_[i].shape->name() == shape.name())
          return i;
      }
      auto owned = std::make_shared<const Shape<Alt>>(shape);
      Instantiate instantiate = [owned](const Value &doc, DecodeContext &ctx) -> Variant {
        Alt record{};
        decodeRecord(doc, record, ctx, *owned);
        return Variant(std::in_place_type<Alt>, std::move(record));
      };
      entries_.push_back(Entry{owned, std::move(instantiate)});
      return entries_.size() - 1;
    }

    std::string field_;
    std::vector<Entry> entries_;
    detail::KeyIndex index_;
    bool sealed_ = false;
  };

  /// Key of the discriminator field inside each record.
  const std::string &discriminatorField() const { return field_; }
  size_t size() const { return index_.size(); }
  bool hasFallback() const { return index_.fallback().has_value(); }

  /// Entry for a raw discriminator value. Falls back when the key is not
  /// registered; without a fallback throws UnknownDiscriminator.
  const Entry &resolve(const Value &raw) const {
    if (const Entry *entry = lookup(raw))
      return *entry;
    throw DecodeError(ErrorKind::UnknownDiscriminator, unknownMessage(raw), {}, {},
                      raw.describe());
  }

  /// As resolve(), with errors annotated from \p ctx.
  const Entry &resolve(const Value &raw, const DecodeContext &ctx) const {
    if (const Entry *entry = lookup(raw))
      return *entry;
    ctx.fail(ErrorKind::UnknownDiscriminator, unknownMessage(raw), raw.describe());
  }

  /// Entry for a record without the discriminator field: the fallback, or
  /// MissingDiscriminator.
  const Entry &resolveMissing() const {
    if (auto fb = index_.fallback())
      return entries_[*fb];
    throw DecodeError(ErrorKind::MissingDiscriminator, missingMessage());
  }

  const Entry &resolveMissing(const DecodeContext &ctx) const {
    if (auto fb = index_.fallback())
      return entries_[*fb];
    ctx.fail(ErrorKind::MissingDiscriminator, missingMessage());
  }

private:
  TypeRegistry(std::string field, std::vector<Entry> entries, detail::KeyIndex index)
      : field_(std::move(field)), entries_(std::move(entries)), index_(std::move(index)) {}

  const Entry *lookup(const Value &raw) const {
    if (const size_t *entry = index_.find(normalizeDiscriminator(raw)))
      return &entries_[*entry];
    if (auto fb = index_.fallback())
      return &entries_[*fb];
    return nullptr;
  }

  std::string unknownMessage(const Value &raw) const {
    return "no shape registered for " + field_ + " = " + raw.describe() + " and no fallback";
  }

  std::string missingMessage() const {
    return "record has no '" + field_ + "' field and no fallback shape is set";
  }

  std::string field_;
  std::vector<Entry> entries_;
  detail::KeyIndex index_;
};

/// Resolves Variant destinations through \p registry. The registry must
/// outlive the hook.
template <typename Variant> class PolymorphicHook final : public Hook {
public:
  explicit PolymorphicHook(const TypeRegistry<Variant> &registry) : registry_(registry) {}

  std::string_view name() const override { return "polymorphic"; }

  HookResult apply(const Value &value, Slot &dest, DecodeContext &ctx) const override {
    Variant *out = dest.as<Variant>();
    if (!out)
      return HookResult::passThrough();
    // Malformed input is left to the structural mapper to report.
    if (!value.isMapping())
      return HookResult::passThrough();

    const Value *discriminator = value.find(registry_.discriminatorField());
    const auto &entry =
        discriminator ? registry_.resolve(*discriminator, ctx) : registry_.resolveMissing(ctx);
    if (ctx.tracing())
      ctx.trace("resolved " + (discriminator ? discriminator->describe() : std::string("<absent>")) +
                " to " + entry.shape->name());

    *out = entry.instantiate(value, ctx);
    return HookResult::stored();
  }

private:
  const TypeRegistry<Variant> &registry_;
};

} // namespace polyrec
