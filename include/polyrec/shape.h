//===- shape.h - Shape descriptors and type-erased slots ---------*- C++ -*-===//
//
// A Shape<T> describes how one concrete C++ type is populated from a
// document: its ordered fields, the document key of each field per tag
// namespace, which fields are required, and which member types they bind to.
//
//   Shape<TextBlock>("TextBlock")
//       .embed("meta", &TextBlock::meta)
//       .field("content", &TextBlock::content).required()
//       .field("lang", &TextBlock::lang).tag("msgpack", "l");
//
// Embedding is resolved when the shape is built: the embedded shape's fields
// are copied into this shape's field list and projected onto the member, so
// decoding never walks nested members looking for promoted fields.
//
// Types that are decoded by type alone (nested records, registry
// alternatives, top-level targets) specialize Describe<T>.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "polyrec/value.h"

#include <concepts>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

namespace polyrec {

class DecodeContext;
template <typename T> class Shape;

/// Specialize with `static const Shape<T> &shape();` to make T decodable by
/// type alone.
template <typename T> struct Describe;

template <typename T>
concept Described = requires {
  { Describe<T>::shape() } -> std::same_as<const Shape<T> &>;
};

// ── Destination type tags ───────────────────────────────────────────────────

enum class SlotKind {
  Bool,
  Integer,
  Float,
  String,
  Binary,
  Timestamp,
  Generic,     // raw Value, stored unconverted
  Optional,    // std::optional<X>
  Sequence,    // std::vector<X>
  Mapping,     // std::map<std::string, X>
  Shape,       // described record type
  Polymorphic, // std::variant of record types, resolved through a registry
};

const char *slotKindName(SlotKind kind);

namespace detail {

template <typename> inline constexpr bool always_false = false;

template <typename T> struct IsOptional : std::false_type {};
template <typename T> struct IsOptional<std::optional<T>> : std::true_type {};

template <typename T> struct IsVector : std::false_type {};
template <typename T, typename A> struct IsVector<std::vector<T, A>> : std::true_type {};

template <typename T> struct IsStringMap : std::false_type {};
template <typename V, typename C, typename A>
struct IsStringMap<std::map<std::string, V, C, A>> : std::true_type {};

template <typename T> struct IsVariant : std::false_type {};
template <typename... Ts> struct IsVariant<std::variant<Ts...>> : std::true_type {};

} // namespace detail

template <typename M> constexpr SlotKind slotKindOf() {
  if constexpr (std::is_same_v<M, bool>)
    return SlotKind::Bool;
  else if constexpr (std::is_integral_v<M>)
    return SlotKind::Integer;
  else if constexpr (std::is_floating_point_v<M>)
    return SlotKind::Float;
  else if constexpr (std::is_same_v<M, std::string>)
    return SlotKind::String;
  else if constexpr (std::is_same_v<M, Bytes>)
    return SlotKind::Binary;
  else if constexpr (std::is_same_v<M, Timestamp>)
    return SlotKind::Timestamp;
  else if constexpr (std::is_same_v<M, Value>)
    return SlotKind::Generic;
  else if constexpr (detail::IsOptional<M>::value)
    return SlotKind::Optional;
  else if constexpr (detail::IsVector<M>::value)
    return SlotKind::Sequence;
  else if constexpr (detail::IsStringMap<M>::value)
    return SlotKind::Mapping;
  else if constexpr (detail::IsVariant<M>::value)
    return SlotKind::Polymorphic;
  else if constexpr (Described<M>)
    return SlotKind::Shape;
  else
    static_assert(detail::always_false<M>, "unsupported field type: specialize Describe<T>");
}

/// Destination type of a slot: its coarse kind plus the exact C++ type.
struct TypeTag {
  SlotKind kind;
  std::type_index type;

  friend bool operator==(const TypeTag &a, const TypeTag &b) {
    return a.kind == b.kind && a.type == b.type;
  }
};

template <typename M> TypeTag typeTagOf() {
  return TypeTag{slotKindOf<M>(), std::type_index(typeid(M))};
}

// ── Slots ───────────────────────────────────────────────────────────────────

template <typename M> class TypedSlot;

/// A type-erased reference to the destination of one value. Hooks and
/// preprocessors inspect tag() and recover the typed reference with as<M>().
class Slot {
public:
  virtual ~Slot() = default;
  virtual const TypeTag &tag() const = 0;

  /// The destination as M, or nullptr if the slot holds another type.
  template <typename M> M *as();
};

template <typename M> class TypedSlot final : public Slot {
public:
  explicit TypedSlot(M &ref) : ref_(ref), tag_(typeTagOf<M>()) {}
  TypedSlot(M &ref, TypeTag tag) : ref_(ref), tag_(tag) {}

  const TypeTag &tag() const override { return tag_; }
  M &get() { return ref_; }

private:
  M &ref_;
  TypeTag tag_;
};

template <typename M> M *Slot::as() {
  auto *typed = dynamic_cast<TypedSlot<M> *>(this);
  return typed ? &typed->get() : nullptr;
}

/// Offer \p value to the hook chain, then coerce it into \p out. Defined in
/// mapper.h.
template <typename M> void decodeInto(const Value &value, M &out, DecodeContext &ctx);

// ── Field metadata ──────────────────────────────────────────────────────────

enum class FieldSource {
  Entry,    // the document entry under the field's key
  Document, // the whole record document
};

struct FieldInfo {
  std::string name;                         // diagnostic name, "meta.id" when embedded
  std::string key;                          // document key in namespaces without a tag
  std::map<std::string, std::string> tags;  // namespace → key; "-" skips the field
  bool required = false;
  FieldSource source = FieldSource::Entry;
  TypeTag type;

  /// Document key in namespace \p ns, or nullptr if the field opts out of
  /// declarative mapping there.
  const std::string *keyFor(std::string_view ns) const;
};

/// Type-independent view of a shape, used by registries and diagnostics.
class ShapeDescriptor {
public:
  virtual ~ShapeDescriptor() = default;

  const std::string &name() const { return name_; }
  std::type_index type() const { return type_; }
  const std::vector<FieldInfo> &fields() const { return fields_; }

  /// Field by diagnostic name, or nullptr.
  const FieldInfo *field(std::string_view name) const;

protected:
  ShapeDescriptor(std::string name, std::type_index type)
      : name_(std::move(name)), type_(type) {}

  /// Append a field, rejecting a second field under the same default key.
  void addField(FieldInfo info);

  std::string name_;
  std::type_index type_;
  std::vector<FieldInfo> fields_;
};

// ── Field bindings ──────────────────────────────────────────────────────────

template <typename T> class FieldBinding {
public:
  virtual ~FieldBinding() = default;
  virtual void decode(const Value &value, T &target, DecodeContext &ctx) const = 0;
  /// Restore the member to its default, for an optional field given as null.
  virtual void reset(T &target) const = 0;
};

template <typename T, typename M> class MemberBinding final : public FieldBinding<T> {
public:
  explicit MemberBinding(M T::*member) : member_(member) {}

  void decode(const Value &value, T &target, DecodeContext &ctx) const override {
    decodeInto(value, target.*member_, ctx);
  }

  void reset(T &target) const override { target.*member_ = M{}; }

private:
  M T::*member_;
};

/// Applies a field binding of an embedded shape to the embedded member.
template <typename T, typename E> class EmbeddedBinding final : public FieldBinding<T> {
public:
  EmbeddedBinding(E T::*member, std::shared_ptr<const FieldBinding<E>> inner)
      : member_(member), inner_(std::move(inner)) {}

  void decode(const Value &value, T &target, DecodeContext &ctx) const override {
    inner_->decode(value, target.*member_, ctx);
  }

  void reset(T &target) const override { inner_->reset(target.*member_); }

private:
  E T::*member_;
  std::shared_ptr<const FieldBinding<E>> inner_;
};

// ── Shape<T> ────────────────────────────────────────────────────────────────

template <typename T> class Shape final : public ShapeDescriptor {
public:
  explicit Shape(std::string name) : ShapeDescriptor(std::move(name), typeid(T)) {}

  using ShapeDescriptor::field;

  /// Declare a field read from the document entry \p key.
  template <typename M> Shape &field(std::string key, M T::*member) {
    FieldInfo info{key, key, {}, false, FieldSource::Entry, typeTagOf<M>()};
    addField(std::move(info));
    bindings_.push_back(std::make_shared<MemberBinding<T, M>>(member));
    last_ = fields_.size() - 1;
    return *this;
  }

  /// Declare a Value member that receives the whole record document.
  Shape &wholeDocument(std::string name, Value T::*member) {
    FieldInfo info{name, name, {}, false, FieldSource::Document, typeTagOf<Value>()};
    addField(std::move(info));
    bindings_.push_back(std::make_shared<MemberBinding<T, Value>>(member));
    last_.reset();
    return *this;
  }

  /// Override the document key of the last declared field in namespace
  /// \p ns. A key of "-" leaves the field to preprocessors in that namespace.
  Shape &tag(std::string ns, std::string key) {
    lastField().tags[std::move(ns)] = std::move(key);
    return *this;
  }

  /// Mark the last declared field as required.
  Shape &required() {
    lastField().required = true;
    return *this;
  }

  /// Flatten the fields of \p shape into this shape, reading them from the
  /// same document and storing them into \p member.
  template <typename E>
  Shape &embed(std::string name, E T::*member, const Shape<E> &shape = Describe<E>::shape()) {
    for (size_t i = 0; i < shape.fields().size(); ++i) {
      FieldInfo info = shape.fields()[i];
      info.name = name + "." + info.name;
      addField(std::move(info));
      bindings_.push_back(std::make_shared<EmbeddedBinding<T, E>>(member, shape.bindingPtr(i)));
    }
    last_.reset();
    return *this;
  }

  const FieldBinding<T> &binding(size_t index) const { return *bindings_[index]; }
  std::shared_ptr<const FieldBinding<T>> bindingPtr(size_t index) const {
    return bindings_[index];
  }

private:
  FieldInfo &lastField() {
    if (!last_)
      throw std::logic_error("shape " + name_ + ": tag()/required() must follow field()");
    return fields_[*last_];
  }

  std::vector<std::shared_ptr<const FieldBinding<T>>> bindings_;
  std::optional<size_t> last_;
};

} // namespace polyrec
