//===- mapper.h - Structural mapping of documents onto shapes ----*- C++ -*-===//
//
// The structural mapper walks a shape's declared fields, finds each field's
// document entry under the key of the active tag namespace, offers the value
// to the hook chain and coerces what comes back into the member.
//
// Weak typing (DecodeOptions::weak_typing) lets textual scalars fill native
// fields ("42" → int, "TRUE" → bool), lets numbers and bools fill string
// fields, integral floats fill integer fields, and wraps a single value into
// a one-element sequence. Anything else that does not fit is TypeMismatch.
//
// Errors abort the record; members written before the failure are not
// rolled back.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "polyrec/context.h"
#include "polyrec/error.h"
#include "polyrec/hooks.h"
#include "polyrec/preprocessor.h"
#include "polyrec/shape.h"
#include "polyrec/value.h"

#include <string>
#include <typeindex>
#include <utility>

namespace polyrec {

namespace detail {

bool coerceBool(const Value &value, DecodeContext &ctx);
int64_t coerceInteger(const Value &value, DecodeContext &ctx);
double coerceFloat(const Value &value, DecodeContext &ctx);
std::string coerceString(const Value &value, DecodeContext &ctx);
Bytes coerceBinary(const Value &value, DecodeContext &ctx);
Timestamp coerceTimestamp(const Value &value, DecodeContext &ctx);

[[noreturn]] void mismatch(const Value &value, SlotKind expected, DecodeContext &ctx);
[[noreturn]] void outOfRange(const Value &value, DecodeContext &ctx);
[[noreturn]] void unresolvedPolymorphic(const Value &value, DecodeContext &ctx);
void requireMapping(const Value &doc, const ShapeDescriptor &shape, DecodeContext &ctx);

} // namespace detail

template <typename T>
void decodeRecord(const Value &doc, T &target, DecodeContext &ctx, const Shape<T> &shape);

/// Coerce \p value into \p out without consulting hooks for \p value itself
/// (element values of containers still go through decodeInto).
template <typename M> void coerce(const Value &value, M &out, DecodeContext &ctx) {
  constexpr SlotKind kind = slotKindOf<M>();

  if constexpr (kind == SlotKind::Generic) {
    out = value;
  } else if constexpr (kind == SlotKind::Optional) {
    if (value.isNull()) {
      out.reset();
      return;
    }
    typename M::value_type inner{};
    decodeInto(value, inner, ctx);
    out = std::move(inner);
  } else {
    // A null record is never defaulted: the shape's required fields would go
    // unchecked. Records and variants report it below instead.
    if constexpr (kind != SlotKind::Shape && kind != SlotKind::Polymorphic) {
      if (value.isNull()) {
        out = M{};
        return;
      }
    }
    if constexpr (kind == SlotKind::Bool) {
      out = detail::coerceBool(value, ctx);
    } else if constexpr (kind == SlotKind::Integer) {
      int64_t v = detail::coerceInteger(value, ctx);
      if (!std::in_range<M>(v))
        detail::outOfRange(value, ctx);
      out = static_cast<M>(v);
    } else if constexpr (kind == SlotKind::Float) {
      out = static_cast<M>(detail::coerceFloat(value, ctx));
    } else if constexpr (kind == SlotKind::String) {
      out = detail::coerceString(value, ctx);
    } else if constexpr (kind == SlotKind::Binary) {
      out = detail::coerceBinary(value, ctx);
    } else if constexpr (kind == SlotKind::Timestamp) {
      out = detail::coerceTimestamp(value, ctx);
    } else if constexpr (kind == SlotKind::Sequence) {
      using Elem = typename M::value_type;
      out.clear();
      if (value.isSequence()) {
        const auto &items = value.asSequence();
        out.reserve(items.size());
        for (size_t i = 0; i < items.size(); ++i) {
          FieldScope scope(ctx, i);
          Elem elem{};
          decodeInto(items[i], elem, ctx);
          out.push_back(std::move(elem));
        }
      } else if (ctx.weakTyping()) {
        Elem elem{};
        decodeInto(value, elem, ctx);
        out.push_back(std::move(elem));
      } else {
        detail::mismatch(value, kind, ctx);
      }
    } else if constexpr (kind == SlotKind::Mapping) {
      if (!value.isMapping())
        detail::mismatch(value, kind, ctx);
      out.clear();
      for (const auto &[key, item] : value.asMapping()) {
        FieldScope scope(ctx, key);
        typename M::mapped_type elem{};
        decodeInto(item, elem, ctx);
        out.insert_or_assign(key, std::move(elem));
      }
    } else if constexpr (kind == SlotKind::Shape) {
      decodeRecord(value, out, ctx, Describe<M>::shape());
    } else if constexpr (kind == SlotKind::Polymorphic) {
      // Reaching here means no hook claimed the value: either it is not a
      // mapping or no hook in the chain resolves this variant.
      detail::unresolvedPolymorphic(value, ctx);
    }
  }
}

template <typename M> void decodeInto(const Value &value, M &out, DecodeContext &ctx) {
  TypedSlot<M> slot(out);
  HookResult result = ctx.hooks().apply(value, slot, ctx);
  switch (result.status()) {
  case HookResult::Status::Stored:
    return;
  case HookResult::Status::Converted:
    coerce(result.value(), out, ctx);
    return;
  case HookResult::Status::PassThrough:
    break;
  }
  coerce(value, out, ctx);
}

/// Populate \p target from the fields of \p doc according to \p shape.
template <typename T>
void mapShape(const Value &doc, const Shape<T> &shape, T &target, DecodeContext &ctx) {
  detail::requireMapping(doc, shape, ctx);

  const auto &fields = shape.fields();
  for (size_t i = 0; i < fields.size(); ++i) {
    const FieldInfo &field = fields[i];
    if (field.source == FieldSource::Document) {
      shape.binding(i).decode(doc, target, ctx);
      continue;
    }

    const std::string *key = field.keyFor(ctx.tagNamespace());
    if (!key)
      continue;

    FieldScope scope(ctx, *key);
    const Value *value = doc.find(*key);
    if (!value || value->isNull()) {
      if (field.required)
        ctx.fail(ErrorKind::MissingField, "required field '" + field.name + "' is missing");
      if (value)
        shape.binding(i).reset(target);
      continue;
    }
    shape.binding(i).decode(*value, target, ctx);
  }
}

/// The record pipeline: preprocess, then map. Every record reached while
/// decoding (top-level, nested, or resolved from a polymorphic slot) goes
/// through here.
template <typename T>
void decodeRecord(const Value &doc, T &target, DecodeContext &ctx, const Shape<T> &shape) {
  RecordScope record(ctx, shape.name());
  detail::requireMapping(doc, shape, ctx);

  // The shape is explicit, so T need not be Described.
  TypedSlot<T> slot(target, TypeTag{SlotKind::Shape, std::type_index(typeid(T))});
  ctx.preprocessors().run(doc, slot, ctx);
  mapShape(doc, shape, target, ctx);
}

template <Described T> void decodeRecord(const Value &doc, T &target, DecodeContext &ctx) {
  decodeRecord(doc, target, ctx, Describe<T>::shape());
}

} // namespace polyrec
