//===- decoder.h - The decoding pipeline ------------------------*- C++ -*-===//
//
// Decoder composes the stages for one record:
//
//   bytes --parse--> Value --preprocess--> --resolve & map--> T
//
// Resolution happens per polymorphic value: whenever the mapper reaches a
// std::variant slot, the registry's PolymorphicHook picks the alternative
// and re-enters the record pipeline for the sub-document.
//
// A Decoder holds references to its chains; the chains (and the registries
// their hooks refer to) must outlive it. Decoding never mutates them, so one
// Decoder may be used from many threads at once.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "polyrec/codec.h"
#include "polyrec/context.h"
#include "polyrec/hooks.h"
#include "polyrec/mapper.h"
#include "polyrec/preprocessor.h"
#include "polyrec/value.h"

#include <cstddef>
#include <cstdint>
#include <utility>

namespace polyrec {

class Decoder {
public:
  Decoder(const HookChain &hooks, const PreprocessorChain &preprocessors,
          DecodeOptions options = {})
      : hooks_(hooks), preprocessors_(preprocessors), options_(std::move(options)) {}

  const DecodeOptions &options() const { return options_; }

  /// Decode an in-memory document into T. T may be any supported
  /// destination: a described record, a polymorphic variant, a sequence of
  /// those, and so on.
  template <typename T> T decode(const Value &doc) const {
    DecodeContext ctx(options_, hooks_, preprocessors_);
    T target{};
    constexpr SlotKind kind = slotKindOf<T>();
    if constexpr (kind == SlotKind::Shape || kind == SlotKind::Polymorphic) {
      // A null field means "absent"; a null record is no record at all.
      if (doc.isNull())
        ctx.fail(ErrorKind::TypeMismatch, "document is null");
    }
    decodeInto(doc, target, ctx);
    return target;
  }

  /// Decode \p doc into \p target using an explicit shape rather than
  /// Describe<T>.
  template <typename T> void decode(const Value &doc, T &target, const Shape<T> &shape) const {
    DecodeContext ctx(options_, hooks_, preprocessors_);
    decodeRecord(doc, target, ctx, shape);
  }

  /// Parse \p data in \p format, then decode. Codec failures surface as
  /// ParseError.
  template <typename T> T decode(Format format, const uint8_t *data, size_t size) const {
    Value doc = parseDocument(format, data, size);
    return decode<T>(doc);
  }

private:
  const HookChain &hooks_;
  const PreprocessorChain &preprocessors_;
  DecodeOptions options_;
};

/// Single-call form of the pipeline. The registry takes part through the
/// PolymorphicHook it was registered with in \p hooks.
template <typename T>
T decode(const uint8_t *data, size_t size, Format format, const DecodeOptions &options,
         const HookChain &hooks, const PreprocessorChain &preprocessors) {
  return Decoder(hooks, preprocessors, options).decode<T>(format, data, size);
}

} // namespace polyrec
