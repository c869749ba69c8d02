//===- preprocessor.h - Record preprocessors --------------------*- C++ -*-===//
//
// Preprocessors run on every record before structural mapping. They read
// the raw document and write fields of the target directly, typically
// fields tagged "-" for the active namespace because their document form
// needs a format-specific conversion (a binary object identifier, say).
//
//===----------------------------------------------------------------------===//

#pragma once

#include "polyrec/context.h"
#include "polyrec/shape.h"
#include "polyrec/value.h"

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace polyrec {

class Preprocessor {
public:
  virtual ~Preprocessor() = default;

  virtual std::string_view name() const = 0;

  /// Returns false when the record cannot be decoded. Targets of a type the
  /// preprocessor does not handle are left alone and count as success.
  virtual bool run(const Value &doc, Slot &target, DecodeContext &ctx) const = 0;
};

/// Preprocessor for records of type T, wrapping a callable
/// `bool(const Value &doc, T &target)`.
template <typename T> class TypedPreprocessor final : public Preprocessor {
public:
  using Fn = std::function<bool(const Value &, T &)>;

  TypedPreprocessor(std::string name, Fn fn) : name_(std::move(name)), fn_(std::move(fn)) {}

  std::string_view name() const override { return name_; }

  bool run(const Value &doc, Slot &target, DecodeContext &) const override {
    T *record = target.as<T>();
    if (!record)
      return true;
    return fn_(doc, *record);
  }

private:
  std::string name_;
  Fn fn_;
};

template <typename T>
std::shared_ptr<const Preprocessor> makePreprocessor(std::string name,
                                                     typename TypedPreprocessor<T>::Fn fn) {
  return std::make_shared<TypedPreprocessor<T>>(std::move(name), std::move(fn));
}

/// Ordered, immutable list of preprocessors. An empty chain is a no-op.
class PreprocessorChain {
public:
  PreprocessorChain() = default;
  explicit PreprocessorChain(std::vector<std::shared_ptr<const Preprocessor>> preprocessors)
      : preprocessors_(std::move(preprocessors)) {}

  /// Run every preprocessor left to right. The first failure throws
  /// PreprocessorFailure and skips the rest.
  void run(const Value &doc, Slot &target, DecodeContext &ctx) const;

  size_t size() const { return preprocessors_.size(); }

private:
  std::vector<std::shared_ptr<const Preprocessor>> preprocessors_;
};

/// Read the record identifier under \p key and store its canonical string
/// form: binary identifiers become lowercase hex, strings are kept. A record
/// without the key is left untouched; any other kind fails.
bool readObjectId(const Value &doc, std::string_view key, std::string &out);

template <typename T>
std::shared_ptr<const Preprocessor> objectIdPreprocessor(std::string key,
                                                         std::string T::*member) {
  std::string name = "object-id:" + key;
  return makePreprocessor<T>(std::move(name), [key = std::move(key), member](const Value &doc,
                                                                             T &target) {
    return readObjectId(doc, key, target.*member);
  });
}

} // namespace polyrec
