//===- context.h - Per-call decoding state ----------------------*- C++ -*-===//
//
// DecodeOptions is the configuration surface of one decode call. The
// DecodeContext threads those options, the shared hook and preprocessor
// chains, and the per-call diagnostic state (field path, shape stack, depth)
// through every recursive step. The context is the only mutable state of a
// decode, so concurrent calls never share anything writable.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "polyrec/error.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace llvm {
class raw_ostream;
} // namespace llvm

namespace polyrec {

class HookChain;
class PreprocessorChain;

struct DecodeOptions {
  std::string tag_namespace = "json";  // --namespace: which per-field tag set governs lookup
  bool weak_typing = true;             // --strict turns this off
  unsigned max_depth = 64;             // --max-depth: nested records below the top level
  llvm::raw_ostream *trace = nullptr;  // --trace: per-record trace, off when null
};

class DecodeContext {
public:
  DecodeContext(const DecodeOptions &options, const HookChain &hooks,
                const PreprocessorChain &preprocessors);

  DecodeContext(const DecodeContext &) = delete;
  DecodeContext &operator=(const DecodeContext &) = delete;

  const DecodeOptions &options() const { return options_; }
  const std::string &tagNamespace() const { return options_.tag_namespace; }
  bool weakTyping() const { return options_.weak_typing; }
  const HookChain &hooks() const { return hooks_; }
  const PreprocessorChain &preprocessors() const { return preprocessors_; }

  /// Field path from the top-level record, e.g. "blocks[1].width".
  std::string path() const;
  /// Innermost shape being populated; empty before the first record.
  std::string_view currentShape() const;
  /// Number of records currently entered.
  unsigned depth() const { return static_cast<unsigned>(shapes_.size()); }

  /// Throw a DecodeError annotated with the current shape and field path.
  [[noreturn]] void fail(ErrorKind kind, std::string message,
                         std::string discriminator = {}) const;

  bool tracing() const { return options_.trace != nullptr; }
  /// Write one indented trace line. No-op when tracing is off.
  void trace(std::string_view message) const;

private:
  friend class FieldScope;
  friend class RecordScope;

  const DecodeOptions &options_;
  const HookChain &hooks_;
  const PreprocessorChain &preprocessors_;
  std::vector<std::string> path_;
  std::vector<std::string> shapes_;
};

/// RAII: appends a key (".name") or index ("[i]") to the context's field path.
class FieldScope {
public:
  FieldScope(DecodeContext &ctx, std::string_view key);
  FieldScope(DecodeContext &ctx, size_t index);
  ~FieldScope();

  FieldScope(const FieldScope &) = delete;
  FieldScope &operator=(const FieldScope &) = delete;

private:
  DecodeContext &ctx_;
};

/// RAII: marks entry into a record of the named shape. Enforces max_depth.
class RecordScope {
public:
  RecordScope(DecodeContext &ctx, std::string_view shapeName);
  ~RecordScope();

  RecordScope(const RecordScope &) = delete;
  RecordScope &operator=(const RecordScope &) = delete;

private:
  DecodeContext &ctx_;
};

} // namespace polyrec
