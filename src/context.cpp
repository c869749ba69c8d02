//===- context.cpp - Per-call decoding state -------------------------------===//

#include "polyrec/context.h"

#include "llvm/Support/raw_ostream.h"

#include <utility>

namespace polyrec {

DecodeContext::DecodeContext(const DecodeOptions &options, const HookChain &hooks,
                             const PreprocessorChain &preprocessors)
    : options_(options), hooks_(hooks), preprocessors_(preprocessors) {}

std::string DecodeContext::path() const {
  std::string out;
  for (const auto &segment : path_) {
    if (!out.empty() && segment.front() != '[')
      out += '.';
    out += segment;
  }
  return out;
}

std::string_view DecodeContext::currentShape() const {
  if (shapes_.empty())
    return {};
  return shapes_.back();
}

void DecodeContext::fail(ErrorKind kind, std::string message, std::string discriminator) const {
  throw DecodeError(kind, std::move(message), std::string(currentShape()), path(),
                    std::move(discriminator));
}

void DecodeContext::trace(std::string_view message) const {
  if (!options_.trace)
    return;
  auto &os = *options_.trace;
  os.indent(depth() * 2) << "polyrec: " << message;
  if (!path_.empty())
    os << " @ " << path();
  os << '\n';
}

// ── FieldScope ──────────────────────────────────────────────────────────────

FieldScope::FieldScope(DecodeContext &ctx, std::string_view key) : ctx_(ctx) {
  ctx_.path_.emplace_back(key);
}

FieldScope::FieldScope(DecodeContext &ctx, size_t index) : ctx_(ctx) {
  ctx_.path_.push_back("[" + std::to_string(index) + "]");
}

FieldScope::~FieldScope() {
  ctx_.path_.pop_back();
}

// ── RecordScope ─────────────────────────────────────────────────────────────

RecordScope::RecordScope(DecodeContext &ctx, std::string_view shapeName) : ctx_(ctx) {
  // The top-level record does not count against the nesting limit.
  if (ctx_.depth() > ctx_.options().max_depth)
    ctx_.fail(ErrorKind::DepthLimitExceeded,
              "record nesting exceeds " + std::to_string(ctx_.options().max_depth) +
                  " levels while entering " + std::string(shapeName));
  ctx_.shapes_.emplace_back(shapeName);
  if (ctx_.tracing())
    ctx_.trace("enter " + std::string(shapeName));
}

RecordScope::~RecordScope() {
  ctx_.shapes_.pop_back();
}

} // namespace polyrec
