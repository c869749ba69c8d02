//===- preprocessor.cpp - Record preprocessors -----------------------------===//

#include "polyrec/preprocessor.h"

namespace polyrec {

void PreprocessorChain::run(const Value &doc, Slot &target, DecodeContext &ctx) const {
  for (const auto &pre : preprocessors_) {
    if (!pre->run(doc, target, ctx))
      ctx.fail(ErrorKind::PreprocessorFailure,
               "preprocessor '" + std::string(pre->name()) + "' rejected the record");
  }
}

bool readObjectId(const Value &doc, std::string_view key, std::string &out) {
  const Value *id = doc.find(key);
  if (!id)
    return true;
  if (id->isBinary()) {
    out = toHex(id->asBinary());
    return true;
  }
  if (id->isString()) {
    out = id->asString();
    return true;
  }
  return false;
}

} // namespace polyrec
