//===- registry.cpp - Discriminator key table ------------------------------===//

#include "polyrec/registry.h"

namespace polyrec {
namespace detail {

void KeyIndex::insert(const DiscriminatorKey &key, size_t entry, std::string_view shapeName) {
  if (!key.isNormalized())
    throw DecodeError(ErrorKind::InvalidKey,
                      "cannot register " + std::string(shapeName) +
                          " under a key that does not normalize");
  auto it = index_.find(key);
  if (it != index_.end())
    throw DecodeError(ErrorKind::DuplicateKey,
                      "key " + key.str() + " for " + std::string(shapeName) +
                          " is already registered for " + it->second.shape,
                      {}, {}, key.str());
  index_.emplace(key, Owner{entry, std::string(shapeName)});
}

void KeyIndex::setFallback(size_t entry, std::string_view shapeName) {
  if (fallback_)
    throw DecodeError(ErrorKind::FallbackAlreadySet,
                      "cannot make " + std::string(shapeName) + " the fallback, " +
                          fallbackShape_ + " already is");
  fallback_ = entry;
  fallbackShape_ = std::string(shapeName);
}

const size_t *KeyIndex::find(const DiscriminatorKey &key) const {
  auto it = index_.find(key);
  if (it == index_.end())
    return nullptr;
  return &it->second.entry;
}

} // namespace detail
} // namespace polyrec
