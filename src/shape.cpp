//===- shape.cpp - Shape descriptors ---------------------------------------===//

#include "polyrec/shape.h"

namespace polyrec {

const char *slotKindName(SlotKind kind) {
  switch (kind) {
  case SlotKind::Bool:
    return "bool";
  case SlotKind::Integer:
    return "integer";
  case SlotKind::Float:
    return "float";
  case SlotKind::String:
    return "string";
  case SlotKind::Binary:
    return "binary";
  case SlotKind::Timestamp:
    return "timestamp";
  case SlotKind::Generic:
    return "value";
  case SlotKind::Optional:
    return "optional";
  case SlotKind::Sequence:
    return "sequence";
  case SlotKind::Mapping:
    return "mapping";
  case SlotKind::Shape:
    return "record";
  case SlotKind::Polymorphic:
    return "polymorphic record";
  }
  return "unknown";
}

const std::string *FieldInfo::keyFor(std::string_view ns) const {
  auto it = tags.find(std::string(ns));
  if (it == tags.end())
    return &key;
  if (it->second == "-")
    return nullptr;
  return &it->second;
}

const FieldInfo *ShapeDescriptor::field(std::string_view name) const {
  for (const auto &f : fields_) {
    if (f.name == name)
      return &f;
  }
  return nullptr;
}

void ShapeDescriptor::addField(FieldInfo info) {
  if (info.source == FieldSource::Entry) {
    for (const auto &f : fields_) {
      if (f.source == FieldSource::Entry && f.key == info.key)
        throw std::logic_error("shape " + name_ + ": fields '" + f.name + "' and '" + info.name +
                               "' both read key '" + info.key + "'");
    }
  }
  fields_.push_back(std::move(info));
}

} // namespace polyrec
