//===- feed.h - Content-feed record model ------------------------*- C++ -*-===//
//
// The record model decoded by polyrec-decode. A Post carries a list of
// content blocks discriminated by their "type" field:
//
//   {"_id": <12 bytes>, "title": "...", "published_at": ...,
//    "blocks": [{"type": "text", "content": "hello"},
//               {"type": 2, "url": "a.png", "width": 640, "height": 480}]}
//
// Blocks share BlockMeta through embedding. Unrecognized block types decode
// to UnknownBlock, which keeps the raw block document.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "polyrec/decoder.h"
#include "polyrec/registry.h"
#include "polyrec/shape.h"
#include "polyrec/value.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace polyrec {
namespace feed {

/// Numeric block codes used by binary producers in place of the type name.
enum class BlockType : int32_t {
  Text = 1,
  Image = 2,
};

struct BlockMeta {
  std::string block_id;
  std::optional<Timestamp> edited_at;
};

struct TextBlock {
  BlockMeta meta;
  std::string content;
  std::string lang;
};

struct ImageBlock {
  BlockMeta meta;
  std::string url;
  int32_t width = 0;
  int32_t height = 0;
  std::optional<std::string> caption;
};

struct UnknownBlock {
  Value raw_data;
};

using Block = std::variant<TextBlock, ImageBlock, UnknownBlock>;

struct Post {
  std::string id;
  std::string title;
  Timestamp published_at;
  bool pinned = false;
  std::vector<std::string> tags;
  std::map<std::string, std::string> labels;
  std::vector<Block> blocks;
};

/// Registry for Block: "text"/BlockType::Text, "image"/BlockType::Image,
/// UnknownBlock as fallback. Built on first use.
const TypeRegistry<Block> &blockRegistry();

/// Hooks: polymorphic blocks, timestamps, binary identifiers.
const HookChain &feedHooks();

/// Preprocessors: Post ids from the binary "_id" field.
const PreprocessorChain &feedPreprocessors();

nlohmann::json toJson(const Block &block);
nlohmann::json toJson(const Post &post);

} // namespace feed

template <> struct Describe<feed::BlockMeta> {
  static const Shape<feed::BlockMeta> &shape();
};
template <> struct Describe<feed::TextBlock> {
  static const Shape<feed::TextBlock> &shape();
};
template <> struct Describe<feed::ImageBlock> {
  static const Shape<feed::ImageBlock> &shape();
};
template <> struct Describe<feed::UnknownBlock> {
  static const Shape<feed::UnknownBlock> &shape();
};
template <> struct Describe<feed::Post> {
  static const Shape<feed::Post> &shape();
};

} // namespace polyrec
