//===- feed.cpp - Content-feed record model --------------------------------===//

#include "polyrec/feed.h"

#include "polyrec/codec.h"
#include "polyrec/hooks.h"
#include "polyrec/preprocessor.h"

#include <memory>

namespace polyrec {

// ── Shapes ──────────────────────────────────────────────────────────────────

const Shape<feed::BlockMeta> &Describe<feed::BlockMeta>::shape() {
  static const Shape<feed::BlockMeta> shape =
      Shape<feed::BlockMeta>("BlockMeta")
          .field("block_id", &feed::BlockMeta::block_id)
          .tag("msgpack", "bid")
          .field("edited_at", &feed::BlockMeta::edited_at);
  return shape;
}

const Shape<feed::TextBlock> &Describe<feed::TextBlock>::shape() {
  static const Shape<feed::TextBlock> shape =
      Shape<feed::TextBlock>("TextBlock")
          .embed("meta", &feed::TextBlock::meta)
          .field("content", &feed::TextBlock::content)
          .required()
          .field("lang", &feed::TextBlock::lang);
  return shape;
}

const Shape<feed::ImageBlock> &Describe<feed::ImageBlock>::shape() {
  static const Shape<feed::ImageBlock> shape =
      Shape<feed::ImageBlock>("ImageBlock")
          .embed("meta", &feed::ImageBlock::meta)
          .field("url", &feed::ImageBlock::url)
          .required()
          .field("width", &feed::ImageBlock::width)
          .tag("msgpack", "w")
          .field("height", &feed::ImageBlock::height)
          .tag("msgpack", "h")
          .field("caption", &feed::ImageBlock::caption);
  return shape;
}

const Shape<feed::UnknownBlock> &Describe<feed::UnknownBlock>::shape() {
  static const Shape<feed::UnknownBlock> shape =
      Shape<feed::UnknownBlock>("UnknownBlock")
          .wholeDocument("raw_data", &feed::UnknownBlock::raw_data);
  return shape;
}

const Shape<feed::Post> &Describe<feed::Post>::shape() {
  static const Shape<feed::Post> shape = Shape<feed::Post>("Post")
                                             .field("id", &feed::Post::id)
                                             .tag("msgpack", "-")
                                             .field("title", &feed::Post::title)
                                             .required()
                                             .field("published_at", &feed::Post::published_at)
                                             .required()
                                             .field("pinned", &feed::Post::pinned)
                                             .field("tags", &feed::Post::tags)
                                             .field("labels", &feed::Post::labels)
                                             .field("blocks", &feed::Post::blocks);
  return shape;
}

namespace feed {

// ── Registry and chains ─────────────────────────────────────────────────────

const TypeRegistry<Block> &blockRegistry() {
  static const TypeRegistry<Block> registry = TypeRegistry<Block>::Builder("type")
                                                  .registerShape<TextBlock>("text")
                                                  .registerShape<TextBlock>(BlockType::Text)
                                                  .registerShape<ImageBlock>("image")
                                                  .registerShape<ImageBlock>(BlockType::Image)
                                                  .setFallback<UnknownBlock>()
                                                  .build();
  return registry;
}

const HookChain &feedHooks() {
  static const HookChain hooks({
      std::make_shared<PolymorphicHook<Block>>(blockRegistry()),
      std::make_shared<TimestampHook>(),
      std::make_shared<IdentifierHook>(),
  });
  return hooks;
}

const PreprocessorChain &feedPreprocessors() {
  static const PreprocessorChain preprocessors({
      objectIdPreprocessor<Post>("_id", &Post::id),
  });
  return preprocessors;
}

// ── JSON rendering ──────────────────────────────────────────────────────────

static nlohmann::json metaJson(const BlockMeta &meta) {
  nlohmann::json j = nlohmann::json::object();
  if (!meta.block_id.empty())
    j["block_id"] = meta.block_id;
  if (meta.edited_at)
    j["edited_at"] = formatRfc3339(*meta.edited_at);
  return j;
}

nlohmann::json toJson(const Block &block) {
  if (const auto *text = std::get_if<TextBlock>(&block)) {
    auto j = metaJson(text->meta);
    j["kind"] = "text";
    j["content"] = text->content;
    if (!text->lang.empty())
      j["lang"] = text->lang;
    return j;
  }
  if (const auto *image = std::get_if<ImageBlock>(&block)) {
    auto j = metaJson(image->meta);
    j["kind"] = "image";
    j["url"] = image->url;
    j["width"] = image->width;
    j["height"] = image->height;
    if (image->caption)
      j["caption"] = *image->caption;
    return j;
  }
  const auto &unknown = std::get<UnknownBlock>(block);
  return {{"kind", "unknown"}, {"raw_data", polyrec::toJson(unknown.raw_data)}};
}

nlohmann::json toJson(const Post &post) {
  nlohmann::json j;
  j["id"] = post.id;
  j["title"] = post.title;
  j["published_at"] = formatRfc3339(post.published_at);
  j["pinned"] = post.pinned;
  j["tags"] = post.tags;
  j["labels"] = post.labels;
  auto blocks = nlohmann::json::array();
  for (const auto &block : post.blocks)
    blocks.push_back(toJson(block));
  j["blocks"] = std::move(blocks);
  return j;
}

} // namespace feed
} // namespace polyrec
