//===- test_mapper.cpp - Tests for structural mapping ----------------------===//
//
// Exercises the structural mapper on plain (non-polymorphic) shapes: weak
// and strict coercion, required fields, embedding, per-namespace tags,
// containers, error paths and the nesting limit.
//
//===----------------------------------------------------------------------===//

#include "polyrec/decoder.h"
#include "polyrec/error.h"
#include "polyrec/shape.h"

#include <cstdint>
#include <cstdio>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace polyrec;

static int tests_run = 0;
static int tests_passed = 0;

#define TEST(name)                                                                                 \
  do {                                                                                             \
    tests_run++;                                                                                   \
    printf("  test %s ... ", #name);                                                               \
  } while (0)

#define PASS()                                                                                     \
  do {                                                                                             \
    tests_passed++;                                                                                \
    printf("ok\n");                                                                                \
  } while (0)

#define FAIL(msg)                                                                                  \
  do {                                                                                             \
    printf("FAILED: %s\n", msg);                                                                   \
  } while (0)

namespace {

struct Meta {
  std::string id;
  std::optional<std::string> note;
};

struct Card {
  Meta meta;
  std::string title;
  int32_t count = 0;
  bool active = false;
  double score = 0;
  std::vector<std::string> tags;
  std::map<std::string, int64_t> stats;
  std::optional<int32_t> rank;
  std::string secret;
  uint8_t level = 0;
};

struct Node {
  std::string name;
  std::vector<Node> children;
};

} // namespace

namespace polyrec {

template <> struct Describe<Meta> {
  static const Shape<Meta> &shape() {
    static const Shape<Meta> s =
        Shape<Meta>("Meta").field("id", &Meta::id).field("note", &Meta::note);
    return s;
  }
};

template <> struct Describe<Card> {
  static const Shape<Card> &shape() {
    static const Shape<Card> s = Shape<Card>("Card")
                                     .embed("meta", &Card::meta)
                                     .field("title", &Card::title)
                                     .required()
                                     .field("count", &Card::count)
                                     .field("active", &Card::active)
                                     .field("score", &Card::score)
                                     .field("tags", &Card::tags)
                                     .field("stats", &Card::stats)
                                     .field("rank", &Card::rank)
                                     .field("secret", &Card::secret)
                                     .tag("json", "-")
                                     .tag("msgpack", "sec")
                                     .field("level", &Card::level);
    return s;
  }
};

template <> struct Describe<Node> {
  static const Shape<Node> &shape() {
    static const Shape<Node> s =
        Shape<Node>("Node").field("name", &Node::name).field("children", &Node::children);
    return s;
  }
};

} // namespace polyrec

static const HookChain kNoHooks{};
static const PreprocessorChain kNoPreprocessors{};

static Value baseCard() {
  Value doc;
  doc.set("title", "Hello");
  return doc;
}

static DecodeOptions strictOptions() {
  DecodeOptions opts;
  opts.weak_typing = false;
  return opts;
}

// ---------------------------------------------------------------------------
// Helper: decode and capture the DecodeError, if any
// ---------------------------------------------------------------------------
template <typename T>
static std::optional<DecodeError> decodeError(const Value &doc, DecodeOptions opts = {}) {
  try {
    Decoder(kNoHooks, kNoPreprocessors, opts).decode<T>(doc);
  } catch (const DecodeError &e) {
    return e;
  }
  return std::nullopt;
}

static void test_native_values() {
  TEST(native_values);
  Value doc = baseCard();
  doc.set("id", "c-1");
  doc.set("count", 42);
  doc.set("active", true);
  doc.set("score", 3.5);
  doc.set("tags", Sequence{Value("a"), Value("b")});
  doc.set("stats", Mapping{{"views", Value(10)}, {"likes", Value(2)}});
  doc.set("rank", 7);
  doc.set("level", 200);

  Card card = Decoder(kNoHooks, kNoPreprocessors).decode<Card>(doc);
  if (card.title != "Hello" || card.meta.id != "c-1" || card.count != 42 || !card.active ||
      card.score != 3.5 || card.tags.size() != 2 || card.tags[1] != "b" ||
      card.stats.at("views") != 10 || card.rank != 7 || card.level != 200) {
    FAIL("native document decoded incorrectly");
    return;
  }
  if (card.meta.note.has_value()) {
    FAIL("absent optional field should stay empty");
    return;
  }
  PASS();
}

static void test_weak_typing_equivalence() {
  TEST(weak_typing_equivalence);
  Value native = baseCard();
  native.set("count", 42);
  native.set("active", true);
  native.set("score", 3.5);
  native.set("rank", 3);

  Value textual = baseCard();
  textual.set("count", "42");
  textual.set("active", "TRUE");
  textual.set("score", "3.5");
  textual.set("rank", 3.0);

  Decoder decoder(kNoHooks, kNoPreprocessors);
  Card a = decoder.decode<Card>(native);
  Card b = decoder.decode<Card>(textual);
  if (a.count != b.count || a.active != b.active || a.score != b.score || a.rank != b.rank) {
    FAIL("textual and native values should decode identically");
    return;
  }
  PASS();
}

static void test_weak_typing_into_strings_and_sequences() {
  TEST(weak_typing_into_strings_and_sequences);
  Value doc = baseCard();
  doc.set("title", 12);
  doc.set("tags", "solo");
  Card card = Decoder(kNoHooks, kNoPreprocessors).decode<Card>(doc);
  if (card.title != "12" || card.tags.size() != 1 || card.tags[0] != "solo") {
    FAIL("number should become text and a single value a one-element list");
    return;
  }
  PASS();
}

static void test_uncoercible_text_is_mismatch() {
  TEST(uncoercible_text_is_mismatch);
  Value doc = baseCard();
  doc.set("count", "forty-two");
  auto err = decodeError<Card>(doc);
  if (!err || err->kind() != ErrorKind::TypeMismatch || err->path() != "count" ||
      err->shape() != "Card") {
    FAIL("expected TypeMismatch at count in Card");
    return;
  }
  doc.set("count", "42abc");
  if (!decodeError<Card>(doc)) {
    FAIL("partially numeric text should not coerce");
    return;
  }
  PASS();
}

static void test_strict_mode_rejects_text() {
  TEST(strict_mode_rejects_text);
  Value doc = baseCard();
  doc.set("count", "42");
  auto err = decodeError<Card>(doc, strictOptions());
  if (!err || err->kind() != ErrorKind::TypeMismatch || err->stage() != Stage::Map) {
    FAIL("strict mode should reject \"42\" for an integer field");
    return;
  }

  Value tags = baseCard();
  tags.set("tags", "solo");
  if (!decodeError<Card>(tags, strictOptions())) {
    FAIL("strict mode should not wrap a single value into a list");
    return;
  }

  // Integer widening to float stays allowed.
  Value widen = baseCard();
  widen.set("score", 2);
  Card card = Decoder(kNoHooks, kNoPreprocessors, strictOptions()).decode<Card>(widen);
  if (card.score != 2.0) {
    FAIL("integer should widen to float in strict mode");
    return;
  }
  PASS();
}

static void test_integer_narrowing_out_of_range() {
  TEST(integer_narrowing_out_of_range);
  Value doc = baseCard();
  doc.set("level", 300);
  auto err = decodeError<Card>(doc);
  if (!err || err->kind() != ErrorKind::TypeMismatch || err->path() != "level") {
    FAIL("300 does not fit uint8_t");
    return;
  }
  doc.set("level", -1);
  if (!decodeError<Card>(doc)) {
    FAIL("-1 does not fit uint8_t");
    return;
  }
  PASS();
}

static void test_missing_required_field() {
  TEST(missing_required_field);
  Value doc;
  doc.set("count", 1);
  auto err = decodeError<Card>(doc);
  if (!err || err->kind() != ErrorKind::MissingField || err->path() != "title") {
    FAIL("absent title should be MissingField");
    return;
  }
  doc.set("title", Value());
  err = decodeError<Card>(doc);
  if (!err || err->kind() != ErrorKind::MissingField) {
    FAIL("null title should be MissingField");
    return;
  }
  PASS();
}

static void test_null_optional_resets() {
  TEST(null_optional_resets);
  Value doc = baseCard();
  doc.set("rank", Value());
  doc.set("note", Value());
  Card card = Decoder(kNoHooks, kNoPreprocessors).decode<Card>(doc);
  if (card.rank.has_value() || card.meta.note.has_value()) {
    FAIL("null should leave optionals empty");
    return;
  }
  PASS();
}

static void test_embedding_equivalence() {
  TEST(embedding_equivalence);
  Value metaDoc;
  metaDoc.set("id", "m-9");
  metaDoc.set("note", "pinned by editor");

  Value cardDoc = metaDoc;
  cardDoc.set("title", "Hello");

  Decoder decoder(kNoHooks, kNoPreprocessors);
  Meta standalone = decoder.decode<Meta>(metaDoc);
  Card card = decoder.decode<Card>(cardDoc);
  if (standalone.id != card.meta.id || standalone.note != card.meta.note) {
    FAIL("embedded fields should decode like the standalone shape");
    return;
  }
  const FieldInfo *flattened = Describe<Card>::shape().field("meta.note");
  if (!flattened || flattened->key != "note") {
    FAIL("embedded field should be flattened under its own key");
    return;
  }
  PASS();
}

static void test_namespace_tags() {
  TEST(namespace_tags);
  Value doc = baseCard();
  doc.set("secret", "json-value");
  doc.set("sec", "msgpack-value");

  Card viaJson = Decoder(kNoHooks, kNoPreprocessors).decode<Card>(doc);
  if (!viaJson.secret.empty()) {
    FAIL("field tagged \"-\" should be skipped in the json namespace");
    return;
  }

  DecodeOptions opts;
  opts.tag_namespace = "msgpack";
  Card viaMsgpack = Decoder(kNoHooks, kNoPreprocessors, opts).decode<Card>(doc);
  if (viaMsgpack.secret != "msgpack-value") {
    FAIL("msgpack namespace should read the tagged key");
    return;
  }

  opts.tag_namespace = "yaml";
  Card viaDefault = Decoder(kNoHooks, kNoPreprocessors, opts).decode<Card>(doc);
  if (viaDefault.secret != "json-value") {
    FAIL("untagged namespace should use the default key");
    return;
  }
  PASS();
}

static void test_error_path_in_nested_sequence() {
  TEST(error_path_in_nested_sequence);
  Value bad;
  bad.set("name", Sequence{Value(1)});
  Value ok;
  ok.set("name", "a");
  Value root;
  root.set("name", "root");
  root.set("children", Sequence{ok, bad});

  auto err = decodeError<Node>(root);
  if (!err || err->kind() != ErrorKind::TypeMismatch || err->path() != "children[1].name" ||
      err->shape() != "Node") {
    FAIL("expected TypeMismatch at children[1].name");
    return;
  }
  PASS();
}

static void test_depth_limit() {
  TEST(depth_limit);
  Value leaf;
  leaf.set("name", "leaf");
  Value mid;
  mid.set("name", "mid");
  mid.set("children", Sequence{leaf});
  Value root;
  root.set("name", "root");
  root.set("children", Sequence{mid});

  DecodeOptions opts;
  opts.max_depth = 2;
  Node node = Decoder(kNoHooks, kNoPreprocessors, opts).decode<Node>(root);
  if (node.children.size() != 1 || node.children[0].children[0].name != "leaf") {
    FAIL("two nested levels should decode with max_depth 2");
    return;
  }

  opts.max_depth = 1;
  auto err = decodeError<Node>(root, opts);
  if (!err || err->kind() != ErrorKind::DepthLimitExceeded) {
    FAIL("two nested levels should exceed max_depth 1");
    return;
  }
  PASS();
}

static void test_non_mapping_record() {
  TEST(non_mapping_record);
  if (auto err = decodeError<Card>(Value(5)); !err || err->kind() != ErrorKind::TypeMismatch) {
    FAIL("a scalar cannot populate a record");
    return;
  }
  if (auto err = decodeError<Card>(Value()); !err || err->kind() != ErrorKind::TypeMismatch) {
    FAIL("a null top-level record is a TypeMismatch");
    return;
  }
  PASS();
}

static void test_null_record_element() {
  TEST(null_record_element);
  Value root;
  root.set("name", "root");
  Value child;
  child.set("name", "kept");
  root.set("children", Value(Sequence{Value(), child}));
  auto err = decodeError<Node>(root);
  if (!err || err->kind() != ErrorKind::TypeMismatch || err->path() != "children[0]") {
    FAIL("a null element of a record sequence is a TypeMismatch, not a default record");
    return;
  }
  PASS();
}

static void test_shape_builder_misuse() {
  TEST(shape_builder_misuse);
  bool threw = false;
  try {
    Shape<Meta>("Meta").field("id", &Meta::id).field("id", &Meta::note);
  } catch (const std::logic_error &) {
    threw = true;
  }
  if (!threw) {
    FAIL("two fields on one key should be rejected");
    return;
  }
  threw = false;
  try {
    Shape<Card>("Card").embed("meta", &Card::meta).required();
  } catch (const std::logic_error &) {
    threw = true;
  }
  if (!threw) {
    FAIL("required() after embed() should be rejected");
    return;
  }
  PASS();
}

int main() {
  printf("=== polyrec Mapper Tests ===\n");

  test_native_values();
  test_weak_typing_equivalence();
  test_weak_typing_into_strings_and_sequences();
  test_uncoercible_text_is_mismatch();
  test_strict_mode_rejects_text();
  test_integer_narrowing_out_of_range();
  test_missing_required_field();
  test_null_optional_resets();
  test_embedding_equivalence();
  test_namespace_tags();
  test_error_path_in_nested_sequence();
  test_depth_limit();
  test_non_mapping_record();
  test_null_record_element();
  test_shape_builder_misuse();

  printf("\n%d/%d tests passed.\n", tests_passed, tests_run);
  return (tests_passed == tests_run) ? 0 : 1;
}
