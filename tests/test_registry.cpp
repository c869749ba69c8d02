//===- test_registry.cpp - Tests for the discriminator registry ------------===//
//
// Covers registration errors (duplicate keys across representations,
// second fallback, keys that do not normalize), builder sealing, and the
// resolve / resolveMissing query paths.
//
//===----------------------------------------------------------------------===//

#include "polyrec/error.h"
#include "polyrec/registry.h"

#include <cstdio>
#include <stdexcept>
#include <string>
#include <variant>

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

enum class ShapeCode : int32_t { Circle = 1, Square = 2 };

struct Circle {
  double radius = 0;
};

struct Square {
  double side = 0;
};

struct Blob {
  Value raw;
};

using Figure = std::variant<Circle, Square, Blob>;

} // namespace

namespace polyrec {

template <> struct Describe<Circle> {
  static const Shape<Circle> &shape() {
    static const Shape<Circle> s = Shape<Circle>("Circle").field("radius", &Circle::radius);
    return s;
  }
};

template <> struct Describe<Square> {
  static const Shape<Square> &shape() {
    static const Shape<Square> s = Shape<Square>("Square").field("side", &Square::side);
    return s;
  }
};

template <> struct Describe<Blob> {
  static const Shape<Blob> &shape() {
    static const Shape<Blob> s = Shape<Blob>("Blob").wholeDocument("raw", &Blob::raw);
    return s;
  }
};

} // namespace polyrec

// ---------------------------------------------------------------------------
// Helper: run \p fn and report the DecodeError kind it throws, if any
// ---------------------------------------------------------------------------
template <typename Fn> static bool throwsKind(Fn &&fn, ErrorKind kind) {
  try {
    fn();
  } catch (const DecodeError &e) {
    return e.kind() == kind;
  }
  return false;
}

static void test_resolve_all_representations() {
  TEST(resolve_all_representations);
  auto registry = TypeRegistry<Figure>::Builder("shape")
                      .registerShape<Circle>("circle")
                      .registerShape<Circle>(ShapeCode::Circle)
                      .registerShape<Square>("square")
                      .build();

  const auto &byName = registry.resolve(Value("circle"));
  const auto &byInt = registry.resolve(Value(1));
  const auto &byFloat = registry.resolve(Value(1.0));
  if (&byName != &byInt || &byInt != &byFloat) {
    FAIL("all representations of the circle key should resolve to one entry");
    return;
  }
  if (byName.shape->name() != "Circle") {
    FAIL("expected Circle");
    return;
  }
  if (registry.resolve(Value("square")).shape->name() != "Square") {
    FAIL("expected Square");
    return;
  }
  if (registry.size() != 3 || registry.discriminatorField() != "shape" || registry.hasFallback()) {
    FAIL("unexpected registry metadata");
    return;
  }
  PASS();
}

static void test_duplicate_key_same_representation() {
  TEST(duplicate_key_same_representation);
  TypeRegistry<Figure>::Builder builder("shape");
  builder.registerShape<Circle>("circle");
  bool ok = throwsKind([&] { builder.registerShape<Square>("circle"); }, ErrorKind::DuplicateKey);
  if (!ok) {
    FAIL("second registration of \"circle\" should be DuplicateKey");
    return;
  }
  PASS();
}

static void test_duplicate_key_across_representations() {
  TEST(duplicate_key_across_representations);
  TypeRegistry<Figure>::Builder builder("shape");
  builder.registerShape<Circle>(ShapeCode::Circle);
  if (!throwsKind([&] { builder.registerShape<Square>(1); }, ErrorKind::DuplicateKey)) {
    FAIL("integer 1 collides with ShapeCode::Circle");
    return;
  }
  if (!throwsKind([&] { builder.registerShape<Square>(1.0); }, ErrorKind::DuplicateKey)) {
    FAIL("float 1.0 collides with ShapeCode::Circle");
    return;
  }
  try {
    builder.registerShape<Square>(Value(1));
    FAIL("expected DuplicateKey");
    return;
  } catch (const DecodeError &e) {
    if (e.stage() != Stage::Register || e.message().find("Circle") == std::string::npos) {
      FAIL("error should be a registration error naming the owning shape");
      return;
    }
  }
  // The string "1" is a different key.
  builder.registerShape<Square>("1");
  PASS();
}

static void test_invalid_key() {
  TEST(invalid_key);
  TypeRegistry<Figure>::Builder builder("shape");
  if (!throwsKind([&] { builder.registerShape<Circle>(1.5); }, ErrorKind::InvalidKey)) {
    FAIL("1.5 should be rejected");
    return;
  }
  if (!throwsKind([&] { builder.registerShape<Circle>(Value()); }, ErrorKind::InvalidKey)) {
    FAIL("null should be rejected");
    return;
  }
  if (!throwsKind([&] { builder.registerShape<Circle>(true); }, ErrorKind::InvalidKey)) {
    FAIL("bool should be rejected");
    return;
  }
  PASS();
}

static void test_fallback_already_set() {
  TEST(fallback_already_set);
  TypeRegistry<Figure>::Builder builder("shape");
  builder.setFallback<Blob>();
  if (!throwsKind([&] { builder.setFallback<Circle>(); }, ErrorKind::FallbackAlreadySet)) {
    FAIL("second fallback should be FallbackAlreadySet");
    return;
  }
  PASS();
}

static void test_unknown_with_and_without_fallback() {
  TEST(unknown_with_and_without_fallback);
  auto strict = TypeRegistry<Figure>::Builder("shape").registerShape<Circle>("circle").build();
  try {
    strict.resolve(Value("hexagon"));
    FAIL("expected UnknownDiscriminator");
    return;
  } catch (const DecodeError &e) {
    if (e.kind() != ErrorKind::UnknownDiscriminator || e.discriminator() != "\"hexagon\"") {
      FAIL("wrong error for unknown key");
      return;
    }
  }

  auto lenient = TypeRegistry<Figure>::Builder("shape")
                     .registerShape<Circle>("circle")
                     .setFallback<Blob>()
                     .build();
  if (lenient.resolve(Value("hexagon")).shape->name() != "Blob") {
    FAIL("unknown key should fall back to Blob");
    return;
  }
  // A value that cannot name a shape is simply unknown.
  if (lenient.resolve(Value(Sequence{})).shape->name() != "Blob") {
    FAIL("unnormalizable value should fall back");
    return;
  }
  PASS();
}

static void test_resolve_missing() {
  TEST(resolve_missing);
  auto strict = TypeRegistry<Figure>::Builder("shape").registerShape<Circle>("circle").build();
  if (!throwsKind([&] { strict.resolveMissing(); }, ErrorKind::MissingDiscriminator)) {
    FAIL("missing discriminator without fallback should be MissingDiscriminator");
    return;
  }
  auto lenient = TypeRegistry<Figure>::Builder("shape").setFallback<Blob>().build();
  if (lenient.resolveMissing().shape->name() != "Blob") {
    FAIL("missing discriminator should use the fallback");
    return;
  }
  PASS();
}

static void test_builder_sealed_after_build() {
  TEST(builder_sealed_after_build);
  TypeRegistry<Figure>::Builder builder("shape");
  builder.registerShape<Circle>("circle");
  auto registry = builder.build();
  bool threw = false;
  try {
    builder.registerShape<Square>("square");
  } catch (const std::logic_error &) {
    threw = true;
  }
  if (!threw) {
    FAIL("registering after build() should throw");
    return;
  }
  if (registry.size() != 1) {
    FAIL("sealed registry should be unaffected");
    return;
  }
  PASS();
}

static void test_instantiate_builds_alternative() {
  TEST(instantiate_builds_alternative);
  auto registry = TypeRegistry<Figure>::Builder("shape")
                      .registerShape<Square>(ShapeCode::Square)
                      .setFallback<Blob>()
                      .build();
  HookChain hooks;
  PreprocessorChain preprocessors;
  DecodeOptions options;
  DecodeContext ctx(options, hooks, preprocessors);

  Value doc;
  doc.set("shape", 2);
  doc.set("side", 4.5);
  Figure fig = registry.resolve(Value(2)).instantiate(doc, ctx);
  const auto *square = std::get_if<Square>(&fig);
  if (!square || square->side != 4.5) {
    FAIL("expected Square{4.5}");
    return;
  }
  Figure blob = registry.resolveMissing().instantiate(doc, ctx);
  const auto *raw = std::get_if<Blob>(&blob);
  if (!raw || raw->raw != doc) {
    FAIL("fallback should keep the raw document");
    return;
  }
  PASS();
}

int main() {
  printf("=== polyrec Registry Tests ===\n");

  test_resolve_all_representations();
  test_duplicate_key_same_representation();
  test_duplicate_key_across_representations();
  test_invalid_key();
  test_fallback_already_set();
  test_unknown_with_and_without_fallback();
  test_resolve_missing();
  test_builder_sealed_after_build();
  test_instantiate_builds_alternative();

  printf("\n%d/%d tests passed.\n", tests_passed, tests_run);
  return (tests_passed == tests_run) ? 0 : 1;
}
