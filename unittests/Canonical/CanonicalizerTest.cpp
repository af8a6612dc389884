#include "CanonicalTestUtils.h"
#include "Errors.h"

using namespace schemasub;

static bool isUnsupported(llvm::Error E) {
  bool Ret = E.isA<UnsupportedSchema>();
  if (E) {
    std::cerr << llvm::toString(std::move(E)) << "\n";
  }
  return Ret;
}

static bool isRecursive(llvm::Error E) {
  bool Ret = E.isA<UnsupportedRecursiveRef>();
  if (E) {
    std::cerr << llvm::toString(std::move(E)) << "\n";
  }
  return Ret;
}

TEST(Canonicalizer, BooleanAndEmptySchemas) {
  PlainAnnotations Ann;
  SchemaLattice L(Ann);
  EXPECT_TRUE(canon(L, "true")->isTop());
  EXPECT_TRUE(canon(L, "false")->isBottom());
  EXPECT_TRUE(canon(L, "{}")->isTop());
  EXPECT_TRUE(canon(L, R"({"title": "anything", "description": "x"})")->isTop());
  EXPECT_TRUE(canon(L, R"({"type": []})")->isBottom());
}

TEST(Canonicalizer, TypeSelectsKinds) {
  PlainAnnotations Ann;
  SchemaLattice L(Ann);
  PSchema S = canon(L, R"({"type": ["string", "null"]})");
  EXPECT_EQ(S->numKinds(), 2u);
  EXPECT_TRUE(S->hasKind(Kind::String));
  EXPECT_TRUE(S->hasKind(Kind::Null));

  PSchema I = canon(L, R"({"type": "integer", "minimum": 0, "maximum": 10})");
  ASSERT_NE(I->number(), nullptr);
  EXPECT_TRUE(I->number()->Integer);
  EXPECT_EQ(I->number()->Lower, Bound::closed(0));
  EXPECT_EQ(I->number()->Upper, Bound::closed(10));

  // number and integer together is number.
  PSchema N = canon(L, R"({"type": ["integer", "number"]})");
  ASSERT_NE(N->number(), nullptr);
  EXPECT_FALSE(N->number()->Integer);
}

TEST(Canonicalizer, KeywordsOnlyConstrainTheirKind) {
  PlainAnnotations Ann;
  SchemaLattice L(Ann);
  PSchema S = canon(L, R"({"minimum": 5, "maxLength": 3})");
  EXPECT_EQ(S->numKinds(), NumKinds);
  EXPECT_TRUE(S->Null.has_value());
  EXPECT_EQ(S->number()->Lower, Bound::closed(5));
  EXPECT_EQ(S->String->Length.Max, std::optional<uint64_t>(3));

  // a string keyword on a number schema is irrelevant.
  EXPECT_TRUE(sub(R"({"type": "number", "maxLength": 1})",
                  R"({"type": "number"})"));
}

TEST(Canonicalizer, ExclusiveBoundsBothForms) {
  PlainAnnotations Ann;
  SchemaLattice L(Ann);
  PSchema Draft4 = canon(
      L, R"({"type": "number", "minimum": 5, "exclusiveMinimum": true})");
  PSchema Numeric = canon(L, R"({"type": "number", "exclusiveMinimum": 5})");
  EXPECT_TRUE(L.isEquivalent(Draft4, Numeric));
  EXPECT_EQ(Numeric->number()->Lower, Bound::open(5));

  PSchema Int = canon(L, R"({"type": "integer", "exclusiveMaximum": 5})");
  EXPECT_EQ(Int->number()->Upper, Bound::closed(4));
}

TEST(Canonicalizer, MultipleOf) {
  PlainAnnotations Ann;
  SchemaLattice L(Ann);
  PSchema S = canon(L, R"({"type": "number", "multipleOf": 2})");
  EXPECT_TRUE(S->number()->Integer);
  EXPECT_EQ(S->number()->Step, std::optional<double>(2));
  EXPECT_TRUE(
      isUnsupported(canonError(L, R"({"type": "number", "multipleOf": 0})")));
}

TEST(Canonicalizer, StringPatternAndFormat) {
  PlainAnnotations Ann;
  SchemaLattice L(Ann);
  PSchema S = canon(L, R"({"type": "string", "pattern": "^[a-z]+$"})");
  ASSERT_TRUE(S->String->Lang != nullptr);
  EXPECT_TRUE(S->String->Lang->accepts("abc"));
  EXPECT_EQ(S->String->Source, std::optional<std::string>("^[a-z]+$"));

  PSchema F = canon(L, R"({"type": "string", "format": "date",
                           "pattern": "^2024"})");
  EXPECT_TRUE(F->String->Lang->accepts("2024-05-01"));
  EXPECT_FALSE(F->String->Lang->accepts("2023-05-01"));
  EXPECT_FALSE(F->String->Source.has_value());

  // a pattern implied by the length range is dropped.
  PSchema Len =
      canon(L, R"({"type": "string", "pattern": ".", "minLength": 1})");
  EXPECT_TRUE(Len->String->Lang == nullptr);

  EXPECT_TRUE(isUnsupported(
      canonError(L, R"({"type": "string", "pattern": "(a)\\1"})")));
  EXPECT_TRUE(isUnsupported(
      canonError(L, R"({"type": "string", "format": "uri"})")));
}

TEST(Canonicalizer, EnumAndConst) {
  PlainAnnotations Ann;
  SchemaLattice L(Ann);
  PSchema S = canon(L, R"({"enum": ["red", "green", null, true]})");
  EXPECT_TRUE(S->Null.has_value());
  ASSERT_TRUE(S->Boolean.has_value());
  EXPECT_TRUE(S->Boolean->AllowTrue);
  EXPECT_FALSE(S->Boolean->AllowFalse);
  ASSERT_TRUE(S->String.has_value());
  EXPECT_TRUE(S->String->Lang->accepts("red"));
  EXPECT_FALSE(S->String->Lang->accepts("blue"));
  EXPECT_TRUE(S->Numbers.empty());

  PSchema Ints = canon(L, R"({"enum": [3, 1, 2]})");
  ASSERT_NE(Ints->number(), nullptr);
  EXPECT_TRUE(Ints->number()->Integer);
  EXPECT_EQ(Ints->number()->Lower, Bound::closed(1));
  EXPECT_EQ(Ints->number()->Upper, Bound::closed(3));

  PSchema Halves = canon(L, R"({"enum": [0.5, 1, 1.5]})");
  EXPECT_EQ(Halves->number()->Step, std::optional<double>(0.5));

  PSchema Const = canon(L, R"({"const": 7})");
  EXPECT_TRUE(Const->number()->isPoint());

  // other numeric enums are unions of single values.
  PSchema Odd = canon(L, R"({"enum": [1, 3]})");
  ASSERT_EQ(Odd->Numbers.size(), 2u);
  EXPECT_TRUE(Odd->Numbers[0].isPoint());
  EXPECT_EQ(Odd->Numbers[1].Lower, Bound::closed(3));
  PSchema Irregular = canon(L, R"({"enum": [4, 1, 3]})");
  EXPECT_EQ(Irregular->Numbers.size(), 3u);
  EXPECT_TRUE(L.isSubtype(Odd, Irregular));
  EXPECT_FALSE(L.isSubtype(Irregular, Odd));
  EXPECT_TRUE(isUnsupported(canonError(L, R"({"enum": [{"a": 1}]})")));

  // enum and type meet.
  PSchema Typed = canon(L, R"({"type": "string", "enum": ["a", 1]})");
  EXPECT_EQ(Typed->singleKind(), std::optional<Kind>(Kind::String));
}

TEST(Canonicalizer, Connectives) {
  PlainAnnotations Ann;
  SchemaLattice L(Ann);
  PSchema All = canon(L, R"({"allOf": [{"type": "number", "minimum": 0},
                                       {"type": "number", "maximum": 5}]})");
  PSchema Direct = canon(L, R"({"type": "number", "minimum": 0,
                                "maximum": 5})");
  EXPECT_TRUE(L.isEquivalent(All, Direct));

  PSchema Any = canon(L, R"({"anyOf": [{"type": "string"},
                                       {"type": "null"}]})");
  EXPECT_EQ(Any->numKinds(), 2u);

  PSchema One = canon(L, R"({"oneOf": [{"type": "integer", "maximum": 0},
                                       {"type": "integer", "minimum": 1}]})");
  EXPECT_TRUE(L.isEquivalent(One, canon(L, R"({"type": "integer"})")));

  PSchema Disjoint = canon(L, R"({"allOf": [{"type": "string"},
                                            {"type": "number"}]})");
  EXPECT_TRUE(Disjoint->isBottom());

  EXPECT_TRUE(isUnsupported(canonError(L, R"({"anyOf": []})")));
}

TEST(Canonicalizer, Not) {
  PlainAnnotations Ann;
  SchemaLattice L(Ann);
  PSchema NotString = canon(L, R"({"not": {"type": "string"}})");
  EXPECT_FALSE(NotString->hasKind(Kind::String));
  EXPECT_EQ(NotString->numKinds(), NumKinds - 1);

  PSchema Below = canon(L, R"({"type": "number",
                               "not": {"type": "number", "minimum": 5}})");
  EXPECT_EQ(Below->number()->Upper, Bound::open(5));

  PSchema Outside = canon(L, R"({"type": "number",
                                 "not": {"type": "number", "minimum": 0,
                                         "maximum": 10}})");
  ASSERT_EQ(Outside->Numbers.size(), 2u);
  EXPECT_EQ(Outside->Numbers[0].Upper, Bound::open(0));
  EXPECT_EQ(Outside->Numbers[1].Lower, Bound::open(10));
  EXPECT_FALSE(L.isSubtype(canon(L, R"({"const": 5})"), Outside));
  EXPECT_TRUE(L.isSubtype(canon(L, R"({"enum": [-1, 11]})"), Outside));

  EXPECT_TRUE(canon(L, R"({"not": {}})")->isBottom());
  EXPECT_TRUE(isUnsupported(canonError(
      L, R"({"not": {"type": "object", "required": ["a"]}})")));
  EXPECT_TRUE(isUnsupported(canonError(
      L, R"({"not": {"type": "integer"}})")));
}

TEST(Canonicalizer, LocalReferences) {
  PlainAnnotations Ann;
  SchemaLattice L(Ann);
  PSchema S = canon(L, R"({
    "definitions": {"pos": {"type": "integer", "minimum": 1},
                    "a/b": {"type": "null"}},
    "type": "object",
    "properties": {"n": {"$ref": "#/definitions/pos"},
                   "z": {"$ref": "#/definitions/a~1b"}}
  })");
  ASSERT_NE(S->object(), nullptr);
  PSchema N = S->object()->Properties.at("n");
  EXPECT_TRUE(N->number()->Integer);
  EXPECT_EQ(N->number()->Lower, Bound::closed(1));
  EXPECT_TRUE(S->object()->Properties.at("z")->Null.has_value());

  PSchema Defs = canon(L, R"({"$defs": {"s": {"type": "string"}},
                              "$ref": "#/$defs/s", "type": "number"})");
  // siblings of $ref are ignored.
  EXPECT_EQ(Defs->singleKind(), std::optional<Kind>(Kind::String));

  EXPECT_TRUE(isUnsupported(
      canonError(L, R"({"$ref": "http://example.org/schema.json"})")));
  EXPECT_TRUE(isUnsupported(canonError(L, R"({"$ref": "#/definitions/no"})")));
}

TEST(Canonicalizer, RecursiveReferences) {
  PlainAnnotations Ann;
  SchemaLattice L(Ann);
  EXPECT_TRUE(isRecursive(canonError(L, R"({
    "definitions": {"list": {"type": "object",
                             "properties": {"next": {"$ref": "#/definitions/list"}}}},
    "$ref": "#/definitions/list"
  })")));
  EXPECT_TRUE(isRecursive(canonError(
      L, R"({"type": "array", "items": {"$ref": "#"}})")));

  // a diamond of references is not a cycle.
  PSchema Diamond = canon(L, R"({
    "definitions": {"leaf": {"type": "string"},
                    "l": {"$ref": "#/definitions/leaf"},
                    "r": {"$ref": "#/definitions/leaf"}},
    "allOf": [{"$ref": "#/definitions/l"}, {"$ref": "#/definitions/r"}]
  })");
  EXPECT_EQ(Diamond->singleKind(), std::optional<Kind>(Kind::String));

  Options Shallow;
  Shallow.MaxRefDepth = 1;
  EXPECT_TRUE(isRecursive(canonError(L, R"({
    "definitions": {"a": {"$ref": "#/definitions/b"}, "b": {"type": "null"}},
    "$ref": "#/definitions/a"
  })", Shallow)));
}

TEST(Canonicalizer, RejectsUnknownKeywords) {
  PlainAnnotations Ann;
  SchemaLattice L(Ann);
  EXPECT_TRUE(isUnsupported(canonError(L, R"({"type": "string", "foo": 1})")));
  EXPECT_TRUE(isUnsupported(canonError(L, R"({"dependencies": {}})")));
  EXPECT_TRUE(isUnsupported(canonError(L, R"({"type": "strin"})")));
  EXPECT_TRUE(isUnsupported(canonError(L, R"(42)")));
}

TEST(Canonicalizer, ArraysAndObjects) {
  PlainAnnotations Ann;
  SchemaLattice L(Ann);
  PSchema T = canon(L, R"({"type": "array",
                           "items": [{"type": "string"}, {"type": "number"}],
                           "additionalItems": false})");
  ASSERT_NE(T->array(), nullptr);
  EXPECT_EQ(T->array()->Prefix.size(), 2u);
  EXPECT_EQ(T->array()->Length.Max, std::optional<uint64_t>(2));

  PSchema O = canon(L, R"({"type": "object",
                           "properties": {"a": {"type": "string"}},
                           "required": ["a"],
                           "patternProperties": {"^x-": {"type": "null"}},
                           "additionalProperties": false,
                           "maxProperties": 3})");
  ASSERT_NE(O->object(), nullptr);
  EXPECT_EQ(O->object()->Required.count("a"), 1u);
  EXPECT_EQ(O->object()->Patterns.size(), 1u);
  EXPECT_TRUE(O->object()->Additional->isBottom());
  EXPECT_EQ(O->object()->Count.Max, std::optional<uint64_t>(3));

  // a required property that cannot exist empties the object kind.
  PSchema Impossible = canon(L, R"({"type": "object", "required": ["b"],
                                    "additionalProperties": false})");
  EXPECT_TRUE(Impossible->isBottom());
}

TEST(Canonicalizer, STypeAttached) {
  PlainAnnotations Ann;
  SchemaLattice L(Ann);
  PSchema S = canon(L, R"({"type": "number", "stype": "quantitykind:Length"})");
  EXPECT_EQ(S->SType, std::optional<std::string>("quantitykind:Length"));
  PSchema Top = canon(L, R"({"stype": "ex:Thing"})");
  EXPECT_EQ(Top->SType, std::optional<std::string>("ex:Thing"));
  EXPECT_TRUE(Top->isTop());

  DropAnnotations Drop;
  SchemaLattice Plain(Drop);
  EXPECT_FALSE(canon(Plain, R"({"stype": "ex:Thing"})")->SType.has_value());
}
