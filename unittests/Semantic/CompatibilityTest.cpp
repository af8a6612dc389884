#include "Semantic/Compatibility.h"
#include <gtest/gtest.h>
#include <iostream>
#include <llvm/Support/raw_ostream.h>

using namespace schemasub;
using namespace schemasub::semantic;

static llvm::json::Value json(llvm::StringRef Text) {
  auto V = llvm::json::parse(Text);
  if (!V) {
    ADD_FAILURE() << llvm::toString(V.takeError());
    return nullptr;
  }
  return std::move(*V);
}

static std::shared_ptr<Resolver> quantityResolver() {
  auto R = std::make_shared<Resolver>();
  R->addRelationship("quantitykind:Length", "quantitykind:Extent");
  R->addRelationship("quantitykind:Width", "quantitykind:Length");
  R->addRelationship("ex:Employee", "foaf:Person");
  return R;
}

static bool compatible(Resolver &R, llvm::StringRef A, llvm::StringRef B) {
  std::string Buf;
  llvm::raw_string_ostream Debug(Buf);
  bool Ret = isSemanticallyCompatible(json(A), json(B), R, Debug);
  std::cerr << A.str() << " vs " << B.str() << ": " << Ret << "\n"
            << Debug.str();
  return Ret;
}

TEST(Compatibility, RootAnnotations) {
  auto R = quantityResolver();
  EXPECT_TRUE(compatible(*R, R"({"stype": "quantitykind:Width"})",
                         R"({"stype": "quantitykind:Extent"})"));
  EXPECT_FALSE(compatible(*R, R"({"stype": "quantitykind:Extent"})",
                          R"({"stype": "quantitykind:Width"})"));
  // an unannotated right side accepts anything.
  EXPECT_TRUE(compatible(*R, R"({"stype": "quantitykind:Width"})", "{}"));
  EXPECT_FALSE(compatible(*R, "{}", R"({"stype": "quantitykind:Width"})"));
  EXPECT_TRUE(compatible(*R, "true", R"({"stype": "ex:Employee"})"));
  EXPECT_TRUE(compatible(*R, R"({"stype": "ex:Employee"})",
                         R"({"stype": "http://xmlns.com/foaf/0.1/Person"})"));
}

TEST(Compatibility, Properties) {
  auto R = quantityResolver();
  const char *Length = R"({"type": "object", "properties": {
      "d": {"type": "number", "stype": "quantitykind:Length"},
      "extra": {"stype": "ex:Employee"}}})";
  const char *Extent = R"({"type": "object", "properties": {
      "d": {"type": "number", "stype": "quantitykind:Extent"},
      "other": {"stype": "foaf:Person"}}})";
  EXPECT_TRUE(compatible(*R, Length, Extent));
  EXPECT_FALSE(compatible(*R, Extent, Length));

  EXPECT_TRUE(compatible(
      *R, R"({"additionalProperties": {"stype": "quantitykind:Width"}})",
      R"({"additionalProperties": {"stype": "quantitykind:Length"}})"));
  EXPECT_FALSE(compatible(
      *R, R"({"additionalProperties": {"stype": "quantitykind:Extent"}})",
      R"({"additionalProperties": {"stype": "quantitykind:Length"}})"));
  // only schema valued additionalProperties are compared.
  EXPECT_TRUE(compatible(
      *R, R"({"additionalProperties": false})",
      R"({"additionalProperties": {"stype": "quantitykind:Length"}})"));

  EXPECT_FALSE(compatible(
      *R, R"({"patternProperties": {"^x": {"stype": "foaf:Person"}}})",
      R"({"patternProperties": {"^x": {"stype": "ex:Employee"}}})"));
  EXPECT_TRUE(compatible(
      *R, R"({"patternProperties": {"^x": {"stype": "foaf:Person"}}})",
      R"({"patternProperties": {"^y": {"stype": "ex:Employee"}}})"));
}

TEST(Compatibility, Items) {
  auto R = quantityResolver();
  EXPECT_TRUE(compatible(*R, R"({"items": {"stype": "quantitykind:Width"}})",
                         R"({"items": {"stype": "quantitykind:Extent"}})"));
  EXPECT_FALSE(compatible(*R, R"({"items": {"stype": "quantitykind:Extent"}})",
                          R"({"items": {"stype": "quantitykind:Width"}})"));
  EXPECT_TRUE(compatible(
      *R, R"({"items": [{"stype": "quantitykind:Width"}, {}]})",
      R"({"items": [{"stype": "quantitykind:Length"}]})"));
  EXPECT_FALSE(compatible(
      *R, R"({"items": [{}, {"stype": "foaf:Person"}]})",
      R"({"items": [{}, {"stype": "ex:Employee"}]})"));

  // tuple against list is only compatible without annotations.
  EXPECT_TRUE(compatible(*R, R"({"items": [{"type": "number"}]})",
                         R"({"items": {"type": "number"}})"));
  EXPECT_FALSE(compatible(*R, R"({"items": [{"stype": "ex:Employee"}]})",
                          R"({"items": {"type": "object"}})"));
  EXPECT_TRUE(compatible(*R, R"({"items": {"type": "object"}})",
                         R"({"items": [{"type": "object"}]})"));
  EXPECT_FALSE(compatible(*R,
                          R"({"items": {"not": {"stype": "ex:Employee"}}})",
                          R"({"items": [{}]})"));
}

TEST(Compatibility, Connectives) {
  auto R = quantityResolver();
  EXPECT_TRUE(compatible(
      *R,
      R"({"allOf": [{"stype": "quantitykind:Width"}, {"minimum": 0}]})",
      R"({"allOf": [{"stype": "quantitykind:Length"}, {}]})"));
  EXPECT_FALSE(compatible(
      *R, R"({"allOf": [{"stype": "foaf:Person"}]})",
      R"({"allOf": [{"stype": "ex:Employee"}]})"));
  EXPECT_TRUE(compatible(
      *R,
      R"({"anyOf": [{"stype": "foaf:Person"}, {"stype": "ex:Employee"}]})",
      R"({"anyOf": [{"stype": "foaf:Person"}]})"));
  EXPECT_FALSE(compatible(
      *R, R"({"oneOf": [{"stype": "quantitykind:Extent"}]})",
      R"({"oneOf": [{"stype": "quantitykind:Width"},
                    {"stype": "ex:Employee"}]})"));
}

TEST(Compatibility, LocalReferences) {
  auto R = quantityResolver();
  EXPECT_FALSE(compatible(
      *R,
      R"({"definitions": {"e": {"stype": "foaf:Person"}},
          "$ref": "#/definitions/e"})",
      R"({"definitions": {"e": {"stype": "ex:Employee"}},
          "$ref": "#/definitions/e"})"));
  EXPECT_TRUE(compatible(*R, R"({"stype": "ex:Employee"})",
                         R"({"definitions": {"p": {"stype": "foaf:Person"}},
                             "$ref": "#/definitions/p"})"));
  EXPECT_FALSE(compatible(
      *R, R"({"type": "number", "stype": "quantitykind:Temperature"})",
      R"({"$ref": "#/definitions/p",
          "definitions": {"p": {"type": "number",
                                "stype": "quantitykind:Pressure"}}})"));

  // each side resolves against its own document.
  const char *Nested = R"({"definitions": {"w": {"stype": "quantitykind:Width"},
                                           "alias": {"$ref": "#/definitions/w"}},
                           "properties": {"t": {"$ref": "#/definitions/alias"}}})";
  EXPECT_TRUE(compatible(
      *R, Nested,
      R"({"properties": {"t": {"stype": "quantitykind:Length"}}})"));
  EXPECT_FALSE(compatible(
      *R, R"({"properties": {"t": {"stype": "quantitykind:Length"}}})",
      Nested));

  // a cycle ends the comparison along its path.
  EXPECT_TRUE(compatible(
      *R,
      R"({"definitions": {"l": {"type": "array",
                                "items": {"$ref": "#/definitions/l"}}},
          "$ref": "#/definitions/l"})",
      R"({"type": "array", "items": {"type": "array"}})"));
  EXPECT_FALSE(compatible(
      *R,
      R"({"definitions": {"a": {"$ref": "#/definitions/b"},
                          "b": {"stype": "foaf:Person"}},
          "$ref": "#/definitions/a"})",
      R"({"stype": "ex:Employee"})"));
}

TEST(Compatibility, AnnotationLattice) {
  auto R = quantityResolver();
  SemanticAnnotations Ann(*R, level_error);
  Annotation Width = Ann.attach("quantitykind:Width");
  Annotation Extent = Ann.attach("quantitykind:Extent");
  Annotation Person = Ann.attach("foaf:Person");
  EXPECT_EQ(*Width, "http://qudt.org/vocab/quantitykind/Width");

  EXPECT_EQ(Ann.meet(Width, Extent), Width);
  EXPECT_EQ(Ann.meet(Extent, Width), Width);
  EXPECT_EQ(Ann.join(Width, Extent), Extent);
  EXPECT_EQ(Ann.meet(Width, std::nullopt), Width);
  EXPECT_FALSE(Ann.join(Width, std::nullopt).has_value());
  EXPECT_FALSE(Ann.meet(Width, Person).has_value());
  EXPECT_FALSE(Ann.join(Width, Person).has_value());
  EXPECT_EQ(Ann.join(Person, Person), Person);
}
