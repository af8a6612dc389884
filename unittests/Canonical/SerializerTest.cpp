#include "CanonicalTestUtils.h"

using namespace schemasub;

static void expectJSON(SchemaLattice &L, llvm::StringRef Input,
                       llvm::StringRef Expected) {
  std::string Got = render(toJSON(canon(L, Input)));
  std::cerr << Input.str() << " serialized as " << Got << "\n";
  EXPECT_EQ(Got, render(parseJSON(Expected)));
}

TEST(Serializer, TopAndBottom) {
  PlainAnnotations Ann;
  SchemaLattice L(Ann);
  expectJSON(L, "true", "{}");
  expectJSON(L, "false", R"({"not": {}})");
  expectJSON(L, R"({"type": "string", "minLength": 3, "maxLength": 2})",
             R"({"not": {}})");
  expectJSON(L, R"({"stype": "ex:A"})", R"({"stype": "ex:A"})");
}

TEST(Serializer, Numbers) {
  PlainAnnotations Ann;
  SchemaLattice L(Ann);
  expectJSON(L, R"({"type": "integer", "minimum": 0, "maximum": 10})",
             R"({"type": "integer", "minimum": 0, "maximum": 10})");
  expectJSON(L, R"({"type": "number", "exclusiveMinimum": 0})",
             R"({"type": "number", "exclusiveMinimum": 0})");
  expectJSON(L, R"({"type": "number", "multipleOf": 0.5})",
             R"({"type": "number", "multipleOf": 0.5})");
  expectJSON(L, R"({"const": 7})", R"({"type": "number", "const": 7})");
  expectJSON(L, R"({"type": "integer", "exclusiveMinimum": 1,
                    "exclusiveMaximum": 3})",
             R"({"type": "number", "const": 2})");
  expectJSON(L, R"({"enum": [3, 1]})", R"({"type": "number", "enum": [1, 3]})");
  expectJSON(L, R"({"anyOf": [{"type": "number", "minimum": 10},
                              {"type": "number", "maximum": 0}]})",
             R"({"anyOf": [{"type": "number", "maximum": 0},
                           {"type": "number", "minimum": 10}]})");
}

TEST(Serializer, Strings) {
  PlainAnnotations Ann;
  SchemaLattice L(Ann);
  expectJSON(L, R"({"const": "a"})", R"({"type": "string", "const": "a"})");
  expectJSON(L, R"({"type": "string", "pattern": "^[a-z]+$",
                    "maxLength": 5})",
             R"({"type": "string", "pattern": "^[a-z]+$", "maxLength": 5})");
  expectJSON(L, R"({"type": "string", "minLength": 1})",
             R"({"type": "string", "minLength": 1})");

  // a language without source text is rendered from the automaton.
  PSchema Enum = canon(L, R"({"enum": ["ab", "cd"]})");
  llvm::json::Value V = toJSON(Enum);
  auto *O = V.getAsObject();
  ASSERT_TRUE(O != nullptr);
  auto Pattern = O->getString("pattern");
  ASSERT_TRUE(Pattern.hasValue());
  std::string Text = R"({"type": "string", "pattern": )" +
                     render(llvm::json::Value(*Pattern)) + "}";
  EXPECT_TRUE(L.isEquivalent(canon(L, Text), Enum));
}

TEST(Serializer, SeveralKinds) {
  PlainAnnotations Ann;
  SchemaLattice L(Ann);
  expectJSON(L, R"({"type": ["string", "null"]})",
             R"({"type": ["null", "string"]})");
  expectJSON(L, R"({"type": ["integer", "null"]})",
             R"({"type": ["null", "integer"]})");
  expectJSON(L, R"({"type": ["string", "null"], "maxLength": 2})",
             R"({"anyOf": [{"type": "null"},
                           {"type": "string", "maxLength": 2}]})");
  expectJSON(L, R"({"enum": [true, null]})",
             R"({"anyOf": [{"type": "null"},
                           {"type": "boolean", "const": true}]})");
}

TEST(Serializer, ArraysAndObjects) {
  PlainAnnotations Ann;
  SchemaLattice L(Ann);
  expectJSON(L, R"({"type": "array", "items": [{"type": "string"}],
                    "additionalItems": false})",
             R"({"type": "array", "items": [{"type": "string"}],
                 "maxItems": 1})");
  expectJSON(L, R"({"type": "array", "items": {"type": "null"},
                    "minItems": 1, "uniqueItems": true})",
             R"({"type": "array", "items": {"type": "null"}, "minItems": 1,
                 "uniqueItems": true})");
  expectJSON(L, R"({"type": "object",
                    "properties": {"a": {"type": "integer"}},
                    "required": ["a"], "additionalProperties": false})",
             R"({"type": "object",
                 "properties": {"a": {"type": "integer"}},
                 "required": ["a"], "additionalProperties": false})");
  expectJSON(L, R"({"type": "object",
                    "patternProperties": {"^x-": {"type": "string"}},
                    "maxProperties": 4})",
             R"({"type": "object",
                 "patternProperties": {"^x-": {"type": "string"}},
                 "maxProperties": 4})");
  expectJSON(L, R"({"type": "object", "additionalProperties":
                    {"type": "number", "stype": "ex:Length"}})",
             R"({"type": "object", "additionalProperties":
                 {"type": "number", "stype": "ex:Length"}})");
}
