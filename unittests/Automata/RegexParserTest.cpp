#include "Automata/Automaton.h"
#include "Automata/RegexParser.h"
#include <gtest/gtest.h>
#include <iostream>

using schemasub::automata::DFA;

DFA compile(llvm::StringRef Pattern) {
  auto R = schemasub::automata::parseRegex(Pattern);
  EXPECT_TRUE(R.isOk());
  if (R.isErr()) {
    std::cerr << R.msg() << "\n";
    return DFA::emptyLanguage();
  }
  return DFA::fromRExp(*R);
}

std::string parseError(llvm::StringRef Pattern) {
  auto R = schemasub::automata::parseRegex(Pattern);
  EXPECT_TRUE(R.isErr());
  return R.isErr() ? R.msg() : std::string();
}

TEST(RegexParser, AnchoredLiteral) {
  DFA D = compile("^abc$");
  EXPECT_TRUE(D.accepts("abc"));
  EXPECT_FALSE(D.accepts("abcd"));
  EXPECT_FALSE(D.accepts("xabc"));
  EXPECT_FALSE(D.accepts(""));
}

TEST(RegexParser, UnanchoredSearchSemantics) {
  DFA D = compile("abc");
  EXPECT_TRUE(D.accepts("abc"));
  EXPECT_TRUE(D.accepts("xxabcyy"));
  EXPECT_FALSE(D.accepts("ab"));

  DFA Start = compile("^ab");
  EXPECT_TRUE(Start.accepts("abzz"));
  EXPECT_FALSE(Start.accepts("zab"));

  // anchors bind to their own alternative.
  DFA Alt = compile("^a|b$");
  EXPECT_TRUE(Alt.accepts("axx"));
  EXPECT_TRUE(Alt.accepts("xxb"));
  EXPECT_FALSE(Alt.accepts("xax"));
}

TEST(RegexParser, Quantifiers) {
  DFA D = compile("^a{2,3}$");
  EXPECT_FALSE(D.accepts("a"));
  EXPECT_TRUE(D.accepts("aa"));
  EXPECT_TRUE(D.accepts("aaa"));
  EXPECT_FALSE(D.accepts("aaaa"));

  DFA Plus = compile("^(?:ab)+c?$");
  EXPECT_TRUE(Plus.accepts("ab"));
  EXPECT_TRUE(Plus.accepts("ababc"));
  EXPECT_FALSE(Plus.accepts("c"));

  DFA Lazy = compile("^a*?b$");
  EXPECT_TRUE(Lazy.accepts("aaab"));

  DFA AtLeast = compile("^x{2,}$");
  EXPECT_FALSE(AtLeast.accepts("x"));
  EXPECT_TRUE(AtLeast.accepts("xxxxx"));

  // not a quantifier, a literal brace.
  DFA Brace = compile("^a{x}$");
  EXPECT_TRUE(Brace.accepts("a{x}"));
}

TEST(RegexParser, ClassesAndEscapes) {
  DFA Phone = compile("^\\d{3}-\\d{4}$");
  EXPECT_TRUE(Phone.accepts("555-1234"));
  EXPECT_FALSE(Phone.accepts("555-12a4"));

  DFA Neg = compile("^[^a-c]$");
  EXPECT_TRUE(Neg.accepts("d"));
  EXPECT_FALSE(Neg.accepts("b"));

  DFA Hex = compile("^\\x41\\u0042$");
  EXPECT_TRUE(Hex.accepts("AB"));

  DFA Dot = compile("^.$");
  EXPECT_TRUE(Dot.accepts("\xC3\xA9"));
  EXPECT_FALSE(Dot.accepts("\n"));

  DFA Meta = compile("^a\\.b$");
  EXPECT_TRUE(Meta.accepts("a.b"));
  EXPECT_FALSE(Meta.accepts("axb"));
}

TEST(RegexParser, GroupsAndAlternation) {
  DFA D = compile("^(foo|ba(r|z))$");
  EXPECT_TRUE(D.accepts("foo"));
  EXPECT_TRUE(D.accepts("bar"));
  EXPECT_TRUE(D.accepts("baz"));
  EXPECT_FALSE(D.accepts("ba"));

  DFA Named = compile("^(?<year>\\d{4})$");
  EXPECT_TRUE(Named.accepts("2024"));
}

TEST(RegexParser, RejectsNonRegularConstructs) {
  parseError("(a)\\1");
  parseError("(?=a)b");
  parseError("(?!a)b");
  parseError("\\p{L}");
  parseError("a**");
  parseError("(ab");
  parseError("a)");
  parseError("[b-a]");
  parseError("a^b");
}

TEST(RegexParser, FormatLanguages) {
  auto Date = schemasub::automata::formatLanguage("date");
  ASSERT_TRUE(Date.isOk());
  DFA D = DFA::fromRExp(*Date);
  EXPECT_TRUE(D.accepts("2024-02-29"));
  EXPECT_FALSE(D.accepts("2024-13-01"));

  auto IP = schemasub::automata::formatLanguage("ipv4");
  ASSERT_TRUE(IP.isOk());
  DFA I = DFA::fromRExp(*IP);
  EXPECT_TRUE(I.accepts("192.168.0.1"));
  EXPECT_FALSE(I.accepts("256.1.1.1"));

  EXPECT_TRUE(schemasub::automata::formatLanguage("uri").isErr());
}
