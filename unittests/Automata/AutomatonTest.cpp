#include "Automata/Automaton.h"
#include "Automata/RExp.h"
#include "Automata/RegexParser.h"
#include <gtest/gtest.h>
#include <iostream>

using schemasub::automata::DFA;

static DFA lang(llvm::StringRef Pattern) {
  auto R = schemasub::automata::parseRegex(Pattern);
  EXPECT_TRUE(R.isOk());
  if (R.isErr()) {
    std::cerr << R.msg() << "\n";
    return DFA::emptyLanguage();
  }
  return DFA::fromRExp(*R);
}

TEST(Automaton, EmptinessAndUniversality) {
  EXPECT_TRUE(DFA::emptyLanguage().isEmpty());
  EXPECT_TRUE(DFA::anyString().acceptsEverything());
  EXPECT_FALSE(lang("^a$").isEmpty());
  EXPECT_TRUE(lang("").acceptsEverything());
  EXPECT_TRUE(lang("^a$").intersect(lang("^b$")).isEmpty());
}

TEST(Automaton, Inclusion) {
  DFA Digits = lang("^\\d+$");
  DFA Alnum = lang("^[0-9a-z]+$");
  EXPECT_TRUE(Digits.includedIn(Alnum));
  EXPECT_FALSE(Alnum.includedIn(Digits));
  EXPECT_TRUE(lang("^ab$").includedIn(lang("b")));
  EXPECT_TRUE(lang("^(a|b)*$").equivalent(lang("^(a*b*)*$")));
}

TEST(Automaton, ProductConstructions) {
  DFA A = lang("^a+$");
  DFA B = lang("^a{2}$");
  DFA Diff = A.subtract(B);
  EXPECT_TRUE(Diff.accepts("a"));
  EXPECT_FALSE(Diff.accepts("aa"));
  EXPECT_TRUE(Diff.accepts("aaa"));

  DFA U = lang("^x$").unionWith(lang("^y$"));
  EXPECT_TRUE(U.accepts("x"));
  EXPECT_TRUE(U.accepts("y"));
  EXPECT_FALSE(U.accepts("xy"));

  DFA C = lang("^x$").complement();
  EXPECT_FALSE(C.accepts("x"));
  EXPECT_TRUE(C.accepts(""));
  EXPECT_TRUE(C.accepts("xx"));
}

TEST(Automaton, MinimizeIsCanonical) {
  DFA A = lang("^(a|ab)(c|bcd)$");
  DFA B = lang("^(abc|abcd|abbcd|ac)$");
  EXPECT_TRUE(A.equivalent(B));
  EXPECT_EQ(A.minimize().size(), B.minimize().size());
}

TEST(Automaton, Lengths) {
  DFA L = DFA::lengthBetween(2, 4);
  EXPECT_FALSE(L.accepts("a"));
  EXPECT_TRUE(L.accepts("ab"));
  EXPECT_TRUE(L.accepts("a\xC3\xA9z"));
  EXPECT_FALSE(L.accepts("abcde"));
  ASSERT_TRUE(L.minLength() && L.maxLength());
  EXPECT_EQ(*L.minLength(), 2u);
  EXPECT_EQ(*L.maxLength(), 4u);

  DFA Open = DFA::lengthBetween(3, std::nullopt);
  ASSERT_TRUE(Open.minLength().has_value());
  EXPECT_EQ(*Open.minLength(), 3u);
  EXPECT_FALSE(Open.maxLength().has_value());

  EXPECT_FALSE(DFA::emptyLanguage().minLength().has_value());
}

TEST(Automaton, SingleString) {
  auto S = DFA::literal("hello").singleString();
  ASSERT_TRUE(S.has_value());
  EXPECT_EQ(*S, "hello");
  EXPECT_FALSE(lang("^a|b$").singleString().has_value());
  EXPECT_FALSE(lang("^a+$").singleString().has_value());
}

TEST(Automaton, PatternFromStateElimination) {
  for (llvm::StringRef P : {"^a(b|c)*d$", "^\\d{2,3}$", "^(ab|cd)?x$",
                            "foo", "^[^x]*$"}) {
    DFA D = lang(P);
    std::string Back = D.toPattern();
    std::cerr << P.str() << " -> " << Back << "\n";
    EXPECT_TRUE(lang(Back).equivalent(D)) << Back;
  }
  EXPECT_TRUE(lang(DFA::emptyLanguage().toPattern()).isEmpty());
}

TEST(Automaton, ExpressionText) {
  namespace rexp = schemasub::automata::rexp;
  EXPECT_EQ(rexp::createNull(), rexp::createNull());
  EXPECT_EQ(rexp::createEmpty(), rexp::createEmpty());
  EXPECT_EQ(rexp::toString(rexp::createNull()), "[]");
  EXPECT_EQ(rexp::toString(rexp::createEmpty()), "");

  auto A = rexp::create(schemasub::automata::CharSet('a'));
  auto B = rexp::create(schemasub::automata::CharSet('b'));
  EXPECT_EQ(rexp::toString(A & rexp::createStar(A)), "a+");
  EXPECT_EQ(rexp::toPattern(A & rexp::createStar(A)), "^a+$");
  auto AB = rexp::createLiteral({'a', 'b'});
  EXPECT_EQ(rexp::toString(AB), "ab");
  // equal alternatives collapse.
  auto Alt = AB | rexp::createLiteral({'a', 'b'});
  EXPECT_EQ(rexp::toString(Alt), "ab");
  EXPECT_EQ(rexp::toString(rexp::createStar(AB) | B), "(?:ab)*|b");
}
