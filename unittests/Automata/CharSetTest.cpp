#include "Automata/CharSet.h"
#include <gtest/gtest.h>
#include <vector>

using schemasub::automata::CharSet;
using schemasub::automata::CodePoint;
using schemasub::automata::MaxCodePoint;

TEST(CharSet, MergesAdjacentRanges) {
  CharSet S;
  S.addRange('a', 'c');
  S.addRange('d', 'f');
  S.add('x');
  ASSERT_EQ(S.ranges().size(), 2u);
  EXPECT_EQ(S.ranges()[0].first, (CodePoint)'a');
  EXPECT_EQ(S.ranges()[0].second, (CodePoint)'f');
  EXPECT_TRUE(S.contains('e'));
  EXPECT_FALSE(S.contains('g'));
}

TEST(CharSet, ComplementAndIntersect) {
  CharSet Digits = CharSet::digit();
  CharSet NotDigits = Digits.complement();
  EXPECT_FALSE(NotDigits.contains('5'));
  EXPECT_TRUE(NotDigits.contains('a'));
  EXPECT_TRUE(NotDigits.contains(MaxCodePoint));
  EXPECT_TRUE(Digits.intersect(NotDigits).empty());
  EXPECT_TRUE(Digits.unionWith(NotDigits).isAny());
  EXPECT_EQ(Digits.complement().complement(), Digits);

  CharSet Hex('0', '9');
  Hex.addRange('a', 'f');
  EXPECT_EQ(Hex.subtract(Digits), CharSet('a', 'f'));
}

TEST(CharSet, DotExcludesLineTerminators) {
  CharSet Dot = CharSet::dot();
  EXPECT_FALSE(Dot.contains('\n'));
  EXPECT_FALSE(Dot.contains('\r'));
  EXPECT_FALSE(Dot.contains(0x2028));
  EXPECT_TRUE(Dot.contains('a'));
  EXPECT_TRUE(Dot.contains(0x1F600));
}

TEST(CharSet, ToRegex) {
  EXPECT_EQ(CharSet('a').toRegex(), "a");
  EXPECT_EQ(CharSet('.').toRegex(), "\\.");
  EXPECT_EQ(CharSet::digit().toRegex(), "\\d");
  EXPECT_EQ(CharSet::word().toRegex(), "\\w");
  EXPECT_EQ(CharSet::dot().toRegex(), ".");
  EXPECT_EQ(CharSet::any().toRegex(), "[\\s\\S]");
  EXPECT_EQ(CharSet().toRegex(), "[]");
}

TEST(CharSet, PartitionSplitsOverlaps) {
  std::vector<CharSet> Sets{CharSet('a', 'm'), CharSet('h', 'z')};
  auto Parts = schemasub::automata::partition(Sets);
  ASSERT_EQ(Parts.size(), 3u);
  EXPECT_EQ(Parts[0].first, (CodePoint)'a');
  EXPECT_EQ(Parts[0].second, (CodePoint)'g');
  EXPECT_EQ(Parts[1].first, (CodePoint)'h');
  EXPECT_EQ(Parts[1].second, (CodePoint)'m');
  EXPECT_EQ(Parts[2].first, (CodePoint)'n');
  EXPECT_EQ(Parts[2].second, (CodePoint)'z');
}

TEST(CharSet, UTF8) {
  std::vector<CodePoint> Out;
  ASSERT_TRUE(schemasub::automata::decodeUTF8("a\xC3\xA9\xF0\x9F\x98\x80", Out));
  ASSERT_EQ(Out.size(), 3u);
  EXPECT_EQ(Out[1], 0xE9u);
  EXPECT_EQ(Out[2], 0x1F600u);
  EXPECT_EQ(schemasub::automata::encodeUTF8(0xE9), "\xC3\xA9");

  Out.clear();
  EXPECT_FALSE(schemasub::automata::decodeUTF8("\xC3", Out));
}
