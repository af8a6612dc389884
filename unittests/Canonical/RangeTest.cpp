#include "Canonical/Range.h"
#include <gtest/gtest.h>

using namespace schemasub;

TEST(Range, BoundOrdering) {
  EXPECT_LT(compareLower(Bound::negInf(), Bound::closed(-1e300)), 0);
  EXPECT_LT(compareLower(Bound::closed(1), Bound::open(1)), 0);
  EXPECT_GT(compareLower(Bound::open(1), Bound::closed(1)), 0);
  EXPECT_EQ(compareLower(Bound::open(2), Bound::open(2)), 0);

  EXPECT_LT(compareUpper(Bound::open(1), Bound::closed(1)), 0);
  EXPECT_LT(compareUpper(Bound::closed(1e300), Bound::posInf()), 0);

  EXPECT_EQ(tighterLower(Bound::closed(3), Bound::open(3)), Bound::open(3));
  EXPECT_EQ(looserUpper(Bound::closed(3), Bound::open(3)), Bound::closed(3));
  EXPECT_EQ(tighterUpper(Bound::posInf(), Bound::closed(0)),
            Bound::closed(0));
}

TEST(Range, EmptyIntervals) {
  EXPECT_FALSE(isEmptyInterval(Bound::negInf(), Bound::posInf()));
  EXPECT_FALSE(isEmptyInterval(Bound::closed(1), Bound::closed(1)));
  EXPECT_TRUE(isEmptyInterval(Bound::open(1), Bound::closed(1)));
  EXPECT_TRUE(isEmptyInterval(Bound::closed(2), Bound::closed(1)));
  EXPECT_FALSE(isEmptyInterval(Bound::open(1), Bound::open(1.5)));

  EXPECT_TRUE(admitsValue(Bound::closed(0), Bound::open(1), 0));
  EXPECT_FALSE(admitsValue(Bound::closed(0), Bound::open(1), 1));
  EXPECT_TRUE(admitsValue(Bound::negInf(), Bound::posInf(), -7));
}

TEST(Range, SizeRanges) {
  SizeRange Any;
  SizeRange Small{0, 3};
  SizeRange Mid{2, 5};
  EXPECT_TRUE(Any.isAny());
  EXPECT_TRUE(Small.includedIn(Any));
  EXPECT_FALSE(Any.includedIn(Small));
  EXPECT_FALSE(Mid.includedIn(Small));

  SizeRange M = Small.meet(Mid);
  EXPECT_EQ(M, (SizeRange{2, 3}));
  EXPECT_EQ(Small.join(Mid), (SizeRange{0, 5}));
  EXPECT_EQ(Mid.join(Any), Any);

  SizeRange Empty{4, 2};
  EXPECT_TRUE(Empty.empty());
  EXPECT_TRUE(Empty.includedIn(Small));
  EXPECT_EQ(Empty.join(Mid), Mid);
  EXPECT_TRUE(Small.meet(SizeRange{4, std::nullopt}).empty());

  EXPECT_TRUE(Mid.contains(2));
  EXPECT_FALSE(Mid.contains(6));
  EXPECT_EQ(Mid.toString(), "[2, 5]");
  EXPECT_EQ(Any.toString(), "[0, inf]");
}
