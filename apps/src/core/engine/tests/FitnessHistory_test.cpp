#include "core/engine/FitnessHistory.h"

#include <gtest/gtest.h>

using namespace CellGa;

TEST(FitnessHistoryTest, StartsEmptyWithDefaultCapacity)
{
    const FitnessHistory history;

    EXPECT_TRUE(history.empty());
    EXPECT_EQ(history.capacity(), 300u);
    EXPECT_TRUE(history.best().empty());
}

TEST(FitnessHistoryTest, KeepsEntriesOldestFirst)
{
    FitnessHistory history(4);
    history.push(5.0, 7.0);
    history.push(4.0, 6.0);
    history.push(3.0, 5.5);

    ASSERT_EQ(history.size(), 3u);
    EXPECT_DOUBLE_EQ(history.bestAt(0), 5.0);
    EXPECT_DOUBLE_EQ(history.avgAt(2), 5.5);
    EXPECT_EQ(history.best(), (std::vector<double>{ 5.0, 4.0, 3.0 }));
}

TEST(FitnessHistoryTest, DropsOldestOnceFull)
{
    FitnessHistory history(3);
    for (int i = 0; i < 5; i++) {
        history.push(i, i * 10.0);
    }

    EXPECT_EQ(history.size(), 3u);
    EXPECT_EQ(history.best(), (std::vector<double>{ 2.0, 3.0, 4.0 }));
    EXPECT_EQ(history.avg(), (std::vector<double>{ 20.0, 30.0, 40.0 }));
}

TEST(FitnessHistoryTest, NeverExceedsDefaultCapacity)
{
    FitnessHistory history;
    for (int i = 0; i < 1000; i++) {
        history.push(i, i);
    }

    EXPECT_EQ(history.size(), FitnessHistory::kDefaultCapacity);
    EXPECT_DOUBLE_EQ(history.bestAt(0), 700.0);
    EXPECT_DOUBLE_EQ(history.bestAt(299), 999.0);
}
