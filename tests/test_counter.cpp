#include <gtest/gtest.h>
#include "seqscope/counter.hpp"

using namespace seqscope;

TEST(OrderedCounterTest, StartsEmpty) {
    OrderedCounter counter;
    EXPECT_TRUE(counter.empty());
    EXPECT_EQ(counter.uniqueCount(), 0);
    EXPECT_EQ(counter.totalCount(), 0);
    EXPECT_EQ(counter.getCount("A"), 0);
}

TEST(OrderedCounterTest, PresetKeysStartAtZero) {
    OrderedCounter counter({"A", "T", "G", "C"});
    EXPECT_EQ(counter.uniqueCount(), 4);
    EXPECT_EQ(counter.totalCount(), 0);
    EXPECT_TRUE(counter.contains("G"));
    EXPECT_EQ(counter.getCount("G"), 0);
}

TEST(OrderedCounterTest, CountsAndKeepsFirstSeenOrder) {
    OrderedCounter counter;
    counter.add("TTT");
    counter.add("AAA");
    counter.add("TTT");

    EXPECT_EQ(counter.getCount("TTT"), 2);
    EXPECT_EQ(counter.getCount("AAA"), 1);
    EXPECT_EQ(counter.totalCount(), 3);

    std::vector<std::string> keys;
    for (const auto& entry : counter) keys.push_back(entry.key);
    EXPECT_EQ(keys, (std::vector<std::string>{"TTT", "AAA"}));
}

TEST(OrderedCounterTest, AddMany) {
    OrderedCounter counter;
    counter.add("K", 4);
    EXPECT_EQ(counter.getCount("K"), 4);
    EXPECT_EQ(counter.totalCount(), 4);
}

TEST(OrderedCounterTest, RankingBreaksTiesByDiscoveryOrder) {
    OrderedCounter counter;
    for (const char* key : {"C", "A", "C", "G", "A"}) {
        counter.add(key);
    }

    EXPECT_EQ(keysOf(counter.ranked()), (std::vector<std::string>{"C", "A", "G"}));
    EXPECT_EQ(keysOf(counter.mostFrequent(2)), (std::vector<std::string>{"C", "A"}));
    EXPECT_EQ(keysOf(counter.leastFrequent(2)), (std::vector<std::string>{"A", "G"}));
}

TEST(OrderedCounterTest, RankingShorterThanRequest) {
    OrderedCounter counter;
    counter.add("X");
    counter.add("Y");

    EXPECT_EQ(counter.mostFrequent(5).size(), 2);
    EXPECT_EQ(counter.leastFrequent(5).size(), 2);
    EXPECT_TRUE(OrderedCounter().mostFrequent(5).empty());
}

TEST(CountEntryTest, Frequency) {
    CountEntry entry{"AAA", 3};
    EXPECT_DOUBLE_EQ(entry.frequency(12), 0.25);
    EXPECT_DOUBLE_EQ(entry.frequency(0), 0.0);
}
