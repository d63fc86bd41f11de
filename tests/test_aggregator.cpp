// =============================================================================
// Aggregator Tests
// =============================================================================

#include <gtest/gtest.h>
#include "../include/cleanup_history/Aggregator.h"

#include <vector>

TEST(AggregatorTest, StartsEmpty) {
    HistoryAggregator aggregator;
    EXPECT_TRUE(aggregator.empty());
    EXPECT_TRUE(aggregator.sortedRecords().empty());
}

TEST(AggregatorTest, KeepsMaximumTimestamp) {
    HistoryAggregator aggregator;
    EXPECT_FALSE(aggregator.add({456, "echo foo"}));
    EXPECT_TRUE(aggregator.add({123, "echo foo"})); // Later in the file, older in time
    EXPECT_TRUE(aggregator.add({300, "echo foo"}));

    auto records = aggregator.sortedRecords();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].timestamp, 456u);
    EXPECT_EQ(records[0].command, "echo foo");
}

TEST(AggregatorTest, NewerTimestampReplacesOlder) {
    HistoryAggregator aggregator;
    aggregator.add({123, "echo foo"});
    aggregator.add({456, "echo foo"});

    auto records = aggregator.sortedRecords();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].timestamp, 456u);
}

TEST(AggregatorTest, SortsByTimestampThenCommand) {
    HistoryAggregator aggregator;
    aggregator.add({456, "echo bar"});
    aggregator.add({123, "zzz top"});
    aggregator.add({123, "echo foo"});
    aggregator.add({123, "Echo foo"});

    std::vector<HistoryRecord> expected = {
        {123, "Echo foo"}, // 'E' < 'e' in byte order
        {123, "echo foo"},
        {123, "zzz top"},
        {456, "echo bar"},
    };
    EXPECT_EQ(aggregator.sortedRecords(), expected);
    EXPECT_EQ(aggregator.size(), 4u);
}

TEST(AggregatorTest, RecordOrderIsTotal) {
    HistoryRecord a{1, "a"};
    HistoryRecord b{1, "b"};
    HistoryRecord c{2, "a"};
    EXPECT_TRUE(a < b);
    EXPECT_TRUE(b < c);
    EXPECT_TRUE(a < c);
    EXPECT_FALSE(a < a);
    EXPECT_EQ(a, (HistoryRecord{1, "a"}));
    EXPECT_NE(a, b);
}
