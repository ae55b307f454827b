#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "core/ingest/PrinterAggregator.hpp"

using namespace core::ingest;

namespace {
    LogEvent pass(const std::string &printer) { return LogEvent{printer, Outcome::Pass}; }

    LogEvent fail(const std::string &printer) { return LogEvent{printer, Outcome::Fail}; }
}

TEST(PrinterAggregatorTest, AccumulatesPerPrinter) {
    PrinterAggregator aggregator;

    auto snapshot = aggregator.apply({pass("P1"), fail("P1"), pass("P1"), pass("P2")});

    ASSERT_EQ(snapshot.size(), 2u);
    EXPECT_EQ(snapshot.at("P1"), (PrinterCounters{"P1", 2, 1}));
    EXPECT_EQ(snapshot.at("P2"), (PrinterCounters{"P2", 1, 0}));
    EXPECT_EQ(aggregator.printerCount(), 2u);
}

TEST(PrinterAggregatorTest, CountersOnlyGrowAcrossBatches) {
    PrinterAggregator aggregator;
    aggregator.apply({pass("P1"), fail("P1"), pass("P1")});

    auto snapshot = aggregator.apply({fail("P1"), pass("P1")});

    EXPECT_EQ(snapshot.at("P1"), (PrinterCounters{"P1", 3, 2}));
}

TEST(PrinterAggregatorTest, EmptyBatchChangesNothing) {
    PrinterAggregator aggregator;
    aggregator.apply({pass("P1")});

    auto snapshot = aggregator.apply({});

    EXPECT_EQ(snapshot.at("P1").cumulativePass, 1);
}

TEST(PrinterAggregatorTest, UnknownPrinterReadsAsZero) {
    PrinterAggregator aggregator;

    auto counters = aggregator.counters("nobody");

    EXPECT_EQ(counters.printerId, "nobody");
    EXPECT_EQ(counters.cumulativePass, 0);
    EXPECT_EQ(counters.cumulativeFail, 0);
}

TEST(PrinterAggregatorTest, SnapshotIsACopy) {
    PrinterAggregator aggregator;
    auto before = aggregator.apply({pass("P1")});

    aggregator.apply({pass("P1")});

    EXPECT_EQ(before.at("P1").cumulativePass, 1);
    EXPECT_EQ(aggregator.snapshot().at("P1").cumulativePass, 2);
}

TEST(PrinterAggregatorTest, ConcurrentBatchesAddUp) {
    PrinterAggregator aggregator;

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&aggregator]() {
            for (int i = 0; i < 250; ++i) {
                aggregator.apply({pass("P1"), fail("P2")});
            }
        });
    }
    for (auto &thread: threads) thread.join();

    EXPECT_EQ(aggregator.counters("P1").cumulativePass, 1000);
    EXPECT_EQ(aggregator.counters("P2").cumulativeFail, 1000);
}
