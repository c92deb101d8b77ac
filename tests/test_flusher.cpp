/// @file test_flusher.cpp
/// @brief Tests for Flusher
///
/// Tests cover:
/// - One batch per flush with flush-time timestamps
/// - Zero-second entries skipped, empty drain writes nothing
/// - Failed batch drops the interval without stopping later flushes
/// - Optional pruning and the final flush on Stop()

#include "flusher.hpp"
#include "browser_url.hpp"
#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <thread>

using TestFakes::FakeClock;
using TestFakes::MemoryUsageLog;

namespace
{

void sample(AggregationStore& store, const ActivityTarget& target, int times, std::uint64_t& tick)
{
    for (int i = 0; i < times; ++i)
    {
        store.RecordSample(target, ++tick);
    }
}

const UsageRecord* findRecord(const std::vector<UsageRecord>& records, const std::string& identifier)
{
    auto it = std::find_if(records.begin(), records.end(),
                           [&](const UsageRecord& r) { return r.identifier == identifier; });
    return it == records.end() ? nullptr : &*it;
}

} // namespace

// =============================================================================
// FlushOnce
// =============================================================================

TEST(FlusherTest, FlushWritesOneRecordPerTargetInOneBatch)
{
    AggregationStore store;
    MemoryUsageLog log;
    FakeClock clock(1'000'000);
    Flusher flusher(store, log, clock, std::chrono::seconds(30));

    std::uint64_t tick = 0;
    sample(store, MakeTarget("a", "x", std::nullopt), 5, tick);
    sample(store, MakeTarget("b", "y", std::string("https://b.example")), 3, tick);

    const FlushResult result = flusher.FlushOnce();
    EXPECT_FALSE(result.failed);
    EXPECT_EQ(result.records, 2U);
    EXPECT_EQ(result.seconds, 8U);
    EXPECT_EQ(log.batches(), 1);

    const auto records = log.records();
    ASSERT_EQ(records.size(), 2U);
    const UsageRecord* a = findRecord(records, "a:x");
    const UsageRecord* b = findRecord(records, "b:https://b.example");
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(a->duration, 5);
    EXPECT_EQ(b->duration, 3);
    EXPECT_EQ(a->timestamp, 1'000'000);
    EXPECT_EQ(b->timestamp, 1'000'000);
    EXPECT_FALSE(a->url.has_value());
    EXPECT_EQ(b->url, "https://b.example");
    EXPECT_EQ(b->app_name, "b");
    EXPECT_EQ(b->window_title, "y");

    EXPECT_EQ(store.AccumulatedSeconds("a:x"), 0U);
    EXPECT_EQ(store.AccumulatedSeconds("b:https://b.example"), 0U);
}

TEST(FlusherTest, EmptyFlushAppendsNothing)
{
    AggregationStore store;
    MemoryUsageLog log;
    FakeClock clock;
    Flusher flusher(store, log, clock, std::chrono::seconds(30));

    const FlushResult result = flusher.FlushOnce();
    EXPECT_EQ(result.records, 0U);
    EXPECT_FALSE(result.failed);
    EXPECT_EQ(log.batches(), 0);
}

TEST(FlusherTest, IdleTargetsAreSkipped)
{
    AggregationStore store;
    MemoryUsageLog log;
    FakeClock clock;
    Flusher flusher(store, log, clock, std::chrono::seconds(30));

    std::uint64_t tick = 0;
    sample(store, MakeTarget("a", "x", std::nullopt), 4, tick);
    (void)flusher.FlushOnce();

    sample(store, MakeTarget("b", "y", std::nullopt), 2, tick);
    clock.Advance(30);
    const FlushResult second = flusher.FlushOnce();

    EXPECT_EQ(second.records, 1U);
    const auto records = log.records();
    ASSERT_EQ(records.size(), 2U);
    EXPECT_EQ(records.back().identifier, "b:y");
    EXPECT_EQ(records.back().duration, 2);
}

TEST(FlusherTest, ScenarioChromeThenFirefox)
{
    AggregationStore store;
    MemoryUsageLog log;
    FakeClock clock;
    Flusher flusher(store, log, clock, std::chrono::seconds(30));

    std::uint64_t tick = 0;
    sample(store, MakeTarget("chrome.exe", "Docs", std::nullopt), 45, tick);
    sample(store, MakeTarget("firefox.exe", "News", std::nullopt), 30, tick);

    (void)flusher.FlushOnce();

    const auto records = log.records();
    ASSERT_EQ(records.size(), 2U);
    EXPECT_EQ(findRecord(records, "chrome.exe:Docs")->duration, 45);
    EXPECT_EQ(findRecord(records, "firefox.exe:News")->duration, 30);

    const StoreSnapshot snap = store.Snapshot();
    EXPECT_EQ(snap.active_targets.size(), 2U);
    for (const auto& a : snap.active_targets)
    {
        EXPECT_EQ(a.unflushed_seconds, 0U);
    }
}

// =============================================================================
// Failure policy
// =============================================================================

TEST(FlusherTest, FailedBatchDropsIntervalAndNextFlushProceeds)
{
    AggregationStore store;
    MemoryUsageLog log;
    FakeClock clock;
    Flusher flusher(store, log, clock, std::chrono::seconds(30));

    std::uint64_t tick = 0;
    sample(store, MakeTarget("a", "x", std::nullopt), 10, tick);

    log.failNext(1);
    const FlushResult failed = flusher.FlushOnce();
    EXPECT_TRUE(failed.failed);
    EXPECT_EQ(failed.records, 0U);
    EXPECT_EQ(flusher.FailedFlushes(), 1U);
    EXPECT_TRUE(log.records().empty());

    // Not re-merged: the lost seconds are gone.
    EXPECT_EQ(store.AccumulatedSeconds("a:x"), 0U);

    sample(store, MakeTarget("a", "x", std::nullopt), 2, tick);
    const FlushResult next = flusher.FlushOnce();
    EXPECT_FALSE(next.failed);
    const auto records = log.records();
    ASSERT_EQ(records.size(), 1U);
    EXPECT_EQ(records[0].duration, 2);
}

// =============================================================================
// Pruning
// =============================================================================

TEST(FlusherTest, PrunesWhenRetentionConfigured)
{
    AggregationStore store;
    MemoryUsageLog log;
    FakeClock clock(10 * 86400);
    Flusher flusher(store, log, clock, std::chrono::seconds(30), 7);

    std::uint64_t tick = 0;
    sample(store, MakeTarget("a", "x", std::nullopt), 1, tick);
    (void)flusher.FlushOnce();

    ASSERT_TRUE(log.lastPruneCutoff().has_value());
    EXPECT_EQ(*log.lastPruneCutoff(), 3 * 86400);
}

TEST(FlusherTest, NoPruningByDefault)
{
    AggregationStore store;
    MemoryUsageLog log;
    FakeClock clock;
    Flusher flusher(store, log, clock, std::chrono::seconds(30));

    std::uint64_t tick = 0;
    sample(store, MakeTarget("a", "x", std::nullopt), 1, tick);
    (void)flusher.FlushOnce();

    EXPECT_FALSE(log.lastPruneCutoff().has_value());
}

// =============================================================================
// Lifecycle
// =============================================================================

TEST(FlusherTest, StopPerformsFinalFlush)
{
    AggregationStore store;
    MemoryUsageLog log;
    FakeClock clock;
    Flusher flusher(store, log, clock, std::chrono::seconds(3600));

    flusher.Start();
    std::uint64_t tick = 0;
    sample(store, MakeTarget("a", "x", std::nullopt), 6, tick);
    flusher.Stop();

    const auto records = log.records();
    ASSERT_EQ(records.size(), 1U);
    EXPECT_EQ(records[0].duration, 6);
}

TEST(FlusherTest, StopWithoutStartDoesNotFlush)
{
    AggregationStore store;
    MemoryUsageLog log;
    FakeClock clock;
    {
        Flusher flusher(store, log, clock, std::chrono::seconds(30));
        std::uint64_t tick = 0;
        sample(store, MakeTarget("a", "x", std::nullopt), 1, tick);
        flusher.Stop();
    }
    EXPECT_EQ(log.batches(), 0);
}

TEST(FlusherTest, WorkerFlushesOnItsPeriod)
{
    AggregationStore store;
    MemoryUsageLog log;
    FakeClock clock;
    Flusher flusher(store, log, clock, std::chrono::seconds(1));

    std::uint64_t tick = 0;
    sample(store, MakeTarget("a", "x", std::nullopt), 3, tick);
    flusher.Start();

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (log.batches() == 0 && std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    flusher.Stop();

    const auto records = log.records();
    ASSERT_EQ(records.size(), 1U);
    EXPECT_EQ(records[0].duration, 3);
}
