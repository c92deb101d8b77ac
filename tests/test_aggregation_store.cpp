/// @file test_aggregation_store.cpp
/// @brief Tests for AggregationStore
///
/// Tests cover:
/// - Exact per-tick accumulation
/// - Drain semantics (reset without forgetting entries)
/// - Current-target selection by most recent tick
/// - Metadata refresh under a stable identifier
/// - Concurrent record/drain without lost or doubled seconds

#include "aggregation_store.hpp"
#include "browser_url.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <map>
#include <thread>
#include <vector>

namespace
{

ActivityTarget chromeAt(const std::string& url)
{
    return MakeTarget("chrome", "Some page - " + url, url);
}

std::map<std::string, std::uint64_t> asMap(const std::vector<std::pair<ActivityTarget, std::uint64_t>>& drained)
{
    std::map<std::string, std::uint64_t> out;
    for (const auto& [target, seconds] : drained)
    {
        out[target.identifier] = seconds;
    }
    return out;
}

} // namespace

// =============================================================================
// Accumulation
// =============================================================================

TEST(AggregationStoreTest, EmptyStoreHasNoCurrentTarget)
{
    AggregationStore store;
    const StoreSnapshot snap = store.Snapshot();

    EXPECT_FALSE(snap.current_target.has_value());
    EXPECT_TRUE(snap.active_targets.empty());
    EXPECT_EQ(snap.total_distinct_targets, 0U);
}

TEST(AggregationStoreTest, FirstSampleCreatesEntryWithOneSecond)
{
    AggregationStore store;
    store.RecordSample(MakeTarget("kitty", "zsh", std::nullopt), 1);

    EXPECT_EQ(store.AccumulatedSeconds("kitty:zsh"), 1U);
    EXPECT_EQ(store.Size(), 1U);
}

TEST(AggregationStoreTest, NConsecutiveSamplesAccumulateExactlyN)
{
    AggregationStore store;
    const auto target = MakeTarget("kitty", "vim main.cpp", std::nullopt);
    for (std::uint64_t tick = 1; tick <= 137; ++tick)
    {
        store.RecordSample(target, tick);
    }

    EXPECT_EQ(store.AccumulatedSeconds(target.identifier), 137U);
}

TEST(AggregationStoreTest, UnknownIdentifierHasNoAccumulator)
{
    AggregationStore store;
    EXPECT_FALSE(store.AccumulatedSeconds("nope:nothing").has_value());
}

// =============================================================================
// Identifier stability
// =============================================================================

TEST(AggregationStoreTest, DifferentUrlsAreDistinctTargets)
{
    AggregationStore store;
    store.RecordSample(chromeAt("https://a.example"), 1);
    store.RecordSample(chromeAt("https://b.example"), 2);

    EXPECT_EQ(store.Size(), 2U);
    EXPECT_EQ(store.AccumulatedSeconds("chrome:https://a.example"), 1U);
    EXPECT_EQ(store.AccumulatedSeconds("chrome:https://b.example"), 1U);
}

TEST(AggregationStoreTest, SameIdentifierAccumulatesAndRefreshesMetadata)
{
    AggregationStore store;

    ActivityTarget first = MakeTarget("firefox", "Inbox", std::nullopt);
    ActivityTarget second = first;
    second.window_title = "Inbox (3)";
    second.url = "https://mail.example";

    store.RecordSample(first, 1);
    store.RecordSample(second, 2);

    EXPECT_EQ(store.Size(), 1U);
    EXPECT_EQ(store.AccumulatedSeconds("firefox:Inbox"), 2U);

    const StoreSnapshot snap = store.Snapshot();
    ASSERT_TRUE(snap.current_target.has_value());
    EXPECT_EQ(snap.current_target->identifier, "firefox:Inbox");
    EXPECT_EQ(snap.current_target->window_title, "Inbox (3)");
    EXPECT_EQ(snap.current_target->url, "https://mail.example");
}

// =============================================================================
// Drain
// =============================================================================

TEST(AggregationStoreTest, DrainReturnsCountersAndResetsThem)
{
    AggregationStore store;
    const auto a = MakeTarget("a", "x", std::nullopt);
    const auto b = MakeTarget("b", "y", std::nullopt);
    std::uint64_t tick = 0;
    for (int i = 0; i < 5; ++i)
    {
        store.RecordSample(a, ++tick);
    }
    for (int i = 0; i < 3; ++i)
    {
        store.RecordSample(b, ++tick);
    }

    const auto drained = asMap(store.DrainForFlush());
    ASSERT_EQ(drained.size(), 2U);
    EXPECT_EQ(drained.at("a:x"), 5U);
    EXPECT_EQ(drained.at("b:y"), 3U);

    EXPECT_EQ(store.AccumulatedSeconds("a:x"), 0U);
    EXPECT_EQ(store.AccumulatedSeconds("b:y"), 0U);
    EXPECT_EQ(store.Size(), 2U);
}

TEST(AggregationStoreTest, DrainIsOrderedByIdentifier)
{
    AggregationStore store;
    store.RecordSample(MakeTarget("zed", "t", std::nullopt), 1);
    store.RecordSample(MakeTarget("alpha", "t", std::nullopt), 2);
    store.RecordSample(MakeTarget("mid", "t", std::nullopt), 3);

    const auto drained = store.DrainForFlush();
    ASSERT_EQ(drained.size(), 3U);
    EXPECT_EQ(drained[0].first.identifier, "alpha:t");
    EXPECT_EQ(drained[1].first.identifier, "mid:t");
    EXPECT_EQ(drained[2].first.identifier, "zed:t");
}

TEST(AggregationStoreTest, SecondDrainWithoutSamplesIsAllZero)
{
    AggregationStore store;
    store.RecordSample(MakeTarget("a", "x", std::nullopt), 1);
    (void)store.DrainForFlush();

    const auto drained = store.DrainForFlush();
    ASSERT_EQ(drained.size(), 1U);
    EXPECT_EQ(drained[0].second, 0U);
}

TEST(AggregationStoreTest, AccumulationRestartsFromZeroAfterDrain)
{
    AggregationStore store;
    const auto a = MakeTarget("a", "x", std::nullopt);
    store.RecordSample(a, 1);
    store.RecordSample(a, 2);
    (void)store.DrainForFlush();
    store.RecordSample(a, 3);

    EXPECT_EQ(store.AccumulatedSeconds("a:x"), 1U);
}

// =============================================================================
// Snapshot
// =============================================================================

TEST(AggregationStoreTest, CurrentTargetIsMostRecentTick)
{
    AggregationStore store;
    store.RecordSample(MakeTarget("a", "t", std::nullopt), 10);
    store.RecordSample(MakeTarget("b", "t", std::nullopt), 12);
    store.RecordSample(MakeTarget("c", "t", std::nullopt), 9);

    const StoreSnapshot snap = store.Snapshot();
    ASSERT_TRUE(snap.current_target.has_value());
    EXPECT_EQ(snap.current_target->identifier, "b:t");
}

TEST(AggregationStoreTest, ActiveTargetsSortedBySessionSecondsDescending)
{
    AggregationStore store;
    std::uint64_t tick = 0;
    for (int i = 0; i < 2; ++i)
    {
        store.RecordSample(MakeTarget("small", "t", std::nullopt), ++tick);
    }
    for (int i = 0; i < 7; ++i)
    {
        store.RecordSample(MakeTarget("big", "t", std::nullopt), ++tick);
    }
    for (int i = 0; i < 4; ++i)
    {
        store.RecordSample(MakeTarget("medium", "t", std::nullopt), ++tick);
    }

    const StoreSnapshot snap = store.Snapshot();
    ASSERT_EQ(snap.active_targets.size(), 3U);
    EXPECT_EQ(snap.active_targets[0].identifier, "big:t");
    EXPECT_EQ(snap.active_targets[0].seconds, 7U);
    EXPECT_EQ(snap.active_targets[1].identifier, "medium:t");
    EXPECT_EQ(snap.active_targets[2].identifier, "small:t");
    EXPECT_EQ(snap.total_distinct_targets, 3U);
}

TEST(AggregationStoreTest, SnapshotKeepsSessionTotalsAcrossDrains)
{
    AggregationStore store;
    std::uint64_t tick = 0;
    for (int i = 0; i < 45; ++i)
    {
        store.RecordSample(MakeTarget("chrome", "Docs", std::nullopt), ++tick);
    }
    for (int i = 0; i < 30; ++i)
    {
        store.RecordSample(MakeTarget("firefox", "News", std::nullopt), ++tick);
    }

    const auto drained = asMap(store.DrainForFlush());
    EXPECT_EQ(drained.at("chrome:Docs"), 45U);
    EXPECT_EQ(drained.at("firefox:News"), 30U);

    const StoreSnapshot snap = store.Snapshot();
    ASSERT_EQ(snap.active_targets.size(), 2U);
    EXPECT_EQ(snap.active_targets[0].identifier, "chrome:Docs");
    EXPECT_EQ(snap.active_targets[0].seconds, 45U);
    EXPECT_EQ(snap.active_targets[0].unflushed_seconds, 0U);
    EXPECT_EQ(snap.active_targets[1].identifier, "firefox:News");
    EXPECT_EQ(snap.active_targets[1].seconds, 30U);
    EXPECT_EQ(snap.active_targets[1].unflushed_seconds, 0U);
    ASSERT_TRUE(snap.current_target.has_value());
    EXPECT_EQ(snap.current_target->identifier, "firefox:News");
}

// =============================================================================
// Concurrency
// =============================================================================

TEST(AggregationStoreTest, ConcurrentDrainsNeverLoseOrDuplicateSeconds)
{
    AggregationStore store;
    constexpr std::uint64_t kSamples = 20000;
    std::atomic<bool> done{false};
    std::uint64_t drainedTotal = 0;

    std::thread drainer([&] {
        while (!done.load())
        {
            for (const auto& [target, seconds] : store.DrainForFlush())
            {
                drainedTotal += seconds;
            }
            (void)store.Snapshot();
        }
    });

    const auto targetA = MakeTarget("a", "x", std::nullopt);
    const auto targetB = MakeTarget("b", "y", std::nullopt);
    for (std::uint64_t tick = 1; tick <= kSamples; ++tick)
    {
        store.RecordSample(tick % 3 == 0 ? targetB : targetA, tick);
    }
    done.store(true);
    drainer.join();

    for (const auto& [target, seconds] : store.DrainForFlush())
    {
        drainedTotal += seconds;
    }

    EXPECT_EQ(drainedTotal, kSamples);
}
