#include <gtest/gtest.h>

#include <atomic>

#include "errors.hpp"
#include "fake_transport.hpp"
#include "worker_pool.hpp"

TEST(WorkerPool, FourWorkersWithCappedResponses)
{
    FakeTransport transport(make_stream(524288), 65536);
    ChunkStore store(524288);
    FetchStats stats;
    std::atomic<bool> cancelled{false};
    WorkerPool pool(transport, store, stats, cancelled, 4);

    auto outcomes = pool.run(4);

    ASSERT_EQ(outcomes.size(), 4u);
    for (const auto &outcome : outcomes)
    {
        EXPECT_TRUE(outcome.completed()) << outcome.error;
        EXPECT_EQ(outcome.range.size(), 131072u);
        EXPECT_EQ(outcome.received, 131072u);
        EXPECT_EQ(transport.requests_within(outcome.range), 2u);
    }
    EXPECT_EQ(transport.requests().size(), 8u);
    EXPECT_TRUE(store.gaps().empty());
    EXPECT_EQ(store.size(), 4u);
}

TEST(WorkerPool, StalledWorkerDoesNotStopTheOthers)
{
    FakeTransport transport(make_stream(400));
    // The second range only ever delivers its first half
    transport.set_policy(
        [](const ByteRange &requested, std::size_t)
        {
            if (requested.begin >= 150 && requested.begin < 200)
            {
                return Reply{206, 0};
            }
            return Reply{206, std::min<std::uint64_t>(50, requested.size())};
        });
    ChunkStore store(400);
    FetchStats stats;
    std::atomic<bool> cancelled{false};
    WorkerPool pool(transport, store, stats, cancelled, 3);

    auto outcomes = pool.run(4);

    ASSERT_EQ(outcomes.size(), 4u);
    EXPECT_TRUE(outcomes[0].completed());
    EXPECT_FALSE(outcomes[1].completed());
    EXPECT_EQ(outcomes[1].received, 50u);
    EXPECT_TRUE(outcomes[2].completed());
    EXPECT_TRUE(outcomes[3].completed());

    EXPECT_EQ(store.gaps(), (std::vector<ByteRange>{{150, 200}}));
    EXPECT_EQ(stats.stalled_ranges(), 1u);
    EXPECT_FALSE(cancelled.load());
}

TEST(WorkerPool, ProtocolErrorCancelsTheRun)
{
    FakeTransport transport(make_stream(1000));
    transport.set_policy(
        [](const ByteRange &requested, std::size_t)
        {
            if (requested.begin == 0)
            {
                return Reply{500, 0};
            }
            return Reply{206, std::min<std::uint64_t>(1, requested.size())};
        });
    ChunkStore store(1000);
    FetchStats stats;
    std::atomic<bool> cancelled{false};
    WorkerPool pool(transport, store, stats, cancelled, 3);

    EXPECT_THROW(pool.run(2), ProtocolError);
    EXPECT_TRUE(cancelled.load());
    EXPECT_FALSE(store.gaps().empty());
}

TEST(WorkerPool, CancelledBeforeStart)
{
    FakeTransport transport(make_stream(1000));
    ChunkStore store(1000);
    FetchStats stats;
    std::atomic<bool> cancelled{true};
    WorkerPool pool(transport, store, stats, cancelled, 3);

    EXPECT_THROW(pool.run(3), Cancelled);
    EXPECT_TRUE(transport.requests().empty());
    EXPECT_EQ(store.size(), 0u);
}

TEST(WorkerPool, EmptyStreamStartsNoWorker)
{
    FakeTransport transport(bytes_t{});
    ChunkStore store(0);
    FetchStats stats;
    std::atomic<bool> cancelled{false};
    WorkerPool pool(transport, store, stats, cancelled, 3);

    EXPECT_TRUE(pool.run(4).empty());
    EXPECT_TRUE(transport.requests().empty());
}
