#include <ratecord/request_queue.hpp>

#include <gtest/gtest.h>

namespace Ratecord {
namespace {

PendingRequestPtr makeRequest(uint64_t sequence) {
    PendingRequestPtr request = std::make_shared<PendingRequest>();
    request->sequence = sequence;
    return request;
}

class RequestQueueTest : public ::testing::Test {
protected:
    RequestQueue queue;
    BucketStore store;
    TimePoint now = Clock::now();
};

TEST_F(RequestQueueTest, DequeuesInSubmissionOrder) {
    PendingRequestPtr first = makeRequest(1), second = makeRequest(2), third = makeRequest(3);
    queue.enqueue("a", first);
    queue.enqueue("a", second);
    queue.enqueue("a", third);

    EXPECT_EQ(queue.dequeueNextReady("a", store, now), first);
    EXPECT_EQ(queue.dequeueNextReady("a", store, now), second);
    EXPECT_EQ(queue.dequeueNextReady("a", store, now), third);
    EXPECT_EQ(queue.dequeueNextReady("a", store, now), nullptr);
    EXPECT_TRUE(queue.empty());
}

TEST_F(RequestQueueTest, BucketsAreIndependent) {
    PendingRequestPtr first = makeRequest(1), second = makeRequest(2);
    queue.enqueue("a", first);
    queue.enqueue("b", second);

    store.reserve("a", now);

    EXPECT_EQ(queue.dequeueNextReady("a", store, now), nullptr);
    EXPECT_EQ(queue.dequeueNextReady("b", store, now), second);
}

TEST_F(RequestQueueTest, UnavailableBucketBlocksHead) {
    PendingRequestPtr first = makeRequest(1);
    queue.enqueue("a", first);

    store.exhaust("a", now + std::chrono::seconds(1));
    EXPECT_EQ(queue.dequeueNextReady("a", store, now), nullptr);
    EXPECT_EQ(queue.front("a"), first);

    EXPECT_EQ(queue.dequeueNextReady("a", store, now + std::chrono::seconds(1)), first);
}

TEST_F(RequestQueueTest, BackoffOfHeadBlocksQueue) {
    PendingRequestPtr first = makeRequest(1), second = makeRequest(2);
    first->notBefore = now + std::chrono::milliseconds(100);
    queue.enqueue("a", first);
    queue.enqueue("a", second);

    EXPECT_EQ(queue.dequeueNextReady("a", store, now), nullptr);
    EXPECT_EQ(queue.dequeueNextReady("a", store, now + std::chrono::milliseconds(100)), first);
}

TEST_F(RequestQueueTest, RequeueFrontKeepsOriginalPriority) {
    PendingRequestPtr first = makeRequest(1), second = makeRequest(2), third = makeRequest(3);
    queue.enqueue("a", first);
    queue.enqueue("a", second);
    queue.enqueue("a", third);

    EXPECT_EQ(queue.dequeueNextReady("a", store, now), first);
    queue.requeueFront("a", first);

    EXPECT_EQ(queue.front("a"), first);
    EXPECT_EQ(queue.size("a"), 3u);
}

TEST_F(RequestQueueTest, RemoveLeavesOthersQueued) {
    PendingRequestPtr first = makeRequest(1), second = makeRequest(2);
    queue.enqueue("a", first);
    queue.enqueue("a", second);

    EXPECT_TRUE(queue.remove("a", first));
    EXPECT_FALSE(queue.remove("a", first));
    EXPECT_EQ(queue.front("a"), second);
}

TEST_F(RequestQueueTest, ReconcileMergesBySequence) {
    PendingRequestPtr first = makeRequest(1), second = makeRequest(2), third = makeRequest(3), fourth = makeRequest(4);
    queue.enqueue("a", first);
    queue.enqueue("b", second);
    queue.enqueue("a", third);
    queue.enqueue("b", fourth);

    queue.reconcile("a", "b");

    EXPECT_FALSE(queue.contains("a"));
    ASSERT_EQ(queue.size("b"), 4u);
    EXPECT_EQ(queue.dequeueNextReady("b", store, now), first);
    EXPECT_EQ(queue.dequeueNextReady("b", store, now), second);
    EXPECT_EQ(queue.dequeueNextReady("b", store, now), third);
    EXPECT_EQ(queue.dequeueNextReady("b", store, now), fourth);
}

TEST(RequestStateTest, Names) {
    EXPECT_STREQ(toString(RequestState::Queued), "Queued");
    EXPECT_STREQ(toString(RequestState::Retrying), "Retrying");
}

} // namespace
} // namespace Ratecord
