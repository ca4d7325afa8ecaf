#include <ratecord/bucket_store.hpp>

#include <gtest/gtest.h>

namespace Ratecord {
namespace {

using std::chrono::milliseconds;
using std::chrono::seconds;

REST::HeadersMap quotaHeaders(const std::string& limit, const std::string& remaining, const std::string& resetAfter) {
    REST::HeadersMap headers;
    headers["X-RateLimit-Limit"]       = limit;
    headers["X-RateLimit-Remaining"]   = remaining;
    headers["X-RateLimit-Reset-After"] = resetAfter;
    return headers;
}

class BucketStoreTest : public ::testing::Test {
protected:
    BucketStore store;
    TimePoint now = Clock::now();
    const std::string key = "POST /channels/123/messages";
};

TEST_F(BucketStoreTest, UnknownBucketIsAvailable) {
    EXPECT_TRUE(store.isAvailable(key, now));
    EXPECT_EQ(store.find(key), nullptr);
}

TEST_F(BucketStoreTest, UnknownBucketAllowsSingleInFlight) {
    store.reserve(key, now);
    EXPECT_FALSE(store.isAvailable(key, now));

    store.release(key);
    EXPECT_TRUE(store.isAvailable(key, now));
}

TEST_F(BucketStoreTest, UpdateParsesHeaders) {
    store.update(key, { "123" }, quotaHeaders("5", "4", "2.5"), now);

    const Bucket* bucket = store.find(key);
    ASSERT_NE(bucket, nullptr);
    ASSERT_TRUE(bucket->limit);
    ASSERT_TRUE(bucket->remaining);
    EXPECT_EQ(*bucket->limit, 5u);
    EXPECT_EQ(*bucket->remaining, 4u);
    EXPECT_EQ(bucket->resetAt, now + milliseconds(2500));
}

TEST_F(BucketStoreTest, HeaderNamesAreCaseInsensitive) {
    REST::HeadersMap headers;
    headers["x-ratelimit-limit"]       = "10";
    headers["x-ratelimit-remaining"]   = "9";
    headers["x-ratelimit-reset-after"] = "1";
    store.update(key, {}, headers, now);

    ASSERT_NE(store.find(key), nullptr);
    EXPECT_EQ(*store.find(key)->remaining, 9u);
}

TEST_F(BucketStoreTest, ExhaustedBucketWaitsForReset) {
    store.update(key, {}, quotaHeaders("5", "0", "2"), now);

    BucketAvailability availability = store.availability(key, now + milliseconds(1999));
    EXPECT_FALSE(availability.available);
    ASSERT_TRUE(availability.retryAt);
    EXPECT_EQ(*availability.retryAt, now + seconds(2));

    EXPECT_TRUE(store.isAvailable(key, now + seconds(2)));
    EXPECT_EQ(*store.find(key)->remaining, 5u);
}

TEST_F(BucketStoreTest, ReserveNeverMakesRemainingNegative) {
    store.update(key, {}, quotaHeaders("1", "1", "10"), now);

    store.reserve(key, now);
    store.release(key);
    EXPECT_EQ(*store.find(key)->remaining, 0u);

    store.reserve(key, now);
    store.release(key);
    EXPECT_EQ(*store.find(key)->remaining, 0u);
}

TEST_F(BucketStoreTest, AbsentHeadersLeaveBucketUnchanged) {
    store.update(key, {}, quotaHeaders("5", "3", "1"), now);
    BucketUpdate update = store.update(key, {}, REST::HeadersMap(), now);

    EXPECT_FALSE(update.anomaly);
    EXPECT_EQ(*store.find(key)->remaining, 3u);
}

TEST_F(BucketStoreTest, UnparseableHeadersMakeStateUnknown) {
    store.update(key, {}, quotaHeaders("5", "3", "1"), now);
    BucketUpdate update = store.update(key, {}, quotaHeaders("5", "three", "1"), now);

    EXPECT_TRUE(update.anomaly);
    const Bucket* bucket = store.find(key);
    ASSERT_NE(bucket, nullptr);
    EXPECT_FALSE(bucket->limit);
    EXPECT_FALSE(bucket->remaining);
    EXPECT_TRUE(store.isAvailable(key, now));
}

TEST_F(BucketStoreTest, HugeResetAfterIsClamped) {
    BucketUpdate update = store.update(key, {}, quotaHeaders("5", "0", "1e300"), now);

    EXPECT_FALSE(update.anomaly);
    BucketAvailability availability = store.availability(key, now);
    EXPECT_FALSE(availability.available);
    ASSERT_TRUE(availability.retryAt);
    EXPECT_EQ(*availability.retryAt, now + std::chrono::hours(24));
}

TEST_F(BucketStoreTest, NegativeRemainingIsAnomaly) {
    BucketUpdate update = store.update(key, {}, quotaHeaders("5", "-1", "1"), now);

    EXPECT_TRUE(update.anomaly);
    EXPECT_FALSE(store.find(key)->remaining);
}

TEST_F(BucketStoreTest, RemainingWithoutResetIsAnomaly) {
    REST::HeadersMap headers;
    headers["X-RateLimit-Remaining"] = "2";

    EXPECT_TRUE(store.update(key, {}, headers, now).anomaly);
}

TEST_F(BucketStoreTest, ReconcilesKeysSharingRemoteBucket) {
    const std::string otherKey = "PATCH /channels/123/messages/:id";

    REST::HeadersMap headers = quotaHeaders("5", "4", "1");
    headers["X-RateLimit-Bucket"] = "abcd";

    BucketUpdate first = store.update(key, { "123" }, headers, now);
    EXPECT_TRUE(first.reconciled);
    EXPECT_EQ(first.previousKey, key);
    EXPECT_EQ(first.key, "bucket:abcd:123");

    headers["X-RateLimit-Remaining"] = "3";
    BucketUpdate second = store.update(otherKey, { "123" }, headers, now);
    EXPECT_TRUE(second.reconciled);
    EXPECT_EQ(second.key, first.key);

    EXPECT_EQ(store.resolve(key), store.resolve(otherKey));
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(*store.find(key)->remaining, 3u);
    EXPECT_EQ(store.find(key)->remoteId, "abcd");
}

TEST_F(BucketStoreTest, SameRemoteBucketWithDifferentMajorParametersStaysSeparate) {
    REST::HeadersMap headers = quotaHeaders("5", "4", "1");
    headers["X-RateLimit-Bucket"] = "abcd";

    store.update("POST /channels/1/messages", { "1" }, headers, now);
    store.update("POST /channels/2/messages", { "2" }, headers, now);

    EXPECT_NE(store.resolve("POST /channels/1/messages"), store.resolve("POST /channels/2/messages"));
}

TEST_F(BucketStoreTest, ExhaustBlocksUntilGivenTime) {
    store.exhaust(key, now + milliseconds(1500));

    EXPECT_FALSE(store.isAvailable(key, now + milliseconds(1499)));
    EXPECT_TRUE(store.isAvailable(key, now + milliseconds(1500)));
}

TEST_F(BucketStoreTest, GlobalExhaustion) {
    EXPECT_FALSE(store.globalBlockedUntil(now));

    store.exhaustGlobal(now + seconds(1));
    ASSERT_TRUE(store.globalBlockedUntil(now));
    EXPECT_EQ(*store.globalBlockedUntil(now), now + seconds(1));
    EXPECT_FALSE(store.globalBlockedUntil(now + seconds(1)));
}

TEST_F(BucketStoreTest, GlobalRequestsPerSecond) {
    store.setGlobalRequestsPerSecond(2);

    EXPECT_FALSE(store.globalBlockedUntil(now));
    store.consumeGlobal(now);
    store.consumeGlobal(now + milliseconds(10));

    ASSERT_TRUE(store.globalBlockedUntil(now + milliseconds(20)));
    EXPECT_EQ(*store.globalBlockedUntil(now + milliseconds(20)), store.global().windowStart + seconds(1));
    EXPECT_FALSE(store.globalBlockedUntil(store.global().windowStart + seconds(1)));
}

TEST_F(BucketStoreTest, SweepRemovesIdleBucketsOnly) {
    store.update("GET /a", {}, quotaHeaders("5", "4", "1"), now);
    store.update("GET /b", {}, quotaHeaders("5", "0", "10"), now);
    store.update("GET /c", {}, quotaHeaders("5", "4", "1"), now);
    store.reserve("GET /c", now);
    store.update("GET /d", {}, quotaHeaders("5", "4", "1"), now);

    std::size_t removed = store.sweep(now + seconds(2), [](const std::string& key) { return key == "GET /d"; });

    EXPECT_EQ(removed, 1u);
    EXPECT_EQ(store.find("GET /a"), nullptr);
    EXPECT_NE(store.find("GET /b"), nullptr);
    EXPECT_NE(store.find("GET /c"), nullptr);
    EXPECT_NE(store.find("GET /d"), nullptr);
}

} // namespace
} // namespace Ratecord
