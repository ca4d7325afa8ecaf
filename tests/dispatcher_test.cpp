#include <ratecord/dispatcher.hpp>

#include <atomic>
#include <future>
#include <sstream>
#include <stdexcept>
#include <streambuf>
#include <boost/asio/error.hpp>
#include <ratecord/exceptions.hpp>
#include "mock_transport.hpp"

#include <gtest/gtest.h>

namespace Ratecord {
namespace {

using std::chrono::milliseconds;
using Testing::Clock;
using Testing::MockTransport;
using Testing::jsonResponse;
using Testing::makeResponse;

REST::HeadersMap quota(const std::string& limit, const std::string& remaining, const std::string& resetAfter,
                       const std::string& bucket = std::string()) {
    REST::HeadersMap headers;
    headers["X-RateLimit-Limit"]       = limit;
    headers["X-RateLimit-Remaining"]   = remaining;
    headers["X-RateLimit-Reset-After"] = resetAfter;
    if (!bucket.empty()) headers["X-RateLimit-Bucket"] = bucket;
    return headers;
}

milliseconds between(const MockTransport::Call& from, const MockTransport::Call& to) {
    return std::chrono::duration_cast<milliseconds>(to.at - from.at);
}

/// Stream which can't seek, like pipe or socket.
class ForwardOnlyStream : public std::istream {
public:
    explicit ForwardOnlyStream(const std::string& data)
        : std::istream(nullptr)
        , buffer(data) {
        rdbuf(&buffer);
    }

private:
    class Buffer : public std::streambuf {
    public:
        explicit Buffer(const std::string& data) : data(data) {
            setg(&this->data[0], &this->data[0], &this->data[0] + this->data.size());
        }
    private:
        std::string data;
    };

    Buffer buffer;
};

class DispatcherTest : public ::testing::Test {
protected:
    DispatcherTest() {
        options.retry.baseDelay = milliseconds(20);
        options.retry.maxJitter = milliseconds(0);
    }

    /// Fulfilled on first 429, so test can act while request is backing off.
    std::future<void> rateLimitObserved(Dispatcher& dispatcher) {
        auto promise = std::make_shared<std::promise<void> >();
        auto fired   = std::make_shared<std::atomic<bool> >(false);
        dispatcher.events.addHandler(RestEvent::RateLimit, [promise, fired](const nlohmann::json&) {
            if (!fired->exchange(true)) promise->set_value();
        });
        return promise->get_future();
    }

    MockTransport transport;
    BucketStore store;
    DispatcherOptions options;
};

TEST_F(DispatcherTest, UnknownBucketSerializesUntilFirstResponse) {
    transport.push("/channels/123/messages", jsonResponse(200, "{}", quota("5", "4", "10")), milliseconds(100));
    transport.push("/channels/123/messages", jsonResponse(200, "{}", quota("5", "3", "10")));
    transport.push("/channels/123/messages", jsonResponse(200, "{}", quota("5", "2", "10")));
    transport.push("/channels/123/messages", jsonResponse(200, "{}", quota("5", "1", "10")));
    transport.push("/channels/123/messages", jsonResponse(200, "{}", quota("5", "0", "10")));

    Dispatcher dispatcher(transport, store, options);
    Clock::time_point started = Clock::now();

    std::vector<std::future<nlohmann::json> > results;
    for (int i = 0; i < 5; ++i) {
        results.push_back(dispatcher.requestAsync("POST", "/channels/123/messages",
                                                  RequestBody::structured({ { "n", i } })));
    }
    for (auto& result : results) result.get();

    std::vector<MockTransport::Call> calls = transport.calls();
    ASSERT_EQ(calls.size(), 5u);
    EXPECT_EQ(transport.maxConcurrentCalls(), 1u);

    // Others waited for first response only.
    EXPECT_GE(between(calls[0], calls[1]), milliseconds(100));
    EXPECT_LT(Clock::now() - started, std::chrono::seconds(2));

    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(nlohmann::json::parse(calls[i].body)["n"], i);
    }
}

TEST_F(DispatcherTest, ExhaustedBucketWaitsForReset) {
    transport.push(jsonResponse(200, "{}", quota("5", "0", "0.3")));
    Dispatcher dispatcher(transport, store, options);

    dispatcher.request("POST", "/channels/123/messages");
    dispatcher.request("POST", "/channels/123/messages");

    std::vector<MockTransport::Call> calls = transport.calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_GE(between(calls[0], calls[1]), milliseconds(300));
}

TEST_F(DispatcherTest, BucketRateLimitDoesNotAffectOtherBuckets) {
    REST::HeadersMap headers;
    headers["X-RateLimit-Scope"] = "user";
    transport.push("/channels/1/", jsonResponse(429, R"({"retry_after": 0.5, "global": false})", headers));

    Dispatcher dispatcher(transport, store, options);
    std::future<void> rateLimited = rateLimitObserved(dispatcher);

    std::future<nlohmann::json> first = dispatcher.requestAsync("POST", "/channels/1/messages");
    ASSERT_EQ(rateLimited.wait_for(std::chrono::seconds(5)), std::future_status::ready);

    dispatcher.request("POST", "/channels/2/messages");
    first.get();

    std::vector<MockTransport::Call> calls = transport.calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_NE(calls[1].path.find("/channels/2/"), std::string::npos);
    EXPECT_NE(calls[2].path.find("/channels/1/"), std::string::npos);

    EXPECT_LT(between(calls[0], calls[1]), milliseconds(500));
    EXPECT_GE(between(calls[0], calls[2]), milliseconds(500));
}

TEST_F(DispatcherTest, GlobalRateLimitPausesAllBuckets) {
    REST::HeadersMap headers;
    headers["X-RateLimit-Global"] = "true";
    transport.push("/channels/1/", jsonResponse(429, R"({"retry_after": 0.4, "global": true})", headers));

    Dispatcher dispatcher(transport, store, options);
    std::future<void> rateLimited = rateLimitObserved(dispatcher);

    std::future<nlohmann::json> first = dispatcher.requestAsync("POST", "/channels/1/messages");
    ASSERT_EQ(rateLimited.wait_for(std::chrono::seconds(5)), std::future_status::ready);

    dispatcher.request("GET", "/guilds/2/emojis");
    first.get();

    std::vector<MockTransport::Call> calls = transport.calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_GE(between(calls[0], calls[1]), milliseconds(400));
    EXPECT_GE(between(calls[0], calls[2]), milliseconds(400));
}

TEST_F(DispatcherTest, ServerErrorsRetriedWithBackoff) {
    options.retry.maxAttempts = 3;
    options.retry.baseDelay   = milliseconds(100);

    transport.push(makeResponse(500));
    transport.push(makeResponse(500));
    transport.push(jsonResponse(200, R"({"ok": true})"));

    Dispatcher dispatcher(transport, store, options);
    nlohmann::json result = dispatcher.request("GET", "/channels/1");

    EXPECT_EQ(result["ok"], true);

    std::vector<MockTransport::Call> calls = transport.calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_GE(between(calls[0], calls[1]), milliseconds(100));
    EXPECT_GE(between(calls[1], calls[2]), milliseconds(200));
}

TEST_F(DispatcherTest, ClientErrorFailsAfterSingleAttempt) {
    transport.push(jsonResponse(404, R"({"message": "Unknown Channel", "code": 10003})"));
    Dispatcher dispatcher(transport, store, options);

    try {
        dispatcher.request("GET", "/channels/1");
        FAIL() << "ClientError expected";
    } catch (const ClientError& excp) {
        EXPECT_EQ(excp.httpCode, 404);
        EXPECT_EQ(excp.apiCode, 10003);
        EXPECT_EQ(excp.attempts, 1u);
        EXPECT_NE(excp.body.find("Unknown Channel"), std::string::npos);
    }
    EXPECT_EQ(transport.callCount(), 1u);
}

TEST_F(DispatcherTest, ServerErrorSurfacedAfterAttemptBudget) {
    options.retry.maxAttempts = 2;
    transport.push(makeResponse(502));
    transport.push(makeResponse(503));
    Dispatcher dispatcher(transport, store, options);

    try {
        dispatcher.request("GET", "/channels/1");
        FAIL() << "ServerError expected";
    } catch (const ServerError& excp) {
        EXPECT_EQ(excp.httpCode, 503);
        EXPECT_EQ(excp.attempts, 2u);
    }
    EXPECT_EQ(transport.callCount(), 2u);
}

TEST_F(DispatcherTest, NetworkErrorsRetried) {
    transport.pushError("", NetworkError("Request failed", boost::asio::error::connection_refused));
    transport.pushError("", NetworkError("Request failed", boost::asio::error::connection_reset));
    transport.push(jsonResponse(200, "[1,2]"));

    Dispatcher dispatcher(transport, store, options);

    EXPECT_EQ(dispatcher.request("GET", "/channels/1/messages"), nlohmann::json({ 1, 2 }));
    EXPECT_EQ(transport.callCount(), 3u);
}

TEST_F(DispatcherTest, NetworkErrorSurfacedWithCauseAndAttempts) {
    for (int i = 0; i < 3; ++i) {
        transport.pushError("", NetworkError("Request failed", boost::asio::error::host_unreachable));
    }
    Dispatcher dispatcher(transport, store, options);

    try {
        dispatcher.request("GET", "/channels/1");
        FAIL() << "NetworkError expected";
    } catch (const NetworkError& excp) {
        EXPECT_EQ(excp.cause, boost::asio::error::host_unreachable);
        EXPECT_EQ(excp.attempts, 3u);
    }
}

TEST_F(DispatcherTest, RateLimitErrorWhenRetriesDisabled) {
    options.retry.retryRateLimits = false;
    REST::HeadersMap headers;
    headers["Retry-After"] = "3";
    transport.push(makeResponse(429, headers));

    Dispatcher dispatcher(transport, store, options);

    try {
        dispatcher.request("GET", "/channels/1");
        FAIL() << "RateLimitError expected";
    } catch (const RateLimitError& excp) {
        EXPECT_EQ(excp.retryAfter, milliseconds(3000));
        EXPECT_FALSE(excp.global);
    }
    EXPECT_EQ(transport.callCount(), 1u);
}

TEST_F(DispatcherTest, TimeoutWhileQueued) {
    transport.push(jsonResponse(200, "{}", quota("1", "0", "5")));
    Dispatcher dispatcher(transport, store, options);
    dispatcher.request("GET", "/channels/1");

    RequestOptions requestOptions;
    requestOptions.timeout = milliseconds(100);

    Clock::time_point started = Clock::now();
    EXPECT_THROW(dispatcher.request("GET", "/channels/1", RequestBody(), requestOptions), TimeoutError);
    EXPECT_LT(Clock::now() - started, std::chrono::seconds(2));

    EXPECT_EQ(transport.callCount(), 1u);
    EXPECT_EQ(dispatcher.queued(), 0u);
}

TEST_F(DispatcherTest, TimeoutInFlightIsNotRetried) {
    transport.push(jsonResponse(200, "{}"), milliseconds(1000));
    Dispatcher dispatcher(transport, store, options);

    RequestOptions requestOptions;
    requestOptions.timeout = milliseconds(100);

    try {
        dispatcher.request("GET", "/channels/1", RequestBody(), requestOptions);
        FAIL() << "TimeoutError expected";
    } catch (const TimeoutError& excp) {
        EXPECT_EQ(excp.attempts, 1u);
    }
    EXPECT_EQ(transport.callCount(), 1u);
}

TEST_F(DispatcherTest, ExpiredRequestFreesItsPlaceInQueue) {
    transport.push(jsonResponse(200, "{}"), milliseconds(300));
    Dispatcher dispatcher(transport, store, options);

    RequestOptions shortTimeout;
    shortTimeout.timeout = milliseconds(50);

    auto first  = dispatcher.requestAsync("POST", "/channels/1/messages");
    auto second = dispatcher.requestAsync("POST", "/channels/1/messages", RequestBody(), shortTimeout);
    auto third  = dispatcher.requestAsync("POST", "/channels/1/messages");

    EXPECT_THROW(second.get(), TimeoutError);
    first.get();
    third.get();

    EXPECT_EQ(transport.callCount(), 2u);
}

TEST_F(DispatcherTest, DispatchOrderEqualsSubmissionOrder) {
    transport.setDefaultDelay(milliseconds(2));
    Dispatcher dispatcher(transport, store, options);

    std::vector<std::future<nlohmann::json> > results;
    for (int i = 0; i < 20; ++i) {
        results.push_back(dispatcher.requestAsync("PATCH", std::string("/channels/7/messages/") + std::to_string(100 + i),
                                                  RequestBody::structured({ { "n", i } })));
    }
    for (auto& result : results) result.get();

    std::vector<MockTransport::Call> calls = transport.calls();
    ASSERT_EQ(calls.size(), 20u);
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(nlohmann::json::parse(calls[i].body)["n"], i);
    }
}

TEST_F(DispatcherTest, DistinctBucketsRunInParallel) {
    transport.setDefaultDelay(milliseconds(200));
    Dispatcher dispatcher(transport, store, options);

    auto first  = dispatcher.requestAsync("GET", "/channels/1");
    auto second = dispatcher.requestAsync("GET", "/channels/2");
    first.get();
    second.get();

    EXPECT_EQ(transport.maxConcurrentCalls(), 2u);
}

TEST_F(DispatcherTest, MaxInFlightCapsParallelism) {
    options.maxInFlight = 1;
    transport.setDefaultDelay(milliseconds(100));
    Dispatcher dispatcher(transport, store, options);

    auto first  = dispatcher.requestAsync("GET", "/channels/1");
    auto second = dispatcher.requestAsync("GET", "/channels/2");
    first.get();
    second.get();

    EXPECT_EQ(transport.maxConcurrentCalls(), 1u);
}

TEST_F(DispatcherTest, BypassBucketsAllowsParallelSameBucket) {
    options.bypassBuckets = true;
    transport.setDefaultDelay(milliseconds(200));
    Dispatcher dispatcher(transport, store, options);

    auto first  = dispatcher.requestAsync("GET", "/channels/1");
    auto second = dispatcher.requestAsync("GET", "/channels/1");
    first.get();
    second.get();

    EXPECT_EQ(transport.maxConcurrentCalls(), 2u);
}

TEST_F(DispatcherTest, GlobalRequestsPerSecondLimit) {
    options.globalRequestsPerSecond = 2;
    Dispatcher dispatcher(transport, store, options);

    dispatcher.request("GET", "/channels/1");
    dispatcher.request("GET", "/channels/2");
    dispatcher.request("GET", "/channels/3");

    std::vector<MockTransport::Call> calls = transport.calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_LT(between(calls[0], calls[1]), milliseconds(500));
    EXPECT_GE(between(calls[0], calls[2]), milliseconds(900));
}

TEST_F(DispatcherTest, ReconciledRoutesShareQuota) {
    transport.push("/emojis/5", jsonResponse(200, "{}", quota("2", "0", "0.3", "emojihash")));
    transport.push("/emojis",   jsonResponse(200, "{}", quota("2", "1", "10", "emojihash")));
    Dispatcher dispatcher(transport, store, options);

    dispatcher.request("GET", "/guilds/1/emojis");
    dispatcher.request("GET", "/guilds/1/emojis/5");
    dispatcher.request("GET", "/guilds/1/emojis");

    std::vector<MockTransport::Call> calls = transport.calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_GE(between(calls[1], calls[2]), milliseconds(300));
    EXPECT_EQ(store.resolve("GET /guilds/1/emojis"), store.resolve("GET /guilds/1/emojis/:id"));
}

TEST_F(DispatcherTest, MalformedHeadersDoNotFailRequest) {
    transport.push(jsonResponse(200, R"({"id": "1"})", quota("five", "4", "1")));
    Dispatcher dispatcher(transport, store, options);

    EXPECT_EQ(dispatcher.request("GET", "/channels/1")["id"], "1");
    ASSERT_NE(store.find("GET /channels/1"), nullptr);
    EXPECT_FALSE(store.find("GET /channels/1")->remaining);
}

TEST_F(DispatcherTest, InvalidJsonIsProtocolError) {
    transport.push(jsonResponse(200, "{\"broken\":"));
    Dispatcher dispatcher(transport, store, options);

    EXPECT_THROW(dispatcher.request("GET", "/channels/1"), ProtocolError);
}

TEST_F(DispatcherTest, DecodesEmptyAndTextResponses) {
    transport.push(makeResponse(204));
    REST::HeadersMap text;
    text["Content-Type"] = "text/plain";
    transport.push(makeResponse(200, text, "pong"));
    Dispatcher dispatcher(transport, store, options);

    EXPECT_TRUE(dispatcher.request("DELETE", "/channels/1/messages/2").is_null());
    EXPECT_EQ(dispatcher.request("GET", "/ping"), "pong");
}

TEST_F(DispatcherTest, RejectsInvalidRequests) {
    Dispatcher dispatcher(transport, store, options);

    EXPECT_THROW(dispatcher.request("HEAD", "/channels/1"), InvalidParameter);
    EXPECT_THROW(dispatcher.request("GET", "channels/1"), InvalidParameter);
    EXPECT_EQ(transport.callCount(), 0u);
}

TEST_F(DispatcherTest, BuildsRequestFromOptions) {
    options.headers["Authorization"] = "Bot abc";
    Dispatcher dispatcher(transport, store, options);

    RequestOptions requestOptions;
    requestOptions.reason = std::string("spam cleanup & more");
    requestOptions.query  = { { "limit", std::string("10") }, { "before", boost::none } };
    requestOptions.headers["X-Custom"] = "1";

    dispatcher.request("GET", "/channels/1/messages", RequestBody::structured({ { "ignored", true } }), requestOptions);

    std::vector<MockTransport::Call> calls = transport.calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].path, "/api/v10/channels/1/messages?limit=10");
    EXPECT_EQ(calls[0].headers["Authorization"], "Bot abc");
    EXPECT_EQ(calls[0].headers["X-Audit-Log-Reason"], "spam%20cleanup%20%26%20more");
    EXPECT_EQ(calls[0].headers["x-custom"], "1");
    EXPECT_TRUE(calls[0].body.empty());
}

TEST_F(DispatcherTest, EmitsEvents) {
    transport.push(makeResponse(500));
    Dispatcher dispatcher(transport, store, options);

    std::vector<nlohmann::json> requests, done;
    dispatcher.events.addHandler(RestEvent::Request, [&requests](const nlohmann::json& payload) {
        requests.push_back(payload);
    });
    dispatcher.events.addHandler(RestEvent::Done, [&done](const nlohmann::json& payload) {
        done.push_back(payload);
    });

    dispatcher.request("POST", "/channels/1/messages");

    ASSERT_EQ(requests.size(), 2u);
    ASSERT_EQ(done.size(), 2u);
    EXPECT_EQ(requests[0]["route"], "POST /channels/1/messages");
    EXPECT_EQ(requests[0]["attempt"], 1);
    EXPECT_EQ(requests[1]["attempt"], 2);
    EXPECT_EQ(done[0]["status"], 500);
    EXPECT_EQ(done[1]["status"], 200);
    EXPECT_EQ(done[0]["id"], done[1]["id"]);
}

TEST_F(DispatcherTest, TracksLatency) {
    transport.setDefaultDelay(milliseconds(50));
    Dispatcher dispatcher(transport, store, options);

    dispatcher.request("GET", "/channels/1");
    EXPECT_GE(dispatcher.latency(), milliseconds(50));
}

TEST_F(DispatcherTest, StreamedBodyIsRewoundForRetry) {
    transport.push(makeResponse(500));
    Dispatcher dispatcher(transport, store, options);

    auto stream = std::make_shared<std::istringstream>("attachment bytes");
    dispatcher.request("POST", "/channels/1/messages", RequestBody::multipart(nullptr, { File("a.txt", stream) }));

    std::vector<MockTransport::Call> calls = transport.calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_NE(calls[0].body.find("attachment bytes"), std::string::npos);
    EXPECT_EQ(calls[0].body, calls[1].body);
}

TEST_F(DispatcherTest, NonSeekableStreamCannotBeRetried) {
    transport.push(makeResponse(500));
    Dispatcher dispatcher(transport, store, options);

    std::shared_ptr<std::istream> stream = std::make_shared<ForwardOnlyStream>("once");
    EXPECT_THROW(dispatcher.request("POST", "/channels/1/messages",
                                    RequestBody::multipart(nullptr, { File("a.txt", stream) })),
                 ProtocolError);
    EXPECT_EQ(transport.callCount(), 1u);
}

TEST_F(DispatcherTest, TransportFailureReleasesBucket) {
    options.maxInFlight = 1;
    transport.pushError("/channels/1/", ProtocolError("Attachment stream can't be replayed"));
    Dispatcher dispatcher(transport, store, options);

    EXPECT_THROW(dispatcher.request("POST", "/channels/1/messages"), ProtocolError);

    RequestOptions shortTimeout;
    shortTimeout.timeout = milliseconds(500);
    EXPECT_NO_THROW(dispatcher.request("POST", "/channels/1/messages", RequestBody(), shortTimeout));
    EXPECT_NO_THROW(dispatcher.request("POST", "/channels/2/messages", RequestBody(), shortTimeout));
    EXPECT_EQ(transport.callCount(), 3u);
}

TEST_F(DispatcherTest, ThrowingRequestHandlerReleasesBucket) {
    Dispatcher dispatcher(transport, store, options);

    auto thrown = std::make_shared<std::atomic<bool> >(false);
    dispatcher.events.addHandler(RestEvent::Request, [thrown](const nlohmann::json&) {
        if (!thrown->exchange(true)) throw std::runtime_error("handler failed");
    });

    EXPECT_THROW(dispatcher.request("GET", "/channels/1"), std::runtime_error);
    EXPECT_EQ(transport.callCount(), 0u);

    RequestOptions shortTimeout;
    shortTimeout.timeout = milliseconds(500);
    EXPECT_NO_THROW(dispatcher.request("GET", "/channels/1", RequestBody(), shortTimeout));
    EXPECT_EQ(transport.callCount(), 1u);
}

TEST_F(DispatcherTest, FinalFailuresEmitRequestError) {
    transport.push("/channels/1", jsonResponse(404, R"({"message": "Unknown Channel", "code": 10003})"));
    transport.push("/channels/2", jsonResponse(200, "{\"broken\":"));
    Dispatcher dispatcher(transport, store, options);

    std::vector<nlohmann::json> errors;
    dispatcher.events.addHandler(RestEvent::RequestError, [&errors](const nlohmann::json& payload) {
        errors.push_back(payload);
    });

    EXPECT_THROW(dispatcher.request("GET", "/channels/1"), ClientError);
    EXPECT_THROW(dispatcher.request("GET", "/channels/2"), ProtocolError);

    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0]["route"], "GET /channels/1");
    EXPECT_NE(errors[0]["error"].get<std::string>().find("Unknown Channel"), std::string::npos);
    EXPECT_EQ(errors[1]["route"], "GET /channels/2");
}

TEST_F(DispatcherTest, RetriedRequestStaysAheadOfLaterArrivals) {
    transport.push(makeResponse(500), milliseconds(100));
    Dispatcher dispatcher(transport, store, options);

    auto sent  = std::make_shared<std::promise<void> >();
    auto fired = std::make_shared<std::atomic<bool> >(false);
    dispatcher.events.addHandler(RestEvent::Request, [sent, fired](const nlohmann::json&) {
        if (!fired->exchange(true)) sent->set_value();
    });

    auto first = dispatcher.requestAsync("POST", "/channels/1/messages", RequestBody::structured({ { "n", 0 } }));
    ASSERT_EQ(sent->get_future().wait_for(std::chrono::seconds(5)), std::future_status::ready);

    // Submitted while first one is in flight and about to fail.
    auto second = dispatcher.requestAsync("POST", "/channels/1/messages", RequestBody::structured({ { "n", 1 } }));
    first.get();
    second.get();

    std::vector<MockTransport::Call> calls = transport.calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(nlohmann::json::parse(calls[0].body)["n"], 0);
    EXPECT_EQ(nlohmann::json::parse(calls[1].body)["n"], 0);
    EXPECT_EQ(nlohmann::json::parse(calls[2].body)["n"], 1);
}

} // namespace
} // namespace Ratecord
