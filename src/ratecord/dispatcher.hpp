// Ratecord - rate limit aware Discord REST client for C++11 using boost libraries.
// Copyright © 2017 Maks Mazurov (fox.cpp) <foxcpp@yandex.ru>
// 
// Permission is hereby granted, free of charge, to any person obtaining
// a copy of this software and associated documentation files (the "Software"),
// to deal in the Software without restriction, including without limitation
// the rights to use, copy, modify, merge, publish, distribute, sublicense,
// and/or sell copies of the Software, and to permit persons to whom the
// Software is furnished to do so, subject to the following conditions:
// 
// The above copyright notice and this permission notice shall be included
// in all copies or substantial portions of the Software.
// 
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
// EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES
// OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT.
// IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM,
// DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT,
// TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE
// OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.


#ifndef RATECORD_DISPATCHER_HPP
#define RATECORD_DISPATCHER_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <future>
#include <mutex>
#include <string>
#include <boost/optional.hpp>
#include <nlohmann/json.hpp>
#include <ratecord/body_encoder.hpp>
#include <ratecord/bucket_store.hpp>
#include <ratecord/event_dispatcher.hpp>
#include <ratecord/options.hpp>
#include <ratecord/request_queue.hpp>
#include <ratecord/retry_policy.hpp>
#include <ratecord/route_key.hpp>
#include <ratecord/transport.hpp>

namespace Ratecord {
    /**
     * Rate-limit aware request dispatcher.
     *
     * Every request is put into FIFO queue of its bucket. Calling thread
     * blocks until request is head of the queue, bucket has quota, global
     * limit is not exhausted and backoff delay (if any) elapsed. Only one
     * request per bucket is in flight at time, requests for different
     * buckets are sent in parallel.
     *
     * 429 and 5xx responses and network failures are retried according to
     * \ref RetryOptions, retried request keeps its place at front of the
     * bucket queue.
     */
    class Dispatcher {
    public:
        /**
         * Transport and store must outlive dispatcher. Store should not be
         * shared between dispatchers.
         *
         * \throws InvalidParameter if options are invalid.
         */
        Dispatcher(Transport& transport, BucketStore& store, DispatcherOptions options = DispatcherOptions());

        Dispatcher(const Dispatcher&) = delete;
        Dispatcher& operator=(const Dispatcher&) = delete;

        /**
         * Send request and wait for result.
         *
         * \param method  one of GET, POST, PATCH, PUT, DELETE.
         * \param path    path relative to API base, like "/channels/123/messages".
         *
         * \returns parsed JSON response, null if response has no body, string
         *          if response is not JSON.
         *
         * \throws InvalidParameter if method or path is invalid.
         * \throws ClientError      on 4xx response (429 excluded).
         * \throws ServerError      on 5xx response once retries are exhausted.
         * \throws RateLimitError   on 429 if ratelimit retries are disabled or exhausted.
         * \throws NetworkError     on connection failure once retries are exhausted.
         * \throws TimeoutError     if request deadline expired.
         * \throws ProtocolError    if 2xx response contains invalid JSON.
         */
        nlohmann::json request(const std::string& method, const std::string& path,
                               const RequestBody& body = RequestBody(),
                               const RequestOptions& options = RequestOptions());

        /**
         * Same as \ref request, but returns immediately. Request is enqueued
         * before return, so order of requestAsync calls is preserved
         * within bucket.
         *
         * \throws InvalidParameter (synchronously) if method or path is invalid.
         */
        std::future<nlohmann::json> requestAsync(const std::string& method, const std::string& path,
                                                 const RequestBody& body = RequestBody(),
                                                 const RequestOptions& options = RequestOptions());

        /**
         * Duration of last completed network call.
         */
        std::chrono::milliseconds latency() const;

        /// Count of requests waiting for their turn.
        std::size_t queued() const;


        EventDispatcher events;

    private:
        PendingRequestPtr prepare(const std::string& method, const std::string& path,
                                  const RequestBody& body, const RequestOptions& options) const;
        void admit(const PendingRequestPtr& pending);

        nlohmann::json execute(const PendingRequestPtr& pending);

        /**
         * Block until request may be sent, take bucket slot.
         * Returns bucket key slot was taken in.
         */
        std::string waitForTurn(const PendingRequestPtr& pending);
        void waitUntil(std::unique_lock<std::mutex>& lock,
                       boost::optional<TimePoint> wakeAt,
                       boost::optional<TimePoint> deadline);

        /**
         * Release slot, store observed state, requeue if retryDelay is set.
         * Returns snapshot of bucket after update.
         */
        boost::optional<Bucket> completeAttempt(const std::string& key, const PendingRequestPtr& pending,
                                                const REST::HTTPResponse* response, Outcome outcome,
                                                std::chrono::milliseconds retryAfter,
                                                boost::optional<std::chrono::milliseconds> retryDelay);

        nlohmann::json decodeResponse(const PendingRequestPtr& pending, const REST::HTTPResponse& response) const;
        void throwRestError(const PendingRequestPtr& pending, const REST::HTTPResponse& response,
                            Outcome outcome, std::chrono::milliseconds retryAfter) const;

        nlohmann::json eventPayload(const PendingRequestPtr& pending) const;
        void notifyRequestError(const PendingRequestPtr& pending, const std::exception& error);

        Transport& transport;
        BucketStore& store;
        const DispatcherOptions dispatcherOptions;
        const RouteKeyResolver resolver;
        const RetryPolicy retryPolicy;

        mutable std::mutex mutex;
        std::condition_variable stateChanged;

        RequestQueue queue;
        uint64_t nextSequence = 0;
        unsigned inFlightTotal = 0;
        std::chrono::milliseconds lastLatency = std::chrono::milliseconds(0);
    };
} // namespace Ratecord

#endif // RATECORD_DISPATCHER_HPP
