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


#ifndef RATECORD_REQUEST_QUEUE_HPP
#define RATECORD_REQUEST_QUEUE_HPP

#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <boost/optional.hpp>
#include <ratecord/bucket_store.hpp>
#include <ratecord/internal/rest.hpp>

namespace Ratecord {
    enum class RequestState {
        Queued,
        WaitingForCapacity,
        InFlight,
        Retrying,
        Succeeded,
        Failed
    };

    const char* toString(RequestState state);

    /**
     * Request descriptor. Owned by caller task, referenced by queue while
     * waiting for its turn.
     */
    struct PendingRequest {
        /// Submission order, assigned at enqueue.
        uint64_t sequence = 0;

        RequestState state = RequestState::Queued;

        /// Network calls made so far.
        unsigned attempt = 0;

        /// 429 responses received so far.
        unsigned rateLimitHits = 0;

        std::string routeKey;
        std::vector<std::string> majorParameters;

        REST::HTTPRequest request;

        boost::optional<TimePoint> deadline;

        /// Backoff, request is not dispatched before this point.
        TimePoint notBefore;
    };

    using PendingRequestPtr = std::shared_ptr<PendingRequest>;

    /**
     * Per-bucket FIFO lists of pending requests.
     */
    class RequestQueue {
    public:
        void enqueue(const std::string& bucketKey, PendingRequestPtr request);

        /**
         * Put retried request back, ahead of every request submitted after it.
         */
        void requeueFront(const std::string& bucketKey, PendingRequestPtr request);

        /// Returns nullptr if queue is empty.
        PendingRequestPtr front(const std::string& bucketKey) const;

        /**
         * Pop head of queue if bucket is available and head's backoff
         * elapsed, nullptr otherwise. Never reorders.
         */
        PendingRequestPtr dequeueNextReady(const std::string& bucketKey, BucketStore& store, TimePoint now);

        /**
         * Remove request (deadline expired). Returns false if it is not queued.
         */
        bool remove(const std::string& bucketKey, const PendingRequestPtr& request);

        /**
         * Move requests queued under `from` to `to` (after bucket
         * reconciliation), keeping submission order.
         */
        void reconcile(const std::string& from, const std::string& to);

        bool contains(const std::string& bucketKey) const;
        std::size_t size(const std::string& bucketKey) const;
        std::size_t size() const;
        bool empty() const { return queues.empty(); }

    private:
        std::unordered_map<std::string, std::deque<PendingRequestPtr> > queues;
    };
} // namespace Ratecord

#endif // RATECORD_REQUEST_QUEUE_HPP
