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


#ifndef RATECORD_BUCKET_STORE_HPP
#define RATECORD_BUCKET_STORE_HPP

#include <chrono>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include <boost/optional.hpp>
#include <ratecord/internal/rest.hpp>

namespace Ratecord {
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    /**
     * Quota state of single bucket, as learned from responses.
     */
    struct Bucket {
        /// Max requests per window, none if not known yet.
        boost::optional<unsigned> limit;

        /// Requests left in current window, none if not known.
        boost::optional<unsigned> remaining;

        /// When window refreshes. Meaningful only if remaining is known.
        TimePoint resetAt;

        /// Requests holding bucket slot right now.
        unsigned inFlight = 0;

        /// X-RateLimit-Bucket value, empty until reported by server.
        std::string remoteId;

        TimePoint lastUsed;
    };

    /**
     * Quota spanning all buckets.
     */
    struct GlobalLimit {
        /// Set by 429 with global scope.
        TimePoint exhaustedUntil;

        /// 0 means no proactive limit.
        unsigned requestsPerSecond = 0;
        TimePoint windowStart;
        unsigned windowCount = 0;
    };

    struct BucketAvailability {
        bool available;

        /// When bucket becomes available by itself (quota reset), none if it
        /// waits for in-flight request instead.
        boost::optional<TimePoint> retryAt;
    };

    /**
     * Result of \ref BucketStore::update.
     */
    struct BucketUpdate {
        /// Key of bucket updated (after alias resolution).
        std::string key;

        /// Key request was resolved to before update, differs from
        /// key if reconciled is true.
        std::string previousKey;

        /// Local key was aliased to server-reported bucket.
        bool reconciled = false;

        /// Rate-limit headers were present but unparseable, bucket state reset to unknown.
        bool anomaly = false;
    };

    /**
     * Process-lifetime table of bucket states and global limit.
     *
     * Keys passed to store are route keys produced by \ref RouteKeyResolver,
     * store maps them to canonical bucket once server reports its bucket id
     * (X-RateLimit-Bucket). Methods are not synchronized, owner (Dispatcher)
     * serializes access.
     */
    class BucketStore {
    public:
        BucketStore() = default;
        BucketStore(const BucketStore&) = delete;
        BucketStore& operator=(const BucketStore&) = delete;

        /**
         * Follow reconciliation aliases, returns key itself if it has no alias.
         */
        std::string resolve(const std::string& key) const;

        Bucket& getOrCreate(const std::string& key);

        /// Returns nullptr if bucket doesn't exist.
        const Bucket* find(const std::string& key) const;

        /**
         * Parse rate-limit headers of response and store them.
         *
         * Absent headers leave bucket unchanged (route is not limited).
         * Bucket with reported X-RateLimit-Bucket is reconciled: key is
         * aliased to canonical id (bucket hash + major parameters), state of
         * local bucket merged into canonical one.
         */
        BucketUpdate update(const std::string& key,
                            const std::vector<std::string>& majorParameters,
                            const REST::HeadersMap& headers,
                            TimePoint now = Clock::now());

        /**
         * Availability check. Refills quota if reset time passed.
         */
        BucketAvailability availability(const std::string& key, TimePoint now = Clock::now());

        /**
         * True if remaining > 0 or remaining unknown, and nothing in flight.
         */
        bool isAvailable(const std::string& key, TimePoint now = Clock::now());

        /**
         * Take in-flight slot, decrement remaining if known.
         */
        void reserve(const std::string& key, TimePoint now = Clock::now());
        void release(const std::string& key);

        /**
         * Mark bucket exhausted until passed time (429 response).
         */
        void exhaust(const std::string& key, TimePoint until);

        void setGlobalRequestsPerSecond(unsigned limit);
        void exhaustGlobal(TimePoint until);

        /**
         * Time until which no bucket may dispatch, none if global limit
         * is not exhausted.
         */
        boost::optional<TimePoint> globalBlockedUntil(TimePoint now = Clock::now());

        /**
         * Count request in global per-second window.
         */
        void consumeGlobal(TimePoint now = Clock::now());

        const GlobalLimit& global() const { return globalLimit; }

        /**
         * Remove buckets with nothing in flight, no pending reset and not
         * reported as used by inUse. Aliases to removed buckets are removed too.
         *
         * \returns count of removed buckets.
         */
        std::size_t sweep(TimePoint now, const std::function<bool(const std::string&)>& inUse);

        std::size_t size() const { return buckets.size(); }

    private:
        void setUnknown(Bucket& bucket, TimePoint now);

        std::unordered_map<std::string, Bucket> buckets;
        std::unordered_map<std::string, std::string> aliases;
        GlobalLimit globalLimit;
    };
} // namespace Ratecord

#endif // RATECORD_BUCKET_STORE_HPP
