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


#include <ratecord/bucket_store.hpp>

#include <algorithm>                                   // std::max
#include <boost/lexical_cast/try_lexical_convert.hpp> // boost::conversion::try_lexical_convert
#include <ratecord/config.hpp>
#include <ratecord/internal/utils.hpp>                 // Utils::secondsToMilliseconds

#if defined(RATECORD_DEBUG_LOG) && defined(RATECORD_DEBUG_BUCKETS)
    #include <iostream>
    #define DEBUG_MSG(msg) do { std::cerr << "bucket_store.cpp:" << __LINE__ << "\t" << (msg) << '\n'; } while (false)
#else
    #define DEBUG_MSG(msg)
#endif

namespace Ratecord {

namespace {
    boost::optional<unsigned> parseUnsigned(const std::string& text) {
        unsigned value;
        // lexical_cast happily wraps "-1" around.
        if (text.empty() || text.front() == '-' || !boost::conversion::try_lexical_convert(text, value)) {
            return boost::none;
        }
        return value;
    }

    boost::optional<double> parseSeconds(const std::string& text) {
        double value;
        if (!boost::conversion::try_lexical_convert(text, value) || !(value >= 0.0)) {
            return boost::none;
        }
        return value;
    }

    std::string optionalToString(const boost::optional<unsigned>& value) {
        return value ? std::to_string(*value) : std::string("?");
    }
}

std::string BucketStore::resolve(const std::string& key) const {
    std::string result = key;

    // Bounded by alias count so broken alias cycle can't hang us.
    for (std::size_t i = 0; i <= aliases.size(); ++i) {
        auto it = aliases.find(result);
        if (it == aliases.end()) break;
        result = it->second;
    }
    return result;
}

Bucket& BucketStore::getOrCreate(const std::string& key) {
    std::string resolved = resolve(key);

    auto it = buckets.find(resolved);
    if (it == buckets.end()) {
        DEBUG_MSG(std::string("New bucket: ") + resolved);
        it = buckets.emplace(resolved, Bucket()).first;
    }
    return it->second;
}

const Bucket* BucketStore::find(const std::string& key) const {
    auto it = buckets.find(resolve(key));
    return it != buckets.end() ? &it->second : nullptr;
}

void BucketStore::setUnknown(Bucket& bucket, TimePoint now) {
    bucket.limit     = boost::none;
    bucket.remaining = boost::none;
    bucket.resetAt   = now;
}

BucketUpdate BucketStore::update(const std::string& key,
                                 const std::vector<std::string>& majorParameters,
                                 const REST::HeadersMap& headers,
                                 TimePoint now) {
    BucketUpdate result;
    result.key = result.previousKey = resolve(key);

    auto limitIt      = headers.find("X-RateLimit-Limit");
    auto remainingIt  = headers.find("X-RateLimit-Remaining");
    auto resetAfterIt = headers.find("X-RateLimit-Reset-After");
    auto resetIt      = headers.find("X-RateLimit-Reset");
    auto bucketIt     = headers.find("X-RateLimit-Bucket");

    if (limitIt == headers.end() && remainingIt == headers.end() && resetAfterIt == headers.end() &&
        resetIt == headers.end() && bucketIt == headers.end()) {

        return result;
    }

    Bucket* bucket = &getOrCreate(result.key);
    bucket->lastUsed = now;

    if (bucketIt != headers.end() && !bucketIt->second.empty()) {
        std::string canonical = std::string("bucket:") + bucketIt->second;
        for (const auto& parameter : majorParameters) {
            canonical += ':';
            canonical += parameter;
        }

        if (canonical != result.key) {
            DEBUG_MSG(std::string("Reconciling bucket ") + result.key + " -> " + canonical);

            auto canonicalIt = buckets.find(canonical);
            if (canonicalIt == buckets.end()) {
                Bucket moved = *bucket;
                buckets.erase(result.key);
                bucket = &(buckets[canonical] = moved);
            } else {
                canonicalIt->second.inFlight += bucket->inFlight;
                buckets.erase(result.key);
                bucket = &canonicalIt->second;
            }

            aliases[key] = canonical;
            if (result.key != key) aliases[result.key] = canonical;

            result.key = canonical;
            result.reconciled = true;
        }
        bucket->remoteId = bucketIt->second;
    }

    bool anomaly = false;
    boost::optional<unsigned> limit, remaining;
    boost::optional<double> resetAfter;

    if (limitIt != headers.end()) {
        limit = parseUnsigned(limitIt->second);
        if (!limit) anomaly = true;
    }
    if (remainingIt != headers.end()) {
        remaining = parseUnsigned(remainingIt->second);
        if (!remaining) anomaly = true;
    }
    if (resetAfterIt != headers.end()) {
        resetAfter = parseSeconds(resetAfterIt->second);
        if (!resetAfter) anomaly = true;
    } else if (resetIt != headers.end()) {
        boost::optional<double> resetEpoch = parseSeconds(resetIt->second);
        if (resetEpoch) {
            double nowEpoch = std::chrono::duration<double>(
                std::chrono::system_clock::now().time_since_epoch()).count();
            resetAfter = std::max(0.0, *resetEpoch - nowEpoch);
        } else {
            anomaly = true;
        }
    }

    // Remaining count is useless without knowing when it resets.
    if (remaining && !resetAfter) anomaly = true;

    if (anomaly) {
        DEBUG_MSG(std::string("Unparseable ratelimit headers for bucket ") + result.key + ", state reset to unknown");
        setUnknown(*bucket, now);
        result.anomaly = true;
        return result;
    }

    if (limit) bucket->limit = limit;
    if (remaining) bucket->remaining = remaining;
    if (resetAfter) {
        bucket->resetAt = now + Utils::secondsToMilliseconds(*resetAfter);
    }

    DEBUG_MSG(std::string("Bucket ") + result.key +
              ": limit=" + optionalToString(bucket->limit) +
              ", remaining=" + optionalToString(bucket->remaining) +
              (resetAfter ? ", resetAfter=" + std::to_string(*resetAfter) : std::string()));

    return result;
}

BucketAvailability BucketStore::availability(const std::string& key, TimePoint now) {
    auto it = buckets.find(resolve(key));
    if (it == buckets.end()) return { true, boost::none };

    Bucket& bucket = it->second;
    if (bucket.remaining && *bucket.remaining == 0 && bucket.resetAt <= now) {
        DEBUG_MSG(std::string("Quota of bucket ") + it->first + " refreshed");
        bucket.remaining = bucket.limit;
    }

    if (bucket.inFlight > 0) return { false, boost::none };
    if (bucket.remaining && *bucket.remaining == 0) return { false, bucket.resetAt };
    return { true, boost::none };
}

bool BucketStore::isAvailable(const std::string& key, TimePoint now) {
    return availability(key, now).available;
}

void BucketStore::reserve(const std::string& key, TimePoint now) {
    Bucket& bucket = getOrCreate(key);

    ++bucket.inFlight;
    bucket.lastUsed = now;
    if (bucket.remaining && *bucket.remaining > 0) {
        bucket.remaining = *bucket.remaining - 1;
    }
}

void BucketStore::release(const std::string& key) {
    auto it = buckets.find(resolve(key));
    if (it != buckets.end() && it->second.inFlight > 0) {
        --it->second.inFlight;
    }
}

void BucketStore::exhaust(const std::string& key, TimePoint until) {
    Bucket& bucket = getOrCreate(key);

    DEBUG_MSG(std::string("Bucket ") + resolve(key) + " exhausted");
    bucket.remaining = 0u;
    bucket.resetAt   = until;
}

void BucketStore::setGlobalRequestsPerSecond(unsigned limit) {
    globalLimit.requestsPerSecond = limit;
}

void BucketStore::exhaustGlobal(TimePoint until) {
    DEBUG_MSG("Global ratelimit exhausted");
    if (until > globalLimit.exhaustedUntil) {
        globalLimit.exhaustedUntil = until;
    }
}

boost::optional<TimePoint> BucketStore::globalBlockedUntil(TimePoint now) {
    if (globalLimit.exhaustedUntil > now) return globalLimit.exhaustedUntil;

    if (globalLimit.requestsPerSecond != 0) {
        if (now - globalLimit.windowStart >= std::chrono::seconds(1)) {
            globalLimit.windowStart = now;
            globalLimit.windowCount = 0;
        }
        if (globalLimit.windowCount >= globalLimit.requestsPerSecond) {
            return globalLimit.windowStart + std::chrono::seconds(1);
        }
    }
    return boost::none;
}

void BucketStore::consumeGlobal(TimePoint now) {
    if (globalLimit.requestsPerSecond == 0) return;

    if (now - globalLimit.windowStart >= std::chrono::seconds(1)) {
        globalLimit.windowStart = now;
        globalLimit.windowCount = 0;
    }
    ++globalLimit.windowCount;
}

std::size_t BucketStore::sweep(TimePoint now, const std::function<bool(const std::string&)>& inUse) {
    std::size_t removed = 0;

    for (auto it = buckets.begin(); it != buckets.end();) {
        const Bucket& bucket = it->second;
        bool waitingReset = bucket.remaining && *bucket.remaining == 0 && bucket.resetAt > now;

        if (bucket.inFlight == 0 && !waitingReset && !inUse(it->first)) {
            it = buckets.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    std::vector<std::string> danglingAliases;
    for (const auto& alias : aliases) {
        if (buckets.find(resolve(alias.first)) == buckets.end()) {
            danglingAliases.push_back(alias.first);
        }
    }
    for (const auto& alias : danglingAliases) {
        aliases.erase(alias);
    }

    DEBUG_MSG(std::string("Swept ") + std::to_string(removed) + " idle buckets, " +
              std::to_string(buckets.size()) + " left");
    return removed;
}

} // namespace Ratecord
