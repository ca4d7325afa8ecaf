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


#ifndef RATECORD_OPTIONS_HPP
#define RATECORD_OPTIONS_HPP

#include <chrono>
#include <string>
#include <boost/optional.hpp>
#include <ratecord/config.hpp>
#include <ratecord/route_key.hpp>
#include <ratecord/internal/rest.hpp>
#include <ratecord/internal/utils.hpp>

/**
 * \file options.hpp
 *
 * Run-time tunables of \ref Dispatcher and per-request options.
 */

namespace Ratecord {
    struct RetryOptions {
        /// Total attempts (first one included) for 5xx responses and network failures.
        unsigned maxAttempts = RATECORD_DEFAULT_RETRY_LIMIT;

        /// Delay before second attempt, doubled for every next one.
        std::chrono::milliseconds baseDelay = std::chrono::milliseconds(500);
        std::chrono::milliseconds maxDelay  = std::chrono::seconds(30);

        /// Upper bound of random delay added to every backoff.
        std::chrono::milliseconds maxJitter = std::chrono::milliseconds(250);

        /// Retry 5xx responses and network failures at all.
        bool retryFailed = true;

        /// Wait and retry on 429 instead of throwing RateLimitError.
        bool retryRateLimits = true;
        unsigned maxRateLimitRetries = 5;
    };

    struct DispatcherOptions {
        /// Prepended to every request path.
        std::string basePath = std::string("/api/v") + std::to_string(RATECORD_API_VERSION);

        /// Sent with every request (Authorization, User-Agent, ...).
        REST::HeadersMap headers;

        RetryOptions retry;

        /// Max requests in flight across all buckets, 0 for unlimited.
        unsigned maxInFlight = 0;

        /// Proactive global limit, 0 to rely on 429 responses only.
        unsigned globalRequestsPerSecond = 0;

        /// Don't serialize requests per bucket. Global limit is still honoured.
        bool bypassBuckets = false;

        /// Used for requests without own timeout.
        boost::optional<std::chrono::milliseconds> defaultTimeout;

        MajorParameterTable routes = MajorParameterTable::defaults();
    };

    struct RequestOptions {
        /// Parameters without value produce no query fragment.
        Utils::QueryParameters query;

        /// Audit log reason, sent as X-Audit-Log-Reason.
        boost::optional<std::string> reason;

        REST::HeadersMap headers;

        /// Deadline relative to submission time, covers queueing and retries.
        boost::optional<std::chrono::milliseconds> timeout;
    };
} // namespace Ratecord

#endif // RATECORD_OPTIONS_HPP
