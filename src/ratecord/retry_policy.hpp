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


#ifndef RATECORD_RETRY_POLICY_HPP
#define RATECORD_RETRY_POLICY_HPP

#include <chrono>
#include <mutex>
#include <random>
#include <ratecord/options.hpp>
#include <ratecord/internal/rest.hpp>

namespace Ratecord {
    enum class Outcome {
        Success,
        RateLimitedBucket,
        RateLimitedGlobal,
        ServerError,
        NetworkError,
        ClientError
    };

    const char* toString(Outcome outcome);

    struct RetryDecision {
        bool retry;
        std::chrono::milliseconds delay;
    };

    /**
     * Classifies request outcomes and decides whether and when to retry.
     *
     * | Outcome            | Action                                            |
     * |--------------------|---------------------------------------------------|
     * | 2xx, 304           | success                                           |
     * | 429                | retry after server-provided delay                 |
     * | 5xx, network error | retry with exponential backoff and jitter         |
     * | other 4xx          | fail immediately                                  |
     */
    class RetryPolicy {
    public:
        /**
         * \throws InvalidParameter if maxAttempts is 0 or baseDelay > maxDelay.
         */
        explicit RetryPolicy(RetryOptions options = RetryOptions());

        static Outcome classify(const REST::HTTPResponse& response);

        /**
         * Delay requested by 429 response. Retry-After header is preferred,
         * then retry_after field of JSON body, then X-RateLimit-Reset-After.
         * 1 second if response specifies nothing usable.
         */
        static std::chrono::milliseconds retryAfter(const REST::HTTPResponse& response);

        /**
         * min(baseDelay * 2^(attempt - 1), maxDelay) + random jitter.
         * Attempt is count of attempts already made (1 after first failure).
         */
        std::chrono::milliseconds backoff(unsigned attempt) const;

        /**
         * \param attempt        network calls made, including failed one.
         * \param rateLimitHits  429 responses received, including this one.
         */
        RetryDecision decide(Outcome outcome, unsigned attempt, unsigned rateLimitHits,
                             std::chrono::milliseconds retryAfter = std::chrono::milliseconds(0)) const;

    private:
        RetryOptions retryOptions;

        mutable std::mutex randomMutex;
        mutable std::mt19937 random;
    };
} // namespace Ratecord

#endif // RATECORD_RETRY_POLICY_HPP
