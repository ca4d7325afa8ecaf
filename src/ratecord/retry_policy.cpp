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


#include <ratecord/retry_policy.hpp>

#include <algorithm>
#include <boost/lexical_cast/try_lexical_convert.hpp> // boost::conversion::try_lexical_convert
#include <nlohmann/json.hpp>
#include <ratecord/exceptions.hpp>
#include <ratecord/internal/utils.hpp>

namespace Ratecord {

namespace {
    boost::optional<std::chrono::milliseconds> secondsHeader(const REST::HeadersMap& headers, const std::string& name) {
        auto it = headers.find(name);
        if (it == headers.end()) return boost::none;

        double seconds;
        if (!boost::conversion::try_lexical_convert(it->second, seconds) || !(seconds >= 0.0)) {
            return boost::none;
        }
        return Utils::secondsToMilliseconds(seconds);
    }

    nlohmann::json parseBody(const REST::HTTPResponse& response) {
        return nlohmann::json::parse(response.body.begin(), response.body.end(), nullptr, false);
    }
}

const char* toString(Outcome outcome) {
    switch (outcome) {
    case Outcome::Success:           return "Success";
    case Outcome::RateLimitedBucket: return "RateLimitedBucket";
    case Outcome::RateLimitedGlobal: return "RateLimitedGlobal";
    case Outcome::ServerError:       return "ServerError";
    case Outcome::NetworkError:      return "NetworkError";
    case Outcome::ClientError:       return "ClientError";
    }
    return "Unknown";
}

RetryPolicy::RetryPolicy(RetryOptions options)
    : retryOptions(options)
    , random(std::random_device()()) {

    if (retryOptions.maxAttempts == 0) {
        throw InvalidParameter("maxAttempts", "at least one attempt required");
    }
    if (retryOptions.baseDelay > retryOptions.maxDelay) {
        throw InvalidParameter("baseDelay", "can't be bigger than maxDelay");
    }
}

Outcome RetryPolicy::classify(const REST::HTTPResponse& response) {
    unsigned status = response.statusCode;

    if ((status >= 200 && status < 300) || status == 304) return Outcome::Success;
    if (status >= 500) return Outcome::ServerError;
    if (status != 429) return Outcome::ClientError;

    auto globalIt = response.headers.find("X-RateLimit-Global");
    if (globalIt != response.headers.end() && Utils::stringToLower(globalIt->second) == "true") {
        return Outcome::RateLimitedGlobal;
    }

    auto scopeIt = response.headers.find("X-RateLimit-Scope");
    if (scopeIt != response.headers.end()) {
        // "shared" buckets are limited like per-route ones.
        return Utils::stringToLower(scopeIt->second) == "global" ? Outcome::RateLimitedGlobal
                                                                  : Outcome::RateLimitedBucket;
    }

    nlohmann::json body = parseBody(response);
    if (body.is_object() && body.value("global", false) == true) {
        return Outcome::RateLimitedGlobal;
    }
    return Outcome::RateLimitedBucket;
}

std::chrono::milliseconds RetryPolicy::retryAfter(const REST::HTTPResponse& response) {
    boost::optional<std::chrono::milliseconds> header = secondsHeader(response.headers, "Retry-After");
    if (header) return *header;

    nlohmann::json body = parseBody(response);
    if (body.is_object() && body.count("retry_after") && body["retry_after"].is_number()) {
        double seconds = body["retry_after"].get<double>();
        if (seconds >= 0.0) return Utils::secondsToMilliseconds(seconds);
    }

    header = secondsHeader(response.headers, "X-RateLimit-Reset-After");
    if (header) return *header;

    return std::chrono::seconds(1);
}

std::chrono::milliseconds RetryPolicy::backoff(unsigned attempt) const {
    std::chrono::milliseconds delay = retryOptions.baseDelay;
    for (unsigned i = 1; i < attempt && delay < retryOptions.maxDelay; ++i) {
        delay *= 2;
    }
    delay = std::min(delay, retryOptions.maxDelay);

    if (retryOptions.maxJitter.count() > 0) {
        std::lock_guard<std::mutex> lock(randomMutex);
        std::uniform_int_distribution<long long> jitter(0, retryOptions.maxJitter.count());
        delay += std::chrono::milliseconds(jitter(random));
    }
    return delay;
}

RetryDecision RetryPolicy::decide(Outcome outcome, unsigned attempt, unsigned rateLimitHits,
                                  std::chrono::milliseconds retryAfter) const {
    switch (outcome) {
    case Outcome::RateLimitedBucket:
    case Outcome::RateLimitedGlobal:
        if (retryOptions.retryRateLimits && rateLimitHits <= retryOptions.maxRateLimitRetries) {
            return { true, retryAfter };
        }
        break;
    case Outcome::ServerError:
    case Outcome::NetworkError:
        if (retryOptions.retryFailed && attempt < retryOptions.maxAttempts) {
            return { true, backoff(attempt) };
        }
        break;
    case Outcome::Success:
    case Outcome::ClientError:
        break;
    }
    return { false, std::chrono::milliseconds(0) };
}

} // namespace Ratecord
