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


#include <ratecord/dispatcher.hpp>

#include <set>
#include <ratecord/config.hpp>
#include <ratecord/exceptions.hpp>
#include <ratecord/internal/utils.hpp>

#if defined(RATECORD_DEBUG_LOG) && defined(RATECORD_DEBUG_DISPATCHER)
    #include <iostream>
    #define DEBUG_MSG(msg) do { std::cerr << "dispatcher.cpp:" << __LINE__ << "\t" << (msg) << '\n'; } while (false)
#else
    #define DEBUG_MSG(msg)
#endif

namespace Ratecord {

static const std::set<std::string> allowedMethods = { "GET", "POST", "PATCH", "PUT", "DELETE" };

Dispatcher::Dispatcher(Transport& transport, BucketStore& store, DispatcherOptions options)
    : transport(transport)
    , store(store)
    , dispatcherOptions(std::move(options))
    , resolver(dispatcherOptions.routes)
    , retryPolicy(dispatcherOptions.retry) {

    store.setGlobalRequestsPerSecond(dispatcherOptions.globalRequestsPerSecond);
}

nlohmann::json Dispatcher::request(const std::string& method, const std::string& path,
                                   const RequestBody& body, const RequestOptions& options) {

    PendingRequestPtr pending = prepare(method, path, body, options);
    admit(pending);
    return execute(pending);
}

std::future<nlohmann::json> Dispatcher::requestAsync(const std::string& method, const std::string& path,
                                                     const RequestBody& body, const RequestOptions& options) {

    PendingRequestPtr pending = prepare(method, path, body, options);
    admit(pending);
    return std::async(std::launch::async, [this, pending]() {
        return execute(pending);
    });
}

std::chrono::milliseconds Dispatcher::latency() const {
    std::lock_guard<std::mutex> lock(mutex);
    return lastLatency;
}

std::size_t Dispatcher::queued() const {
    std::lock_guard<std::mutex> lock(mutex);
    return queue.size();
}

PendingRequestPtr Dispatcher::prepare(const std::string& method, const std::string& path,
                                      const RequestBody& body, const RequestOptions& options) const {

    if (allowedMethods.find(method) == allowedMethods.end()) {
        throw InvalidParameter("method", std::string("unsupported HTTP method: ") + method);
    }
    if (path.empty() || path.front() != '/') {
        throw InvalidParameter("path", "should start with '/'");
    }

    PendingRequestPtr pending = std::make_shared<PendingRequest>();

    ResolvedRoute route = resolver.resolve(method, path);
    pending->routeKey        = std::move(route.key);
    pending->majorParameters = std::move(route.majorParameters);

    std::string query = Utils::makeQueryString(options.query);
    if (!query.empty() && path.find('?') != std::string::npos) query.front() = '&';

    REST::HTTPRequest& request = pending->request;
    request.method = method;
    request.path   = dispatcherOptions.basePath + path + query;

    request.headers = dispatcherOptions.headers;
    request.headers["Accept"] = "application/json";
    for (const auto& header : options.headers) {
        request.headers[header.first] = header.second;
    }
    if (options.reason) {
        request.headers["X-Audit-Log-Reason"] = Utils::urlEncode(*options.reason);
    }

    // Discord rejects GET requests with body.
    if (method != "GET") {
        request.body = encodeBody(body);
    }

    boost::optional<std::chrono::milliseconds> timeout = options.timeout ? options.timeout
                                                                         : dispatcherOptions.defaultTimeout;
    if (timeout) {
        pending->deadline = Clock::now() + *timeout;
    }

    return pending;
}

void Dispatcher::admit(const PendingRequestPtr& pending) {
    std::lock_guard<std::mutex> lock(mutex);

    pending->sequence = nextSequence++;

    if (store.size() > RATECORD_BUCKET_CACHE_SIZE) {
        store.sweep(Clock::now(), [this](const std::string& key) { return queue.contains(key); });
    }

    if (!dispatcherOptions.bypassBuckets) {
        queue.enqueue(store.resolve(pending->routeKey), pending);
    }
    DEBUG_MSG(std::string("Request #") + std::to_string(pending->sequence) + " queued: " + pending->routeKey);
}

void Dispatcher::waitUntil(std::unique_lock<std::mutex>& lock,
                           boost::optional<TimePoint> wakeAt,
                           boost::optional<TimePoint> deadline) {

    if (deadline && (!wakeAt || *deadline < *wakeAt)) wakeAt = deadline;

    if (wakeAt) {
        stateChanged.wait_until(lock, *wakeAt);
    } else {
        stateChanged.wait(lock);
    }
}

std::string Dispatcher::waitForTurn(const PendingRequestPtr& pending) {
    std::unique_lock<std::mutex> lock(mutex);
    const bool bypass = dispatcherOptions.bypassBuckets;

    while (true) {
        TimePoint now = Clock::now();
        std::string key = store.resolve(pending->routeKey);

        if (pending->deadline && now >= *pending->deadline) {
            if (!bypass) queue.remove(key, pending);
            pending->state = RequestState::Failed;
            stateChanged.notify_all();

            DEBUG_MSG(std::string("Request #") + std::to_string(pending->sequence) + " timed out while waiting");
            throw TimeoutError(pending->request.method, pending->request.path, pending->attempt);
        }

        if (!bypass && queue.front(key) != pending) {
            waitUntil(lock, boost::none, pending->deadline);
            continue;
        }
        pending->state = RequestState::WaitingForCapacity;

        boost::optional<TimePoint> globalBlock = store.globalBlockedUntil(now);
        if (globalBlock) {
            waitUntil(lock, globalBlock, pending->deadline);
            continue;
        }

        if (pending->notBefore > now) {
            waitUntil(lock, pending->notBefore, pending->deadline);
            continue;
        }

        if (!bypass) {
            BucketAvailability availability = store.availability(key, now);
            if (!availability.available) {
                waitUntil(lock, availability.retryAt, pending->deadline);
                continue;
            }
        }

        if (dispatcherOptions.maxInFlight != 0 && inFlightTotal >= dispatcherOptions.maxInFlight) {
            waitUntil(lock, boost::none, pending->deadline);
            continue;
        }

        if (!bypass) {
            // Head is this request and bucket is available, so nothing else can be popped here.
            if (queue.dequeueNextReady(key, store, now) != pending) {
                waitUntil(lock, store.availability(key, now).retryAt, pending->deadline);
                continue;
            }
            store.reserve(key, now);
        }
        store.consumeGlobal(now);
        ++inFlightTotal;
        pending->state = RequestState::InFlight;

        return key;
    }
}

boost::optional<Bucket> Dispatcher::completeAttempt(const std::string& key, const PendingRequestPtr& pending,
                                                    const REST::HTTPResponse* response, Outcome outcome,
                                                    std::chrono::milliseconds retryAfter,
                                                    boost::optional<std::chrono::milliseconds> retryDelay) {
    std::lock_guard<std::mutex> lock(mutex);
    TimePoint now = Clock::now();

    --inFlightTotal;
    if (!dispatcherOptions.bypassBuckets) store.release(key);

    if (response) {
        BucketUpdate update = store.update(pending->routeKey, pending->majorParameters, response->headers, now);
        if (update.reconciled) {
            DEBUG_MSG(std::string("Bucket ") + update.previousKey + " reconciled to " + update.key);
            queue.reconcile(update.previousKey, update.key);
        }
        if (update.anomaly) {
            DEBUG_MSG(std::string("Ratelimit headers anomaly on ") + pending->routeKey);
        }
    }

    if (outcome == Outcome::RateLimitedBucket) {
        store.exhaust(pending->routeKey, now + retryAfter);
    } else if (outcome == Outcome::RateLimitedGlobal) {
        DEBUG_MSG(std::string("Global ratelimit hit, all buckets paused for ") + std::to_string(retryAfter.count()) + "ms");
        store.exhaustGlobal(now + retryAfter);
    }

    if (retryDelay) {
        DEBUG_MSG(std::string("Request #") + std::to_string(pending->sequence) + " (" + toString(outcome) +
                  ") will be retried in " + std::to_string(retryDelay->count()) + "ms");

        pending->state     = RequestState::Retrying;
        pending->notBefore = now + *retryDelay;
        if (!dispatcherOptions.bypassBuckets) {
            queue.requeueFront(store.resolve(pending->routeKey), pending);
        }
    } else {
        pending->state = outcome == Outcome::Success ? RequestState::Succeeded : RequestState::Failed;
    }

    stateChanged.notify_all();

    const Bucket* bucket = store.find(pending->routeKey);
    return bucket ? boost::optional<Bucket>(*bucket) : boost::none;
}

nlohmann::json Dispatcher::execute(const PendingRequestPtr& pending) {
    const std::string& method = pending->request.method;
    const std::string& path   = pending->request.path;

    while (true) {
        std::string key;
        try {
            key = waitForTurn(pending);
        } catch (const TimeoutError& excp) {
            notifyRequestError(pending, excp);
            throw;
        }

        // Bucket slot is held from here until completeAttempt, every exit must go through it.
        ++pending->attempt;
        DEBUG_MSG(std::string("Sending request #") + std::to_string(pending->sequence) + ": " + method + " " + path +
                  ", attempt " + std::to_string(pending->attempt));

        REST::HTTPResponse response;
        TimePoint started = Clock::now();
        try {
            events.dispatchEvent(RestEvent::Request, eventPayload(pending));

            started  = Clock::now();
            response = transport.perform(pending->request, pending->deadline);
        } catch (const TimeoutError& excp) {
            completeAttempt(key, pending, nullptr, Outcome::NetworkError, std::chrono::milliseconds(0), boost::none);
            notifyRequestError(pending, excp);

            throw TimeoutError(method, path, pending->attempt);
        } catch (const NetworkError& excp) {
            RetryDecision decision = retryPolicy.decide(Outcome::NetworkError,
                                                        pending->attempt - pending->rateLimitHits,
                                                        pending->rateLimitHits);
            if (decision.retry) {
                try {
                    pending->request.body.rewind();
                } catch (const ProtocolError& rewindError) {
                    completeAttempt(key, pending, nullptr, Outcome::NetworkError, std::chrono::milliseconds(0), boost::none);
                    notifyRequestError(pending, rewindError);
                    throw;
                }
            }

            completeAttempt(key, pending, nullptr, Outcome::NetworkError, std::chrono::milliseconds(0),
                            decision.retry ? boost::optional<std::chrono::milliseconds>(decision.delay) : boost::none);
            notifyRequestError(pending, excp);

            if (decision.retry) continue;
            throw NetworkError(std::string("Request failed (") + method + " " + path + ")", excp.cause, pending->attempt);
        } catch (const std::exception& excp) {
            // Transport can't replay body, or event handler failed.
            completeAttempt(key, pending, nullptr, Outcome::NetworkError, std::chrono::milliseconds(0), boost::none);
            notifyRequestError(pending, excp);
            throw;
        } catch (...) {
            completeAttempt(key, pending, nullptr, Outcome::NetworkError, std::chrono::milliseconds(0), boost::none);
            throw;
        }

        {
            std::lock_guard<std::mutex> lock(mutex);
            lastLatency = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
        }

        Outcome outcome = RetryPolicy::classify(response);
        bool rateLimited = outcome == Outcome::RateLimitedBucket || outcome == Outcome::RateLimitedGlobal;

        std::chrono::milliseconds retryAfter(0);
        if (rateLimited) {
            ++pending->rateLimitHits;
            retryAfter = RetryPolicy::retryAfter(response);
        }

        RetryDecision decision = retryPolicy.decide(outcome,
                                                    pending->attempt - pending->rateLimitHits,
                                                    pending->rateLimitHits,
                                                    retryAfter);
        if (decision.retry) {
            try {
                pending->request.body.rewind();
            } catch (const ProtocolError& excp) {
                completeAttempt(key, pending, &response, outcome, retryAfter, boost::none);
                notifyRequestError(pending, excp);
                throw;
            }
        }

        boost::optional<Bucket> bucket = completeAttempt(key, pending, &response, outcome, retryAfter,
            decision.retry ? boost::optional<std::chrono::milliseconds>(decision.delay) : boost::none);

        nlohmann::json payload = eventPayload(pending);
        payload["status"] = response.statusCode;
        if (rateLimited) {
            DEBUG_MSG(std::string("Ratelimit hit: ") + method + " " + path + ", retry after " +
                      std::to_string(retryAfter.count()) + "ms");

            nlohmann::json rateLimitPayload = payload;
            rateLimitPayload["retry_after_ms"] = retryAfter.count();
            rateLimitPayload["global"]         = outcome == Outcome::RateLimitedGlobal;
            rateLimitPayload["remaining"]      = nullptr;
            rateLimitPayload["limit"]          = nullptr;
            if (bucket && bucket->remaining) rateLimitPayload["remaining"] = *bucket->remaining;
            if (bucket && bucket->limit)     rateLimitPayload["limit"]     = *bucket->limit;
            events.dispatchEvent(RestEvent::RateLimit, rateLimitPayload);
        }
        events.dispatchEvent(RestEvent::Done, payload);

        if (decision.retry) continue;

        try {
            if (outcome == Outcome::Success) {
                return decodeResponse(pending, response);
            }
            throwRestError(pending, response, outcome, retryAfter);
        } catch (const RuntimeError& excp) {
            notifyRequestError(pending, excp);
            throw;
        }
    }
}

void Dispatcher::notifyRequestError(const PendingRequestPtr& pending, const std::exception& error) {
    nlohmann::json payload = eventPayload(pending);
    payload["error"] = error.what();
    events.dispatchEvent(RestEvent::RequestError, payload);
}

nlohmann::json Dispatcher::decodeResponse(const PendingRequestPtr& pending, const REST::HTTPResponse& response) const {
    if (response.body.empty()) return nullptr;

    auto contentTypeIt = response.headers.find("Content-Type");
    bool isJson = contentTypeIt != response.headers.end() &&
                  Utils::stringToLower(contentTypeIt->second).find("json") != std::string::npos;
    if (!isJson) {
        return std::string(response.body.begin(), response.body.end());
    }

    nlohmann::json result = nlohmann::json::parse(response.body.begin(), response.body.end(), nullptr, false);
    if (result.is_discarded()) {
        throw ProtocolError(std::string("Invalid JSON in response to ") + pending->request.method + " " +
                            pending->request.path);
    }
    return result;
}

void Dispatcher::throwRestError(const PendingRequestPtr& pending, const REST::HTTPResponse& response,
                                Outcome outcome, std::chrono::milliseconds retryAfter) const {

    const std::string& method = pending->request.method;
    const std::string& path   = pending->request.path;
    std::string body(response.body.begin(), response.body.end());

    int apiCode = -1;
    std::string message = std::string("HTTP ") + std::to_string(response.statusCode);

    nlohmann::json payload = nlohmann::json::parse(body, nullptr, false);
    if (payload.is_object()) {
        if (payload.count("code") && payload["code"].is_number_integer()) apiCode = payload["code"].get<int>();
        if (payload.count("message") && payload["message"].is_string()) message = payload["message"].get<std::string>();
    }

    DEBUG_MSG(std::string("Request failed: ") + method + " " + path + ", " + message);

    switch (outcome) {
    case Outcome::RateLimitedBucket:
    case Outcome::RateLimitedGlobal:
        throw RateLimitError(method, path, body, pending->attempt, retryAfter, outcome == Outcome::RateLimitedGlobal);
    case Outcome::ServerError:
        throw ServerError(message, apiCode, response.statusCode, method, path, body, pending->attempt);
    default:
        throw ClientError(message, apiCode, response.statusCode, method, path, body, pending->attempt);
    }
}

nlohmann::json Dispatcher::eventPayload(const PendingRequestPtr& pending) const {
    return {
        { "id",      pending->sequence        },
        { "method",  pending->request.method  },
        { "path",    pending->request.path    },
        { "route",   pending->routeKey        },
        { "attempt", pending->attempt         }
    };
}

} // namespace Ratecord
