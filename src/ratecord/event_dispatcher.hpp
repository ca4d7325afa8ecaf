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


#ifndef RATECORD_EVENT_DISPATCHER_HPP
#define RATECORD_EVENT_DISPATCHER_HPP 

#include <functional>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace Ratecord {
    enum class RestEvent {
        /// Request is about to be sent (every attempt).
        Request,

        /// Response received and request completed or will be retried.
        Done,

        /// Attempt failed with network error, or request failed for good
        /// (timeout, error response, unreadable response).
        RequestError,

        /// 429 received.
        RateLimit
    };

    struct RestEventHash {
        inline std::size_t operator()(RestEvent e) const {
            return static_cast<std::size_t>(e);
        }
    };

    /**
     * Handlers are called from threads performing requests, so they should
     * be thread-safe. Handlers should be added before requests are made.
     */
    class EventDispatcher {
    public:
        using EventHandler = std::function<void(const nlohmann::json&)>;

        void addHandler(RestEvent eventType, EventHandler handler);

        void dispatchEvent(RestEvent type, const nlohmann::json& payload) const;
    private:
        std::unordered_map<RestEvent, std::vector<EventHandler>, RestEventHash> handlers {
            { RestEvent::Request, {} },
            { RestEvent::Done, {} },
            { RestEvent::RequestError, {} },
            { RestEvent::RateLimit, {} }
        };
    };
} // namespace Ratecord

#endif // RATECORD_EVENT_DISPATCHER_HPP
