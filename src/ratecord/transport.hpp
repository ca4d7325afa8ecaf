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


#ifndef RATECORD_TRANSPORT_HPP
#define RATECORD_TRANSPORT_HPP

#include <boost/optional.hpp>
#include <ratecord/internal/rest.hpp>

namespace Ratecord {
    /**
     * Performs single HTTP call. Implementations must be safe to call from
     * multiple threads simultaneously.
     */
    class Transport {
    public:
        virtual ~Transport() = default;

        /**
         * \param deadline if set, call is aborted once it expires.
         *
         * \throws TimeoutError  if deadline expired.
         * \throws NetworkError  on any connection failure.
         */
        virtual REST::HTTPResponse perform(const REST::HTTPRequest& request,
                                           boost::optional<REST::TimePoint> deadline) = 0;
    };
} // namespace Ratecord

#endif // RATECORD_TRANSPORT_HPP
