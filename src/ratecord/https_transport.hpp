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


#ifndef RATECORD_HTTPS_TRANSPORT_HPP
#define RATECORD_HTTPS_TRANSPORT_HPP

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <ratecord/transport.hpp>
#include <ratecord/internal/rest.hpp>

namespace Ratecord {
    /**
     * Transport over HTTPS keep-alive connections.
     *
     * Connections are taken from pool for duration of single call, so
     * concurrent calls use different connections. Connection closed by
     * server while idle in pool is reopened and request repeated once.
     */
    class HTTPSTransport : public Transport {
    public:
        explicit HTTPSTransport(const std::string& serverName = "discord.com",
                                unsigned short port = 443,
                                unsigned maxIdleConnections = 8);

        REST::HTTPResponse perform(const REST::HTTPRequest& request,
                                   boost::optional<REST::TimePoint> deadline) override;

        const std::string serverName;
        const unsigned short port;

    private:
        using ConnectionPtr = std::unique_ptr<REST::HTTPSConnection>;

        ConnectionPtr acquire(boost::optional<REST::TimePoint> deadline, bool& reused);
        void giveBack(ConnectionPtr connection);

        REST::HTTPResponse performOnce(const REST::HTTPRequest& request,
                                       boost::optional<REST::TimePoint> deadline);

        const unsigned maxIdleConnections;

        std::mutex poolMutex;
        std::vector<ConnectionPtr> idleConnections;
    };
} // namespace Ratecord

#endif // RATECORD_HTTPS_TRANSPORT_HPP
