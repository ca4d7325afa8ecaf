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


#include <ratecord/https_transport.hpp>

#include <boost/asio/error.hpp>           // boost::asio::error::*
#include <boost/beast/core/error.hpp>     // boost::beast::error::timeout
#include <boost/beast/http/error.hpp>     // boost::beast::http::error::end_of_stream
#include <ratecord/config.hpp>
#include <ratecord/exceptions.hpp>

#if defined(RATECORD_DEBUG_LOG) && defined(RATECORD_DEBUG_TRANSPORT)
    #include <iostream>
    #define DEBUG_MSG(msg) do { std::cerr << "https_transport.cpp:" << __LINE__ << "\t" << (msg) << '\n'; } while (false)
#else
    #define DEBUG_MSG(msg)
#endif

namespace Ratecord {

namespace {
    bool closedByRemote(const boost::system::error_code& code) {
        return code == boost::beast::http::error::end_of_stream ||
               code == boost::asio::error::eof ||
               code == boost::asio::error::broken_pipe ||
               code == boost::asio::error::connection_reset;
    }
}

HTTPSTransport::HTTPSTransport(const std::string& serverName, unsigned short port, unsigned maxIdleConnections)
    : serverName(serverName)
    , port(port)
    , maxIdleConnections(maxIdleConnections) {}

HTTPSTransport::ConnectionPtr HTTPSTransport::acquire(boost::optional<REST::TimePoint> deadline, bool& reused) {
    {
        std::lock_guard<std::mutex> lock(poolMutex);
        while (!idleConnections.empty()) {
            ConnectionPtr connection = std::move(idleConnections.back());
            idleConnections.pop_back();

            if (connection->isOpen()) {
                reused = true;
                return connection;
            }
        }
    }

    reused = false;
    ConnectionPtr connection(new REST::HTTPSConnection(serverName, port));
    connection->open(deadline);
    return connection;
}

void HTTPSTransport::giveBack(ConnectionPtr connection) {
    if (!connection->isOpen()) return;

    std::lock_guard<std::mutex> lock(poolMutex);
    if (idleConnections.size() < maxIdleConnections) {
        idleConnections.push_back(std::move(connection));
    }
}

REST::HTTPResponse HTTPSTransport::performOnce(const REST::HTTPRequest& request,
                                               boost::optional<REST::TimePoint> deadline) {
    bool reused = false;
    ConnectionPtr connection = acquire(deadline, reused);

    REST::HTTPResponse response;
    try {
        DEBUG_MSG(std::string("Sending request: ") + request.method + " " + request.path +
                  (reused ? " (reused connection)" : ""));
        response = connection->request(request, deadline);
    } catch (const boost::system::system_error& excp) {
        if (!reused || !closedByRemote(excp.code())) throw;

        DEBUG_MSG("HTTP Connection closed by remote. Reopenning and retrying.");
        request.body.rewind();

        connection.reset(new REST::HTTPSConnection(serverName, port));
        connection->open(deadline);
        response = connection->request(request, deadline);
    }

    giveBack(std::move(connection));
    return response;
}

REST::HTTPResponse HTTPSTransport::perform(const REST::HTTPRequest& request,
                                           boost::optional<REST::TimePoint> deadline) {
    try {
        return performOnce(request, deadline);
    } catch (const boost::system::system_error& excp) {
        if (excp.code() == boost::beast::error::timeout) {
            DEBUG_MSG(std::string("Request timed out: ") + request.method + " " + request.path);
            throw TimeoutError(request.method, request.path, 1);
        }
        throw NetworkError(std::string("Request failed (") + request.method + " " + request.path + ")", excp.code());
    }
}

} // namespace Ratecord
