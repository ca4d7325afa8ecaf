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

#ifndef RATECORD_INTERNAL_REST_HPP
#define RATECORD_INTERNAL_REST_HPP 

#include <chrono>                           // std::chrono::steady_clock
#include <ios>                              // std::streampos
#include <istream>                          // std::istream
#include <memory>                           // std::unique_ptr, std::shared_ptr
#include <string>                           // std::string
#include <vector>                           // std::vector
#include <unordered_map>                    // std::unordered_map
#include <boost/optional.hpp>               // boost::optional
#include <boost/asio/io_context.hpp>        // boost::asio::io_context
#include <boost/asio/ssl/context.hpp>       // boost::asio::ssl::context
#include <boost/beast/core/flat_buffer.hpp> // boost::beast::flat_buffer
#include <boost/beast/core/tcp_stream.hpp>  // boost::beast::tcp_stream
#include <boost/beast/ssl/ssl_stream.hpp>   // boost::beast::ssl_stream

namespace Ratecord { namespace REST {
    namespace _detail {
        struct CaseInsensibleStringHash {
            std::size_t operator()(const std::string& key) const;
        };

        struct CaseInsensibleStringEqual {
            bool operator()(const std::string& lhs, const std::string& rhs) const;
        };
    }

    /// Hash-map with case-insensible string keys.
    using HeadersMap = std::unordered_map<std::string, std::string,
                                          _detail::CaseInsensibleStringHash,
                                          _detail::CaseInsensibleStringEqual>;

    using TimePoint = std::chrono::steady_clock::time_point;

    /**
     * Part of request body. Either bytes in memory or stream read at
     * send time, starting from origin.
     */
    struct BodyChunk {
        std::vector<uint8_t> bytes;

        std::shared_ptr<std::istream> stream;
        std::streampos origin = std::streampos(-1);
    };

    /**
     * Request body ready to be written to the wire.
     */
    struct EncodedBody {
        /// Empty if there is no body.
        std::string contentType;
        std::vector<BodyChunk> chunks;

        bool empty() const;

        /// True if at least one chunk is backed by a stream.
        bool isStreamed() const;

        /// Size of in-memory chunks, exact body size if !isStreamed().
        std::size_t size() const;

        void append(const std::string& text);
        void append(const std::vector<uint8_t>& bytes);
        void append(std::shared_ptr<std::istream> stream);

        /**
         * Concatenate all chunks into single buffer, streams are read
         * until EOF.
         */
        std::vector<uint8_t> flatten() const;

        /**
         * Seek streams back to position they had when body was encoded
         * so body can be sent again.
         *
         * \throws ProtocolError if stream is not seekable.
         */
        void rewind() const;
    };

    struct HTTPResponse {
        unsigned statusCode = 0;

        HeadersMap headers;
        std::vector<uint8_t> body;
    };

    struct HTTPRequest {
        std::string method;
        std::string path;

        unsigned version = 11;
        EncodedBody body;
        HeadersMap headers;
    };

    /**
     * Single keep-alive HTTPS connection.
     *
     * Every connection runs own I/O context, so connections can be used from
     * different threads simultaneously (one thread per connection at time).
     * All operations are bounded by passed deadline, operation that didn't
     * completed before it fails with boost::beast::error::timeout.
     *
     * \throws boost::system::system_error on any I/O error.
     */
    class HTTPSConnection {
    public:
        HTTPSConnection(const std::string& serverName, unsigned short port = 443);
        ~HTTPSConnection();

        HTTPSConnection(const HTTPSConnection&) = delete;
        HTTPSConnection& operator=(const HTTPSConnection&) = delete;

        void open(boost::optional<TimePoint> deadline = boost::none);
        void close();

        bool isOpen() const;

        HTTPResponse request(const HTTPRequest& request, boost::optional<TimePoint> deadline = boost::none);

        HeadersMap connectionHeaders;
        const std::string serverName;
        const unsigned short port;

    private:
        using Stream = boost::beast::ssl_stream<boost::beast::tcp_stream>;

        template<typename Message>
        void setCommonHeaders(Message& message, const HTTPRequest& request) const;

        void writeBuffered(const HTTPRequest& request);
        void writeStreamed(const HTTPRequest& request);
        HTTPResponse readResponse();

        void setDeadline(boost::optional<TimePoint> deadline);
        void runPending();

        boost::asio::io_context ioContext;
        boost::asio::ssl::context tlsctx;
        std::unique_ptr<Stream> stream;
        boost::beast::flat_buffer buffer;

        bool alive = false;
    };

    struct MultipartEntity {
        std::string name;
        std::string filename;
        HeadersMap additionalHeaders;

        std::vector<uint8_t> body;

        /// If set, used instead of body.
        std::shared_ptr<std::istream> stream;
    };

    /**
     * Encode elements as multipart/form-data body using passed boundary.
     */
    EncodedBody buildMultipartBody(const std::vector<MultipartEntity>& elements, const std::string& boundary);

}} // namespace Ratecord::REST

#endif // RATECORD_INTERNAL_REST_HPP 
