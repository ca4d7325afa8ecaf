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

#include <ratecord/internal/rest.hpp>

#include <functional>                                 // std::hash
#include <iterator>                                   // std::istreambuf_iterator
#include <openssl/err.h>                               // ERR_get_error
#include <openssl/ssl.h>                               // SSL_set_tlsext_host_name
#include <boost/asio/ip/tcp.hpp>                      // boost::asio::ip::tcp
#include <boost/asio/steady_timer.hpp>                // boost::asio::steady_timer
#include <boost/asio/ssl/error.hpp>                   // boost::asio::ssl::error::stream_truncated
#include <boost/asio/ssl/host_name_verification.hpp>  // boost::asio::ssl::host_name_verification
#include <boost/beast/core/error.hpp>                 // boost::beast::error::timeout
#include <boost/beast/http/buffer_body.hpp>           // boost::beast::http::buffer_body
#include <boost/beast/http/read.hpp>                  // boost::beast::http::async_read
#include <boost/beast/http/serializer.hpp>            // boost::beast::http::request_serializer
#include <boost/beast/http/vector_body.hpp>           // boost::beast::http::vector_body
#include <boost/beast/http/write.hpp>                 // boost::beast::http::async_write
#include <ratecord/config.hpp>
#include <ratecord/exceptions.hpp>                    // ProtocolError
#include <ratecord/internal/utils.hpp>                // Utils::stringToLower

#if defined(RATECORD_DEBUG_LOG) && defined(RATECORD_DEBUG_TRANSPORT)
    #include <iostream>
    #define DEBUG_MSG(msg) do { std::cerr << "rest.cpp:" << __LINE__ << "\t" << (msg) << '\n'; } while (false)
#else
    #define DEBUG_MSG(msg)
#endif

namespace ssl  = boost::asio::ssl;
namespace http = boost::beast::http;
using     tcp  = boost::asio::ip::tcp;

namespace Ratecord { namespace REST {
namespace _detail {
    std::size_t CaseInsensibleStringHash::operator()(const std::string& key) const {
        return std::hash<std::string>()(Utils::stringToLower(key));
    }

    bool CaseInsensibleStringEqual::operator()(const std::string& lhs, const std::string& rhs) const {
        return lhs.size() == rhs.size() && Utils::stringToLower(lhs) == Utils::stringToLower(rhs);
    }
}

bool EncodedBody::empty() const {
    for (const auto& chunk : chunks) {
        if (chunk.stream || !chunk.bytes.empty()) return false;
    }
    return true;
}

bool EncodedBody::isStreamed() const {
    for (const auto& chunk : chunks) {
        if (chunk.stream) return true;
    }
    return false;
}

std::size_t EncodedBody::size() const {
    std::size_t result = 0;
    for (const auto& chunk : chunks) {
        result += chunk.bytes.size();
    }
    return result;
}

void EncodedBody::append(const std::string& text) {
    append(std::vector<uint8_t>(text.begin(), text.end()));
}

void EncodedBody::append(const std::vector<uint8_t>& bytes) {
    // Merge with previous in-memory chunk, writing few big buffers is cheaper.
    if (!chunks.empty() && !chunks.back().stream) {
        chunks.back().bytes.insert(chunks.back().bytes.end(), bytes.begin(), bytes.end());
        return;
    }

    BodyChunk chunk;
    chunk.bytes = bytes;
    chunks.push_back(std::move(chunk));
}

void EncodedBody::append(std::shared_ptr<std::istream> stream) {
    BodyChunk chunk;
    chunk.origin = stream->tellg();
    // Failed tellg leaves stream in fail state, it is still readable once.
    if (chunk.origin == std::streampos(-1)) stream->clear();
    chunk.stream = std::move(stream);
    chunks.push_back(std::move(chunk));
}

std::vector<uint8_t> EncodedBody::flatten() const {
    std::vector<uint8_t> result;
    result.reserve(size());

    for (const auto& chunk : chunks) {
        if (chunk.stream) {
            result.insert(result.end(), std::istreambuf_iterator<char>(chunk.stream->rdbuf()),
                                        std::istreambuf_iterator<char>());
        } else {
            result.insert(result.end(), chunk.bytes.begin(), chunk.bytes.end());
        }
    }
    return result;
}

void EncodedBody::rewind() const {
    for (const auto& chunk : chunks) {
        if (!chunk.stream) continue;

        if (chunk.origin == std::streampos(-1)) {
            throw ProtocolError("Attachment stream is not seekable, request can't be repeated.");
        }

        chunk.stream->clear();
        chunk.stream->seekg(chunk.origin);
        if (!*chunk.stream) {
            throw ProtocolError("Failed to rewind attachment stream, request can't be repeated.");
        }
    }
}

HTTPSConnection::HTTPSConnection(const std::string& serverName, unsigned short port)
    : serverName(serverName)
    , port(port)
    , tlsctx(ssl::context::tlsv12_client) {

    tlsctx.set_verify_mode(ssl::verify_peer | ssl::verify_fail_if_no_peer_cert);
    tlsctx.set_verify_callback(ssl::host_name_verification(serverName));
    tlsctx.set_default_verify_paths();
}

HTTPSConnection::~HTTPSConnection() {
    if (stream) {
        boost::system::error_code ec;
        boost::beast::get_lowest_layer(*stream).socket().close(ec);
    }
}

void HTTPSConnection::setDeadline(boost::optional<TimePoint> deadline) {
    if (deadline) {
        boost::beast::get_lowest_layer(*stream).expires_at(*deadline);
    } else {
        boost::beast::get_lowest_layer(*stream).expires_never();
    }
}

void HTTPSConnection::runPending() {
    ioContext.restart();
    ioContext.run();
}

void HTTPSConnection::open(boost::optional<TimePoint> deadline) {
    DEBUG_MSG(std::string("Opening connection to ") + serverName + ":" + std::to_string(port));

    stream.reset(new Stream(ioContext, tlsctx));
    buffer.consume(buffer.size());

    // SNI, many hosts (including Discord's CDN) refuse handshake without it.
    if (!SSL_set_tlsext_host_name(stream->native_handle(), serverName.c_str())) {
        throw boost::system::system_error(boost::system::error_code(static_cast<int>(::ERR_get_error()),
                                                                    boost::asio::error::get_ssl_category()));
    }

    if (deadline && std::chrono::steady_clock::now() >= *deadline) {
        throw boost::system::system_error(boost::system::error_code(boost::beast::error::timeout));
    }

    boost::system::error_code ec;

    // Resolver isn't covered by stream expiry, so it's cancelled by own timer.
    tcp::resolver resolver(ioContext);
    tcp::resolver::results_type endpoints;
    boost::asio::steady_timer resolveTimer(ioContext);
    bool resolveExpired = false;
    if (deadline) {
        resolveTimer.expires_at(*deadline);
        resolveTimer.async_wait([&resolver, &resolveExpired](const boost::system::error_code& error) {
            if (error) return; // cancelled, resolve finished first
            resolveExpired = true;
            resolver.cancel();
        });
    }
    resolver.async_resolve(serverName, std::to_string(port),
        [&ec, &endpoints, &resolveTimer](const boost::system::error_code& error, tcp::resolver::results_type results) {
            ec = error;
            endpoints = results;
            resolveTimer.cancel();
        });
    runPending();
    if (resolveExpired) {
        DEBUG_MSG(std::string("Name resolution timed out: ") + serverName);
        throw boost::system::system_error(boost::system::error_code(boost::beast::error::timeout));
    }
    if (ec) throw boost::system::system_error(ec);

    setDeadline(deadline);
    boost::beast::get_lowest_layer(*stream).async_connect(endpoints,
        [&ec](const boost::system::error_code& error, const tcp::endpoint&) { ec = error; });
    runPending();
    if (ec) throw boost::system::system_error(ec);

    boost::beast::get_lowest_layer(*stream).socket().set_option(tcp::no_delay(true));

    stream->async_handshake(ssl::stream_base::client,
        [&ec](const boost::system::error_code& error) { ec = error; });
    runPending();
    if (ec) throw boost::system::system_error(ec);

    alive = true;
}

void HTTPSConnection::close() {
    if (!stream) return;

    DEBUG_MSG(std::string("Closing connection to ") + serverName);

    boost::system::error_code ec;
    boost::beast::get_lowest_layer(*stream).expires_after(std::chrono::seconds(5));
    stream->async_shutdown([&ec](const boost::system::error_code& error) { ec = error; });
    runPending();

    boost::system::error_code ignored;
    boost::beast::get_lowest_layer(*stream).socket().close(ignored);
    alive = false;

    if (ec &&
        ec != boost::asio::error::eof &&
        ec != boost::asio::ssl::error::stream_truncated &&
        ec != boost::asio::error::broken_pipe &&
        ec != boost::asio::error::connection_reset &&
        ec != boost::beast::error::timeout) {

        throw boost::system::system_error(ec);
    }
}

bool HTTPSConnection::isOpen() const {
    return stream && boost::beast::get_lowest_layer(*stream).socket().is_open() && alive;
}

template<typename Message>
void HTTPSConnection::setCommonHeaders(Message& rawRequest, const HTTPRequest& request) const {
    rawRequest.method_string(request.method);
    rawRequest.target(request.path);
    rawRequest.version(request.version);

    // Set default headers. 
    rawRequest.set("User-Agent", "Generic HTTP 1.1 Client");
    rawRequest.set("Connection", "keep-alive");
    rawRequest.set("Accept",     "*/*");
    rawRequest.set("Host",       serverName);
    if (!request.body.empty()) {
        rawRequest.set("Content-Type", request.body.contentType.empty() ? "application/octet-stream"
                                                                        : request.body.contentType);
    }

    // Set per-connection headers.
    for (const auto& header : connectionHeaders) {
        rawRequest.set(header.first, header.second);
    }

    // Set per-request
    for (const auto& header : request.headers) {
        rawRequest.set(header.first, header.second);
    }
}

void HTTPSConnection::writeBuffered(const HTTPRequest& request) {
    http::request<http::vector_body<uint8_t> > rawRequest;
    setCommonHeaders(rawRequest, request);
    rawRequest.body() = request.body.flatten();
    rawRequest.prepare_payload();

    boost::system::error_code ec;
    http::async_write(*stream, rawRequest,
        [&ec](const boost::system::error_code& error, std::size_t) { ec = error; });
    runPending();
    if (ec && ec != http::error::end_of_stream) throw boost::system::system_error(ec);
}

void HTTPSConnection::writeStreamed(const HTTPRequest& request) {
    http::request<http::buffer_body> rawRequest;
    setCommonHeaders(rawRequest, request);
    rawRequest.chunked(true);
    rawRequest.body().data = nullptr;
    rawRequest.body().more = true;

    http::request_serializer<http::buffer_body> serializer(rawRequest);

    boost::system::error_code ec;
    auto handler = [&ec](const boost::system::error_code& error, std::size_t) { ec = error; };

    http::async_write_header(*stream, serializer, handler);
    runPending();
    if (ec) throw boost::system::system_error(ec);

    // Serializer asks for next buffer using need_buffer "error".
    auto writeBuffer = [&](const void* data, std::size_t size) {
        rawRequest.body().data = const_cast<void*>(data);
        rawRequest.body().size = size;
        rawRequest.body().more = true;
        http::async_write(*stream, serializer, handler);
        runPending();
        if (ec == http::error::need_buffer) ec.clear();
        if (ec) throw boost::system::system_error(ec);
    };

    std::vector<char> readBuffer(16 * 1024);
    for (const auto& chunk : request.body.chunks) {
        if (!chunk.stream) {
            if (!chunk.bytes.empty()) writeBuffer(chunk.bytes.data(), chunk.bytes.size());
            continue;
        }

        while (*chunk.stream) {
            chunk.stream->read(readBuffer.data(), readBuffer.size());
            std::streamsize readCount = chunk.stream->gcount();
            if (readCount <= 0) break;
            writeBuffer(readBuffer.data(), static_cast<std::size_t>(readCount));
        }
    }

    rawRequest.body().data = nullptr;
    rawRequest.body().size = 0;
    rawRequest.body().more = false;
    http::async_write(*stream, serializer, handler);
    runPending();
    if (ec) throw boost::system::system_error(ec);
}

HTTPResponse HTTPSConnection::readResponse() {
    http::response<http::vector_body<uint8_t> > response;

    boost::system::error_code ec;
    http::async_read(*stream, buffer, response,
        [&ec](const boost::system::error_code& error, std::size_t) { ec = error; });
    runPending();
    if (ec) throw boost::system::system_error(ec);

    HTTPResponse responseStruct;
    responseStruct.statusCode = response.result_int();
    responseStruct.body       = std::move(response.body());
    for (const auto& header : response) {
        responseStruct.headers.insert({ std::string(header.name_string().data(), header.name_string().size()),
                                        std::string(header.value().data(), header.value().size()) });
    }
    alive = response.keep_alive();

    return responseStruct;
}

HTTPResponse HTTPSConnection::request(const HTTPRequest& request, boost::optional<TimePoint> deadline) {
    setDeadline(deadline);

    alive = false;
    if (request.body.isStreamed()) {
        DEBUG_MSG(std::string("Streaming request body: ") + request.method + " " + request.path);
        writeStreamed(request);
    } else {
        writeBuffered(request);
    }

    return readResponse();
}

EncodedBody buildMultipartBody(const std::vector<MultipartEntity>& elements, const std::string& boundary) {
    EncodedBody body;
    body.contentType = std::string("multipart/form-data; boundary=") + boundary;

    for (const auto& element : elements) {
        std::string head = std::string("--") + boundary + "\r\n" +
                           "Content-Disposition: form-data; name=\"" + element.name + "\"";
        if (!element.filename.empty()) {
            head += std::string("; filename=\"") + element.filename + '"';
        }
        head += "\r\n";
        for (const auto& header : element.additionalHeaders) {
            head += header.first + ": " + header.second + "\r\n";
        }
        head += "\r\n";
        body.append(head);

        if (element.stream) {
            body.append(element.stream);
        } else {
            body.append(element.body);
        }
        body.append(std::string("\r\n"));
    }
    body.append(std::string("--") + boundary + "--\r\n");

    return body;
}

}} // namespace Ratecord::REST
