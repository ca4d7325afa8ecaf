#ifndef RATECORD_EXCEPTIONS_HPP
#define RATECORD_EXCEPTIONS_HPP

#include <chrono>
#include <stdexcept>
#include <string>
#include <boost/system/error_code.hpp>

/**
 * \file exceptions.hpp
 *
 * This file defines set of exceptions thrown by Ratecord.
 *
 * Errors that are retried by \ref Dispatcher (429, 5xx, network failures)
 * reach the caller only after the retry budget is exhausted, in that case
 * attempts field tells how many network calls were made.
 */

namespace Ratecord {
    /// Base class for errors that can't be predicted in most cases.
    class RuntimeError : public std::runtime_error {
    public:
        RuntimeError(const std::string& message, int errorCode)
            : std::runtime_error(message), message(message), code(errorCode) {}

        const std::string message;
        const int         code;
    };

    /// Base class for errors that can be predicted in most cases.
    class LogicError : public std::logic_error {
    public:
        LogicError(const std::string& message, int errorCode)
            : std::logic_error(message), message(message), code(errorCode) {}

        const std::string message;
        const int         code;
    };

    /// The class for errors reported by REST API using HTTP status code.
    /// Some errors have separate classes, which inherit RESTError.
    class RESTError : public RuntimeError {
    public:
        RESTError(const std::string& message, int apiCode, int httpCode,
                  const std::string& method, const std::string& path,
                  const std::string& body, unsigned attempts)
            : RuntimeError(message + " (" + method + " " + path + ", httpCode=" + std::to_string(httpCode) +
                           ", apiCode=" + std::to_string(apiCode) + ", attempts=" + std::to_string(attempts) + ")",
                           apiCode)
            , httpCode(httpCode)
            , apiCode(apiCode)
            , method(method)
            , path(path)
            , body(body)
            , attempts(attempts) {}

        const int httpCode;

        /// Discord JSON error code, -1 if response body don't contain one.
        const int apiCode;

        const std::string method;
        const std::string path;

        /// Raw response body as sent by server.
        const std::string body;

        /// Count of network calls made before error was surfaced.
        const unsigned attempts;
    };

    /// Thrown on non-retryable 4xx responses (validation, auth, not found, ...).
    class ClientError : public RESTError {
    public:
        using RESTError::RESTError;
    };

    /// Thrown on 5xx responses once retry budget is exhausted.
    class ServerError : public RESTError {
    public:
        using RESTError::RESTError;
    };

    /// Thrown on 429 response if ratelimit retries are disabled or exhausted.
    class RateLimitError : public RESTError {
    public:
        RateLimitError(const std::string& method, const std::string& path, const std::string& body,
                       unsigned attempts, std::chrono::milliseconds retryAfter, bool global)
            : RESTError(std::string("Ratelimit hit") + (global ? " (global)" : ""), -1, 429,
                        method, path, body, attempts)
            , retryAfter(retryAfter)
            , global(global) {}

        const std::chrono::milliseconds retryAfter;
        const bool global;
    };

    /// Thrown if connection to REST API server fails (DNS, TCP, TLS, I/O errors).
    class NetworkError : public RuntimeError {
    public:
        NetworkError(const std::string& message, boost::system::error_code cause, unsigned attempts = 1)
            : RuntimeError(message + ": " + cause.message() + " (attempts=" + std::to_string(attempts) + ")",
                           cause.value())
            , cause(cause)
            , attempts(attempts) {}

        const boost::system::error_code cause;
        const unsigned attempts;
    };

    /// Thrown if request deadline expired while request was queued or in flight.
    class TimeoutError : public RuntimeError {
    public:
        TimeoutError(const std::string& method, const std::string& path, unsigned attempts)
            : RuntimeError(std::string("Request deadline expired (") + method + " " + path +
                           ", attempts=" + std::to_string(attempts) + ")", -1)
            , attempts(attempts) {}

        const unsigned attempts;
    };

    /// Thrown if response can't be interpreted (invalid JSON in 2xx response),
    /// or request can't be repeated (non-seekable attachment stream).
    class ProtocolError : public RuntimeError {
    public:
        ProtocolError(const std::string& message)
            : RuntimeError(message, -1) {}
    };

    /// Thrown if either pre-request parameter validation fails.
    /// Errors parameter contained in \ref parameter, error description in \ref description.
    class InvalidParameter : public LogicError {
    public:
        InvalidParameter(const std::string& parameter, const std::string& description)
            : LogicError(std::string("Invalid parameter: ") + parameter + ", " + description, -1)
            , parameter(parameter)
            , description(description) {}

        const std::string parameter;
        const std::string description;
    };
} // namespace Ratecord

#endif // RATECORD_EXCEPTIONS_HPP
