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

#ifndef RATECORD_UTILS_HPP
#define RATECORD_UTILS_HPP

#include <chrono>
#include <vector>
#include <string>
#include <utility>
#include <boost/optional.hpp>

/**
 *  Reusable code snippets.
 */

namespace Ratecord { namespace Utils {
    /**
     *  Fast but in-percise type identification based on first ("magic") bytes.
     */
    namespace Magic {
        bool isGif(const std::vector<uint8_t>& bytes);
        bool isJfif(const std::vector<uint8_t>& bytes);
        bool isPng(const std::vector<uint8_t>& bytes);
    }

    /**
     *  Encode arbitrary data using base64.
     */
    std::string base64Encode(const std::vector<uint8_t>& bytes);

    /**
     *  Build data URI accepted by Discord for image fields (emoji, avatars):
     *  `data:image/png;base64,...`. MIME type is guessed using \ref Magic.
     *
     *  \throws std::invalid_argument if image type is not GIF, JPEG or PNG.
     */
    std::string imageDataUri(const std::vector<uint8_t>& bytes);

    /**
     *  Percent-encode everything except unreserved characters (RFC 3986).
     */
    std::string urlEncode(const std::string& raw);

    using QueryParameters = std::vector<std::pair<std::string, boost::optional<std::string> > >;

    /**
     *  Build "?key=value&..." string. Parameters without value are skipped,
     *  empty string returned if no parameters left.
     */
    std::string makeQueryString(const QueryParameters& queryVariables);

    std::vector<std::string> split(const std::string& str, char delimiter);

    bool isNumber(const std::string& input);

    /**
     *  Round non-negative seconds value (as sent in ratelimit headers) to
     *  milliseconds. Values longer than a day are clamped to one day.
     */
    std::chrono::milliseconds secondsToMilliseconds(double seconds);

    std::string stringToLower(const std::string& input);

    /**
     *  Random string of [A-Za-z0-9] characters. Thread-safe.
     */
    std::string randomAsciiString(unsigned length);
}} // namespace Ratecord::Utils

#endif // RATECORD_UTILS_HPP
