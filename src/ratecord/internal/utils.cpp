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

#include "utils.hpp"
#include <algorithm>    // std::all_of
#include <cctype>       // std::isalnum, std::isdigit
#include <locale>       // std::tolower, std::locale
#include <mutex>        // std::mutex, std::lock_guard
#include <random>       // std::mt19937, std::random_device
#include <stdexcept>    // std::invalid_argument
#include <sstream>      // std::ostringstream
#include <iomanip>      // std::setw

namespace Ratecord { namespace Utils {
    namespace Magic {
        bool isGif(const std::vector<uint8_t>& bytes) {
            // according to http://fileformats.archiveteam.org/wiki/GIF
            return bytes.size() >= 6 &&
                bytes[0] == 'G' &&  // should begin with 'GIF'
                bytes[1] == 'I' &&
                bytes[2] == 'F' &&
                ( // then GIF version, '87a' or '89a'
                    (
                        bytes[3] == '8' &&
                        bytes[4] == '7' &&
                        bytes[5] == 'a'
                    ) || (
                        bytes[3] == '8' &&
                        bytes[4] == '9' &&
                        bytes[5] == 'a'
                    )
                );
        }

        bool isJfif(const std::vector<uint8_t>& bytes) {
            // according to http://fileformats.archiveteam.org/wiki/JFIF
            return bytes.size() >= 3 &&
                bytes[0] == 0xFF &&
                bytes[1] == 0xD8 &&
                bytes[2] == 0xFF;
        }

        bool isPng(const std::vector<uint8_t>& bytes) {
            // according to https://www.w3.org/TR/PNG/#5PNG-file-signature
            return bytes.size() >= 12 && // signature + single no-data chunk size
                bytes[0] == 137 &&
                bytes[1] == 'P' &&
                bytes[2] == 'N' &&
                bytes[3] == 'G' &&
                bytes[4] == 13  && // CR
                bytes[5] == 10  && // LF
                bytes[6] == 26  && // SUB
                bytes[7] == 10;    // LF
        }
    }

    std::string base64Encode(const std::vector<uint8_t>& data) {
        static constexpr char base64Map[65] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

        // Use = signs so the end is properly padded.
        std::string result((((data.size() + 2) / 3) * 4), '=');
        size_t outpos = 0;
        int bitsCollected = 0;
        unsigned accumulator = 0;

        for (uint8_t byte : data) {
            accumulator = (accumulator << 8) | (byte & 0xffu);
            bitsCollected += 8;
            while (bitsCollected >= 6) {
                bitsCollected -= 6;
                result[outpos++] = base64Map[(accumulator >> bitsCollected) & 0x3fu];
            }
        }
        if (bitsCollected > 0) { // Any trailing bits that are missing.
            accumulator <<= 6 - bitsCollected;
            result[outpos++] = base64Map[accumulator & 0x3fu];
        }
        return result;
    }

    std::string imageDataUri(const std::vector<uint8_t>& bytes) {
        std::string mimeType;
        if (Magic::isPng(bytes)) {
            mimeType = "image/png";
        } else if (Magic::isJfif(bytes)) {
            mimeType = "image/jpeg";
        } else if (Magic::isGif(bytes)) {
            mimeType = "image/gif";
        } else {
            throw std::invalid_argument("Unsupported image type (expected PNG, JPEG or GIF).");
        }

        return std::string("data:") + mimeType + ";base64," + base64Encode(bytes);
    }

    std::string urlEncode(const std::string& raw) {
        std::ostringstream resultStream;

        resultStream.fill('0');
        resultStream << std::hex;

        for (char ch : raw) {
            unsigned char byte = static_cast<unsigned char>(ch);
            if (std::isalnum(byte) || ch == '.' || ch == '~' || ch == '_' || ch == '-') {
                resultStream << ch;
            } else {
                resultStream << std::uppercase;
                resultStream << '%' << std::setw(2) << unsigned(byte);
                resultStream << std::nouppercase;
            }
        }
        return resultStream.str();
    }

    std::string makeQueryString(const QueryParameters& queryVariables) {
        std::string queryString;
        for (const auto& queryParam : queryVariables) {
            if (!queryParam.second) continue;

            queryString += queryString.empty() ? '?' : '&';
            queryString += urlEncode(queryParam.first);
            queryString += '=';
            queryString += urlEncode(*queryParam.second);
        }
        return queryString;
    }

    std::vector<std::string> split(const std::string& str, char delimiter) {
        std::vector<std::string> result;
        std::string::size_type start = 0;
        while (true) {
            std::string::size_type end = str.find(delimiter, start);
            if (end == std::string::npos) {
                result.push_back(str.substr(start));
                break;
            }
            result.push_back(str.substr(start, end - start));
            start = end + 1;
        }
        return result;
    }

    bool isNumber(const std::string& input) {
        return !input.empty() && std::all_of(input.begin(), input.end(), [](char ch) {
            return std::isdigit(static_cast<unsigned char>(ch));
        });
    }

    std::chrono::milliseconds secondsToMilliseconds(double seconds) {
        static constexpr double maxSeconds = 24 * 60 * 60;

        if (!(seconds > 0.0)) return std::chrono::milliseconds(0);
        if (!(seconds < maxSeconds)) seconds = maxSeconds;
        return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0 + 0.5));
    }

    std::string stringToLower(const std::string& input) {
        std::string result;
        result.reserve(input.size());

        for (char ch : input) {
            result.push_back(std::tolower(ch, std::locale::classic()));
        }
        return result;
    }

    std::string randomAsciiString(unsigned length) {
        static constexpr char alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
        static std::mutex generatorMutex;
        static std::mt19937 generator{ std::random_device{}() };

        std::uniform_int_distribution<unsigned> distribution(0, sizeof(alphabet) - 2);

        std::string result;
        result.reserve(length);

        std::lock_guard<std::mutex> lock(generatorMutex);
        for (unsigned i = 0; i < length; ++i) {
            result.push_back(alphabet[distribution(generator)]);
        }
        return result;
    }
}} // namespace Ratecord::Utils
