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


#include <ratecord/body_encoder.hpp>

#include <algorithm>
#include <ratecord/exceptions.hpp>
#include <ratecord/internal/utils.hpp>

namespace Ratecord {

namespace {
    std::vector<uint8_t> toBytes(const std::string& text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    bool contains(const std::vector<uint8_t>& haystack, const std::string& needle) {
        return std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end()) != haystack.end();
    }
}

std::string chooseBoundary(const std::vector<REST::MultipartEntity>& parts) {
    while (true) {
        std::string boundary = std::string("ratecord-") + Utils::randomAsciiString(32);

        bool collides = std::any_of(parts.begin(), parts.end(), [&boundary](const REST::MultipartEntity& part) {
            return !part.stream && contains(part.body, boundary);
        });
        if (!collides) return boundary;
    }
}

REST::EncodedBody encodeBody(const RequestBody& body) {
    REST::EncodedBody result;

    if (body.kind == BodyKind::None) return result;

    if (body.kind == BodyKind::Structured) {
        if (body.payload.is_null()) return result;

        result.contentType = "application/json";
        result.append(body.payload.dump());
        return result;
    }

    std::vector<REST::MultipartEntity> parts;
    parts.reserve(body.files.size() + 1);

    if (body.fieldsAsParts) {
        if (!body.payload.is_null() && !body.payload.is_object()) {
            throw InvalidParameter("payload", "form fields should be an object");
        }
        if (body.payload.is_object()) {
            for (auto it = body.payload.begin(); it != body.payload.end(); ++it) {
                if (it.value().is_null()) continue;

                REST::MultipartEntity part;
                part.name = it.key();
                part.body = toBytes(it.value().is_string() ? it.value().get<std::string>() : it.value().dump());
                parts.push_back(std::move(part));
            }
        }
    } else if (!body.payload.is_null()) {
        REST::MultipartEntity part;
        part.name = "payload_json";
        part.additionalHeaders["Content-Type"] = "application/json";
        part.body = toBytes(body.payload.dump());
        parts.push_back(std::move(part));
    }

    for (std::size_t i = 0; i < body.files.size(); ++i) {
        const File& file = body.files[i];

        REST::MultipartEntity part;
        part.name     = file.fieldName.empty() ? std::string("files[") + std::to_string(i) + "]" : file.fieldName;
        part.filename = file.filename;
        part.additionalHeaders["Content-Type"] = file.contentType.empty() ? "application/octet-stream"
                                                                          : file.contentType;
        if (file.isStreamed()) {
            part.stream = file.stream;
        } else {
            part.body = file.bytes;
        }
        parts.push_back(std::move(part));
    }

    return REST::buildMultipartBody(parts, chooseBoundary(parts));
}

} // namespace Ratecord
