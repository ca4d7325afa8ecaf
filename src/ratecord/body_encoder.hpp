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


#ifndef RATECORD_BODY_ENCODER_HPP
#define RATECORD_BODY_ENCODER_HPP

#include <vector>
#include <nlohmann/json.hpp>
#include <ratecord/types/file.hpp>
#include <ratecord/internal/rest.hpp>

namespace Ratecord {
    enum class BodyKind {
        None,
        Structured,
        Multipart
    };

    /**
     * Request body before encoding.
     */
    struct RequestBody {
        BodyKind kind = BodyKind::None;

        nlohmann::json payload;
        std::vector<File> files;

        /// Send payload fields as separate form fields instead of
        /// single payload_json part (sticker upload wants this).
        bool fieldsAsParts = false;

        static RequestBody none() { return RequestBody(); }

        static RequestBody structured(nlohmann::json payload) {
            RequestBody body;
            body.kind    = BodyKind::Structured;
            body.payload = std::move(payload);
            return body;
        }

        static RequestBody multipart(nlohmann::json payload, std::vector<File> files) {
            RequestBody body;
            body.kind    = BodyKind::Multipart;
            body.payload = std::move(payload);
            body.files   = std::move(files);
            return body;
        }

        static RequestBody form(nlohmann::json fields, std::vector<File> files) {
            RequestBody body = multipart(std::move(fields), std::move(files));
            body.fieldsAsParts = true;
            return body;
        }
    };

    /**
     * Encode body for the wire.
     *
     * Structured body is encoded as JSON, null payload produces no body.
     * Multipart body has payload_json part (or one part per payload field)
     * followed by one part per file, named files[N] unless file has own
     * field name. Streamed files are not read here, transport reads them
     * while sending.
     *
     * \throws InvalidParameter if multipart body has fieldsAsParts set and
     *         payload is not an object.
     */
    REST::EncodedBody encodeBody(const RequestBody& body);

    /**
     * Random boundary which doesn't occur in any of passed in-memory parts.
     */
    std::string chooseBoundary(const std::vector<REST::MultipartEntity>& parts);
} // namespace Ratecord

#endif // RATECORD_BODY_ENCODER_HPP
