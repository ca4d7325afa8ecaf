#ifndef RATECORD_TYPES_FILE_HPP
#define RATECORD_TYPES_FILE_HPP

#include <istream>  // std::istream
#include <memory>   // std::shared_ptr
#include <string>   // std::string
#include <vector>   // std::vector

namespace Ratecord {
    /**
     * Attachment sent in multipart requests: file name and contents.
     *
     * Contents either held in memory (\ref bytes) or read from \ref stream when
     * request is sent, in later case file is uploaded without buffering it
     * completely. Stream should be seekable if request may be retried.
     */
    struct File {
        /**
         * Read file specified by `path` to \ref bytes.
         * Last component of path used as filename.
         */
        explicit File(const std::string& path);

        /**
         * Use passed vector as file contents.
         */
        File(const std::string& filename, const std::vector<uint8_t>& bytes);

        /**
         * Stream contents from `stream` at request time, starting at its current position.
         */
        File(const std::string& filename, std::shared_ptr<std::istream> stream);

        bool isStreamed() const { return stream != nullptr; }

        std::string filename;
        std::vector<uint8_t> bytes;
        std::shared_ptr<std::istream> stream;

        /// Multipart field name, "files[N]" used if empty.
        std::string fieldName;

        /// Content-Type of part, omitted if empty.
        std::string contentType;
    };
} // namespace Ratecord

#endif // RATECORD_TYPES_FILE_HPP
