#include <ratecord/types/file.hpp>

#include <iterator>                    // std::istreambuf_iterator
#include <fstream>                     // std::ifstream
#include <stdexcept>                   // std::runtime_error
#include <utility>                     // std::move
#include <ratecord/internal/utils.hpp> // Utils::split

#if _WIN32
    #define PATH_DELIMITER '\\'
#else
    #define PATH_DELIMITER '/'
#endif

namespace Ratecord {

File::File(const std::string& path)
    : filename(Utils::split(path, PATH_DELIMITER).back()) {

    std::ifstream input(path, std::ios_base::binary);
    if (!input) {
        throw std::runtime_error(std::string("Can't open file ") + path);
    }
    bytes.assign(std::istreambuf_iterator<char>(input.rdbuf()), std::istreambuf_iterator<char>());
}

File::File(const std::string& filename, const std::vector<uint8_t>& bytes)
    : filename(filename)
    , bytes(bytes) {}

File::File(const std::string& filename, std::shared_ptr<std::istream> stream)
    : filename(filename)
    , stream(std::move(stream)) {}

} // namespace Ratecord
