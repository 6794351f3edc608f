#include "io/file_io.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

namespace srcfmt::io {

Result<std::string, IoError> read_file_bytes(const fs::path& path) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) {
        return IoError{path.string(), std::string("cannot open: ") + std::strerror(errno)};
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return IoError{path.string(), "read failed"};
    }
    return content;
}

} // namespace srcfmt::io
