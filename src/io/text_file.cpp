#include "io/text_file.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <utility>

namespace wgpeers::io {

Result<std::string> read_text_file(const std::string& path) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return Result<std::string>::error(ErrorCategory::IO_ERROR,
            std::format("Cannot read {}: is a directory", path));
    }

    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        return Result<std::string>::error(ErrorCategory::IO_ERROR,
            std::format("Cannot open file {}: {}", path, std::strerror(errno)));
    }

    std::string buffer((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Result<std::string>::error(ErrorCategory::IO_ERROR,
            std::format("Error while reading {}", path));
    }
    return Result<std::string>::ok(std::move(buffer));
}

} // namespace wgpeers::io
