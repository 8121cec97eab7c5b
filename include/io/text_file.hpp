#pragma once

#include "core/error.hpp"

#include <string>

namespace wgpeers::io {

/**
 * @brief Read a whole file into memory
 * @param path File to read
 * @return File contents, or IO_ERROR naming the path
 */
[[nodiscard]] Result<std::string> read_text_file(const std::string& path);

} // namespace wgpeers::io
