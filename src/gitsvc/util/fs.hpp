#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace gitsvc {

namespace fs = std::filesystem;

/**
 * @brief Alias of a const& to a std::filesystem::path
 */
using path_ref = const fs::path&;

struct e_write_file_path {
    fs::path value;
};

/**
 * @brief Obtain the directory in which Git should be run for the given location.
 *
 * If `p` names an existing regular file, this is the file's parent directory. Otherwise `p` is
 * returned unmodified. No other existence check is performed.
 */
[[nodiscard]] fs::path repository_dir_of(path_ref p) noexcept;

void write_file(path_ref dest, std::string_view content);

}  // namespace gitsvc
