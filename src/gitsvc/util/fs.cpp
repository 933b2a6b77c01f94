#include "./fs.hpp"

#include <gitsvc/error/on_error.hpp>

#include <boost/leaf/common.hpp>
#include <boost/leaf/exception.hpp>
#include <fmt/core.h>

#include <cerrno>
#include <fstream>
#include <system_error>

using namespace gitsvc;

fs::path gitsvc::repository_dir_of(path_ref p) noexcept {
    std::error_code ec;
    if (fs::is_regular_file(p, ec)) {
        auto parent = p.parent_path();
        // A bare filename has an empty parent: That's the current directory
        return parent.empty() ? fs::path(".") : parent;
    }
    return p;
}

void gitsvc::write_file(path_ref dest, std::string_view content) {
    GITSVC_E_SCOPE(e_write_file_path{dest});
    errno = 0;
    std::ofstream ofile{dest, std::ios::binary | std::ios::out};
    if (ofile) {
        ofile.write(content.data(), static_cast<std::streamsize>(content.size()));
    }
    auto e = errno;
    if (!ofile) {
        auto ec = std::error_code(e, std::system_category());
        BOOST_LEAF_THROW_EXCEPTION(std::system_error(ec,
                                                     fmt::format("Failed to write to file [{}]",
                                                                 dest.string())),
                                   boost::leaf::e_errno{e},
                                   ec);
    }
}
