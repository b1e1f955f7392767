#include "fs/file_system.hpp"

#include "log/log.hpp"

#include <system_error>

namespace cltk::fs {

std::optional<std::filesystem::path> LocalFileSystem::current_working_directory() const {
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        CLTK_LOG_DEBUG("fs", "current_path failed: " << ec.message());
        return std::nullopt;
    }
    return cwd;
}

const FileSystem& local_file_system() {
    static LocalFileSystem fs;
    return fs;
}

} // namespace cltk::fs
