//! # File System Access
//!
//! The slice of the file system the lifecycle depends on. Kept behind an
//! interface so a missing working directory can be simulated in tests.

#ifndef CLTK_FS_FILE_SYSTEM_HPP
#define CLTK_FS_FILE_SYSTEM_HPP

#include <filesystem>
#include <optional>

namespace cltk::fs {

class FileSystem {
public:
    virtual ~FileSystem() = default;

    /// The process's current working directory, or nullopt when it cannot be
    /// determined (e.g. it was deleted underneath the process).
    virtual std::optional<std::filesystem::path> current_working_directory() const = 0;
};

/// The real file system of the running process.
class LocalFileSystem : public FileSystem {
public:
    std::optional<std::filesystem::path> current_working_directory() const override;
};

/// Shared LocalFileSystem instance.
const FileSystem& local_file_system();

} // namespace cltk::fs

#endif // CLTK_FS_FILE_SYSTEM_HPP
