#pragma once

#include <filesystem>

namespace evistore::storage {

/**
 * RAII advisory exclusive lock on a lock file (flock, non-blocking).
 * Locks are per open file description, so a second lock on the same path
 * fails even inside one process.
 */
class FileLock {
public:
    explicit FileLock(std::filesystem::path path);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    bool locked() const { return fd_ >= 0; }
    const std::filesystem::path& path() const { return path_; }

private:
    int fd_{-1};
    std::filesystem::path path_;
};

} // namespace evistore::storage
