#include <evistore/storage/file_lock.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace evistore::storage {

FileLock::FileLock(std::filesystem::path path) : path_(std::move(path)) {
    fd_ = ::open(path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        spdlog::warn("Cannot open lock file {}: {}", path_.string(), std::strerror(errno));
        return;
    }

    if (::flock(fd_, LOCK_EX | LOCK_NB) == -1) {
        if (errno == EWOULDBLOCK) {
            spdlog::debug("Lock {} is held elsewhere", path_.string());
        } else {
            spdlog::warn("flock({}) failed: {}", path_.string(), std::strerror(errno));
        }
        ::close(fd_);
        fd_ = -1;
    }
}

FileLock::~FileLock() {
    if (fd_ >= 0) {
        (void)::flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}

} // namespace evistore::storage
