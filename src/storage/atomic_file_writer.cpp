#include <evistore/storage/atomic_file_writer.h>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <random>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace evistore::storage {

namespace {

Result<void> writeAll(int fd, std::span<const std::byte> data) {
    const auto* ptr = reinterpret_cast<const char*>(data.data());
    size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, ptr, remaining);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return Error{ErrorCode::IOError, fmt::format("write failed: {}", std::strerror(errno))};
        }
        ptr += n;
        remaining -= static_cast<size_t>(n);
    }
    return {};
}

// Best effort: make the rename itself durable
void syncDirectory(const std::filesystem::path& dir) {
    int fd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0)
        return;
    (void)::fsync(fd);
    ::close(fd);
}

} // namespace

// =============================================================================
// StagedFile
// =============================================================================

StagedFile::~StagedFile() {
    discard();
}

StagedFile::StagedFile(StagedFile&& other) noexcept
    : tempPath_(std::move(other.tempPath_)), target_(std::move(other.target_)) {
    other.tempPath_.clear();
}

StagedFile& StagedFile::operator=(StagedFile&& other) noexcept {
    if (this != &other) {
        discard();
        tempPath_ = std::move(other.tempPath_);
        target_ = std::move(other.target_);
        other.tempPath_.clear();
    }
    return *this;
}

void StagedFile::discard() {
    if (tempPath_.empty())
        return;
    std::error_code ec;
    std::filesystem::remove(tempPath_, ec);
    tempPath_.clear();
}

// =============================================================================
// AtomicFileWriter
// =============================================================================

std::filesystem::path
AtomicFileWriter::generateTempName(const std::filesystem::path& target) const {
    auto timestamp = std::chrono::system_clock::now().time_since_epoch().count();
    std::random_device rngDevice;
    std::mt19937 gen(rngDevice());
    constexpr int RAND_ID_MIN = 1000;
    constexpr int RAND_ID_MAX = 9999;
    std::uniform_int_distribution<> dist(RAND_ID_MIN, RAND_ID_MAX);
    return {fmt::format("{}.tmp.{}.{}", target.string(), timestamp, dist(gen))};
}

Result<StagedFile> AtomicFileWriter::stage(const std::filesystem::path& path,
                                           std::span<const std::byte> data) const {
    StagedFile staged(generateTempName(path), path);

    int fd = ::open(staged.tempPath().c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        int err = errno;
        staged.release();
        return Error{ErrorCode::IOError, fmt::format("cannot create {}: {}",
                                                     staged.tempPath().string(),
                                                     std::strerror(err))};
    }

    auto written = writeAll(fd, data);
    if (written && ::fsync(fd) != 0) {
        written = Error{ErrorCode::IOError, fmt::format("fsync failed: {}", std::strerror(errno))};
    }
    if (::close(fd) != 0 && written) {
        written = Error{ErrorCode::IOError, fmt::format("close failed: {}", std::strerror(errno))};
    }
    if (!written) {
        spdlog::debug("Staging {} failed: {}", path.string(), written.error().message);
        return written.error();
    }

    return staged;
}

Result<void> AtomicFileWriter::commit(StagedFile& staged) const {
    if (!staged.pending()) {
        return Error{ErrorCode::InvalidState, "nothing staged"};
    }

    std::error_code renameError;
    std::filesystem::rename(staged.tempPath(), staged.target(), renameError);
    if (renameError) {
        auto message = fmt::format("rename {} -> {} failed: {}", staged.tempPath().string(),
                                   staged.target().string(), renameError.message());
        staged.discard();
        return Error{ErrorCode::IOError, std::move(message)};
    }

    staged.release();
    syncDirectory(staged.target().parent_path());
    return {};
}

} // namespace evistore::storage
