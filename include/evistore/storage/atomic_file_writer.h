#pragma once

#include <cstddef>
#include <filesystem>
#include <span>
#include <evistore/core/types.h>

namespace evistore::storage {

/**
 * A fully written and synced temp file waiting to be renamed over its target.
 * Removes the temp file on destruction unless committed.
 */
class StagedFile {
public:
    StagedFile() = default;
    StagedFile(std::filesystem::path tempPath, std::filesystem::path target)
        : tempPath_(std::move(tempPath)), target_(std::move(target)) {}
    ~StagedFile();

    StagedFile(const StagedFile&) = delete;
    StagedFile& operator=(const StagedFile&) = delete;
    StagedFile(StagedFile&& other) noexcept;
    StagedFile& operator=(StagedFile&& other) noexcept;

    const std::filesystem::path& tempPath() const { return tempPath_; }
    const std::filesystem::path& target() const { return target_; }
    bool pending() const { return !tempPath_.empty(); }

private:
    friend class AtomicFileWriter;
    void release() { tempPath_.clear(); }
    void discard();

    std::filesystem::path tempPath_;
    std::filesystem::path target_;
};

// Atomic file writer: write to a temp file in the target directory, fsync, then rename
class AtomicFileWriter {
public:
    AtomicFileWriter() = default;
    ~AtomicFileWriter() = default;

    // Two-phase write: stage() the bytes, then commit() once every related file is staged
    [[nodiscard]] Result<StagedFile> stage(const std::filesystem::path& path,
                                           std::span<const std::byte> data) const;
    [[nodiscard]] Result<void> commit(StagedFile& staged) const;

private:
    std::filesystem::path generateTempName(const std::filesystem::path& target) const;
};

} // namespace evistore::storage
