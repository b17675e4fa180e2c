#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>
#include <evistore/core/types.h>

namespace evistore::storage {
class FileLock;
}

namespace evistore::vector {

struct Neighbor {
    std::string text;
    float distance = 0.0f; // squared L2
    size_t ordinal = 0;
};

struct IndexStoreOptions {
    /// Skip the process lock and reject every add()
    bool readOnly = false;
};

/**
 * Persisted flat L2 index plus the ordered texts it indexes.
 *
 * texts()[i] always belongs to the i-th stored vector. Every successful add()
 * writes both index.bin and texts.dat before returning; a failed add() leaves
 * memory exactly as it was. search() may run concurrently with other searches;
 * add() is exclusive.
 *
 * Only one IndexStore per directory can be writable at a time (advisory flock on
 * store.lock). Stores that lose the race open read-only.
 */
class IndexStore {
public:
    static constexpr const char* kIndexFileName = "index.bin";
    static constexpr const char* kTextsFileName = "texts.dat";
    static constexpr const char* kLockFileName = "store.lock";

    ~IndexStore();

    IndexStore(const IndexStore&) = delete;
    IndexStore& operator=(const IndexStore&) = delete;

    /**
     * Load the store persisted in `dir`. Missing, unreadable or inconsistent
     * artifacts are logged and produce an empty store instead; never fails.
     */
    static std::unique_ptr<IndexStore> open(const std::filesystem::path& dir,
                                            const IndexStoreOptions& options = {});

    /**
     * Empty store bound to `dir`. A zero `dimension` is fixed by the first add().
     * Nothing is written until the first non-empty add().
     */
    static std::unique_ptr<IndexStore> createEmpty(const std::filesystem::path& dir,
                                                   size_t dimension = 0,
                                                   const IndexStoreOptions& options = {});

    /**
     * Append vectors[i] / texts[i] pairs and persist.
     *
     * Errors: InvalidArgument (length mismatch, invalid UTF-8, NaN or infinite
     * components), DimensionMismatch,
     * InvalidState (read-only), IOError (persist failed, state rolled back).
     */
    Result<void> add(const std::vector<Embedding>& vectors, const std::vector<std::string>& texts);

    /// Exact k-nearest search, ascending squared L2 distance, ties by insertion order.
    /// A query with non-finite components is InvalidArgument.
    Result<std::vector<Neighbor>> search(const Embedding& query, size_t k) const;

    size_t size() const;
    size_t dimension() const;
    const std::filesystem::path& directory() const { return dir_; }
    bool isWritable() const;
    std::vector<std::string> texts() const;

    std::filesystem::path indexPath() const { return dir_ / kIndexFileName; }
    std::filesystem::path textsPath() const { return dir_ / kTextsFileName; }

private:
    IndexStore(std::filesystem::path dir, size_t dimension, const IndexStoreOptions& options);

    Result<void> loadArtifacts();
    Result<void> persistLocked() const;
    void restorePersistedLocked() const;

    std::filesystem::path dir_;
    size_t dimension_ = 0;
    std::vector<float> vectors_; // packed, size() == texts_.size() * dimension_
    std::vector<std::string> texts_;
    std::unique_ptr<storage::FileLock> lock_;
    mutable std::shared_mutex mutex_;
};

} // namespace evistore::vector
