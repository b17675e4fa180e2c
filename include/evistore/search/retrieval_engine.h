#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <evistore/core/types.h>
#include <evistore/vector/embedder.h>
#include <evistore/vector/index_store.h>

namespace evistore::search {

struct RetrievalConfig {
    size_t batchSize = 100;
    // Bound on each embed (and query embed+search) call, counted from when a worker
    // starts it; queueing for a worker is bounded separately by the same amount.
    // Zero disables both bounds.
    std::chrono::milliseconds embedTimeout{5000};
    size_t workerThreads = 2;
};

struct IndexingReport {
    size_t batches = 0;
    size_t failedBatches = 0;
    size_t indexed = 0;
    size_t failed = 0;
    std::vector<Error> errors;

    bool ok() const { return failedBatches == 0; }
};

/// Called after each slice with (zero-based slice index, slice count)
using IndexingProgress = std::function<void(size_t, size_t)>;

/**
 * Embeds texts into an IndexStore and answers similarity queries against it.
 *
 * Embedding and searching run on an internal worker pool and are awaited with
 * RetrievalConfig::embedTimeout. A slice whose embedding times out never reaches
 * the store.
 */
class RetrievalEngine {
public:
    RetrievalEngine(std::shared_ptr<vector::IEmbedder> embedder,
                    std::shared_ptr<vector::IndexStore> store, RetrievalConfig config = {});
    ~RetrievalEngine();

    RetrievalEngine(const RetrievalEngine&) = delete;
    RetrievalEngine& operator=(const RetrievalEngine&) = delete;

    /**
     * Embed and add `texts` in slices of batchSize. Failed slices are logged and
     * counted; slices committed before a failure stay committed.
     */
    IndexingReport indexTexts(const std::vector<std::string>& texts,
                              const IndexingProgress& progress = {});

    /// Texts of the k nearest entries; any failure is logged and yields an empty list
    std::vector<std::string> query(const std::string& text, size_t k);

    Result<std::vector<vector::Neighbor>> queryWithDistances(const std::string& text, size_t k);

    const RetrievalConfig& config() const;
    vector::IndexStore& store();
    vector::IEmbedder& embedder();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace evistore::search
