#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <evistore/core/types.h>

namespace evistore::config {

/**
 * Resolved runtime settings.
 *
 * Every field is resolved as environment > config file > built-in default.
 * CLI flags are applied on top by the caller.
 */
struct EvistoreConfig {
    std::filesystem::path configPath;

    // [store]
    std::filesystem::path storePath;

    // [keyword]
    std::filesystem::path csvPath{"data.csv"};
    size_t keywordMaxResults = 100;

    // [embedding]
    size_t embeddingDimension = 384;

    // [retrieval]
    size_t batchSize = 100;
    size_t vectorLimit = 50;
    size_t maxEvidence = 100;
    std::chrono::milliseconds embedTimeout{5000};
    bool parallelSources = true;

    // [log]
    std::string logLevel{"warn"};

    /// Defaults only, no file or environment lookups beyond the data directory
    static EvistoreConfig defaults();

    /**
     * Load settings from `configPath` (a missing file is not an error) and the
     * environment. Malformed numeric or boolean values yield InvalidArgument
     * naming the offending key.
     */
    static Result<EvistoreConfig> load(const std::filesystem::path& configPath);
};

} // namespace evistore::config
