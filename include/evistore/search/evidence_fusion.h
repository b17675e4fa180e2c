#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include <evistore/search/keyword_store.h>
#include <evistore/search/retrieval_engine.h>

namespace evistore::search {

struct FusionConfig {
    size_t vectorLimit = 50;
    size_t maxEvidence = 100;
    // Query both sources concurrently; the merged order is the same either way
    bool parallelSources = true;
};

/**
 * Bounded, deduplicated union of vector and keyword evidence.
 *
 * Order: vector hits nearest first, then keyword hits in their source order;
 * the first occurrence of each string wins and the list is cut at maxEvidence.
 * Either source may be null, in which case it is skipped. gather() never throws.
 */
class EvidenceFusion {
public:
    EvidenceFusion(std::shared_ptr<RetrievalEngine> retrieval,
                   std::shared_ptr<IKeywordStore> keywords, FusionConfig config = {});

    std::vector<std::string> gather(const std::string& audience) const;

    const FusionConfig& config() const { return config_; }

    /// Merge step on its own, exposed for callers that fetch sources themselves
    static std::vector<std::string> merge(const std::vector<std::string>& vectorHits,
                                          const std::vector<std::string>& keywordHits,
                                          size_t maxEvidence);

private:
    std::vector<std::string> fetchVector(const std::string& audience) const;
    std::vector<std::string> fetchKeyword(const std::string& audience) const;

    std::shared_ptr<RetrievalEngine> retrieval_;
    std::shared_ptr<IKeywordStore> keywords_;
    FusionConfig config_;
};

} // namespace evistore::search
