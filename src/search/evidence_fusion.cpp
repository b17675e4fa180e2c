#include <evistore/search/evidence_fusion.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <future>
#include <unordered_set>

namespace evistore::search {

namespace {

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

} // namespace

EvidenceFusion::EvidenceFusion(std::shared_ptr<RetrievalEngine> retrieval,
                               std::shared_ptr<IKeywordStore> keywords, FusionConfig config)
    : retrieval_(std::move(retrieval)), keywords_(std::move(keywords)), config_(config) {}

std::vector<std::string> EvidenceFusion::fetchVector(const std::string& audience) const {
    if (!retrieval_) {
        return {};
    }
    try {
        return retrieval_->query(audience, config_.vectorLimit);
    } catch (const std::exception& e) {
        spdlog::error("Error searching vector store: {}", e.what());
        return {};
    } catch (...) {
        spdlog::error("Error searching vector store: unknown exception");
        return {};
    }
}

std::vector<std::string> EvidenceFusion::fetchKeyword(const std::string& audience) const {
    if (!keywords_) {
        return {};
    }
    try {
        return keywords_->search(audience);
    } catch (const std::exception& e) {
        spdlog::error("Error searching keyword store: {}", e.what());
        return {};
    } catch (...) {
        spdlog::error("Error searching keyword store: unknown exception");
        return {};
    }
}

std::vector<std::string> EvidenceFusion::gather(const std::string& audience) const {
    if (isBlank(audience)) {
        return {};
    }

    std::vector<std::string> vectorHits;
    std::vector<std::string> keywordHits;

    if (config_.parallelSources && retrieval_ && keywords_) {
        std::future<std::vector<std::string>> keywordFuture;
        try {
            keywordFuture =
                std::async(std::launch::async, [this, &audience]() { return fetchKeyword(audience); });
        } catch (const std::system_error& e) {
            spdlog::warn("Falling back to sequential evidence fetch: {}", e.what());
        }
        vectorHits = fetchVector(audience);
        keywordHits = keywordFuture.valid() ? keywordFuture.get() : fetchKeyword(audience);
    } else {
        vectorHits = fetchVector(audience);
        keywordHits = fetchKeyword(audience);
    }

    auto evidence = merge(vectorHits, keywordHits, config_.maxEvidence);
    spdlog::debug("Evidence for '{}': {} vector, {} keyword, {} after merge", audience,
                  vectorHits.size(), keywordHits.size(), evidence.size());
    return evidence;
}

std::vector<std::string> EvidenceFusion::merge(const std::vector<std::string>& vectorHits,
                                               const std::vector<std::string>& keywordHits,
                                               size_t maxEvidence) {
    std::vector<std::string> merged;
    std::unordered_set<std::string> seen;
    merged.reserve(std::min(maxEvidence, vectorHits.size() + keywordHits.size()));

    for (const auto* source : {&vectorHits, &keywordHits}) {
        for (const auto& item : *source) {
            if (merged.size() >= maxEvidence) {
                return merged;
            }
            if (seen.insert(item).second) {
                merged.push_back(item);
            }
        }
    }
    return merged;
}

} // namespace evistore::search
