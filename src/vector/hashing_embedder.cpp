#include <evistore/vector/embedder.h>

#include <spdlog/spdlog.h>

#include <cmath>
#include <stdexcept>

namespace evistore::vector {

namespace {
constexpr uint64_t kFnvOffsetBasis = 14695981039346656037ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;

bool isWordByte(unsigned char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           c >= 0x80;
}
} // namespace

// ============================================================================
// HashingEmbedder
// ============================================================================

HashingEmbedder::HashingEmbedder(size_t dimension) : dimension_(dimension) {
    if (dimension_ == 0) {
        throw std::invalid_argument("HashingEmbedder dimension must be positive");
    }
    spdlog::debug("HashingEmbedder created with dimension {}", dimension_);
}

std::vector<std::string> HashingEmbedder::tokenize(std::string_view text) {
    std::vector<std::string> words;
    std::string current;
    for (unsigned char c : text) {
        if (isWordByte(c)) {
            if (c >= 'A' && c <= 'Z')
                c = static_cast<unsigned char>(c - 'A' + 'a');
            current.push_back(static_cast<char>(c));
        } else if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        words.push_back(std::move(current));
    }
    return words;
}

void HashingEmbedder::accumulate(Embedding& out, std::string_view feature) const {
    const uint64_t h = embedding_utils::fnv1a64(feature);
    const size_t bucket = static_cast<size_t>(h % dimension_);
    const float sign = (h >> 63) ? -1.0f : 1.0f;
    out[bucket] += sign;
}

Embedding HashingEmbedder::embed(std::string_view text) const {
    Embedding vec(dimension_, 0.0f);
    auto words = tokenize(text);

    std::string feature;
    for (size_t i = 0; i < words.size(); ++i) {
        feature.assign("w:").append(words[i]);
        accumulate(vec, feature);
        if (i + 1 < words.size()) {
            feature.assign("b:").append(words[i]).append(" ").append(words[i + 1]);
            accumulate(vec, feature);
        }
    }

    return embedding_utils::normalize(vec);
}

Result<std::vector<Embedding>> HashingEmbedder::encode(std::span<const std::string> texts) {
    std::vector<Embedding> embeddings;
    embeddings.reserve(texts.size());
    for (const auto& text : texts) {
        embeddings.push_back(embed(text));
    }
    return embeddings;
}

// ============================================================================
// embedding_utils
// ============================================================================

namespace embedding_utils {

uint64_t fnv1a64(std::string_view data) {
    uint64_t hash = kFnvOffsetBasis;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= kFnvPrime;
    }
    return hash;
}

Embedding normalize(const Embedding& embedding) {
    const double norm = computeMagnitude(embedding);
    if (norm == 0.0) {
        return embedding;
    }

    Embedding normalized;
    normalized.reserve(embedding.size());
    for (float val : embedding) {
        normalized.push_back(static_cast<float>(val / norm));
    }
    return normalized;
}

double computeMagnitude(const Embedding& embedding) {
    double magnitude = 0.0;
    for (float val : embedding) {
        magnitude += static_cast<double>(val) * static_cast<double>(val);
    }
    return std::sqrt(magnitude);
}

bool isUnitLength(const Embedding& embedding, double tolerance) {
    return std::abs(computeMagnitude(embedding) - 1.0) <= tolerance;
}

bool validateEmbedding(const Embedding& embedding, size_t expected_dim) {
    if (embedding.size() != expected_dim) {
        return false;
    }
    for (float val : embedding) {
        if (!std::isfinite(val)) {
            return false;
        }
    }
    return true;
}

} // namespace embedding_utils

} // namespace evistore::vector
