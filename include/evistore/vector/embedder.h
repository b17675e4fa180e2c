#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <evistore/core/types.h>

namespace evistore::vector {

/**
 * Abstract interface for text embedders.
 *
 * Implementations map each input string to a vector of exactly dimension()
 * floats. encode() is called from the retrieval worker pool, so implementations
 * must tolerate being invoked from a thread other than the one that created them.
 */
class IEmbedder {
public:
    virtual ~IEmbedder() = default;

    /// One embedding per input text, in input order
    virtual Result<std::vector<Embedding>> encode(std::span<const std::string> texts) = 0;

    virtual size_t dimension() const = 0;
    virtual std::string name() const = 0;
};

/**
 * Deterministic feature-hashing embedder.
 *
 * Lower-cased word unigrams and adjacent bigrams are hashed with FNV-1a (64-bit)
 * into dimension() signed buckets and the result is L2-normalized. Output depends
 * only on the input bytes, so it is stable across runs and platforms. Texts with
 * no words map to the zero vector.
 */
class HashingEmbedder : public IEmbedder {
public:
    static constexpr size_t kDefaultDimension = 384;

    explicit HashingEmbedder(size_t dimension = kDefaultDimension);

    Result<std::vector<Embedding>> encode(std::span<const std::string> texts) override;
    size_t dimension() const override { return dimension_; }
    std::string name() const override { return "hashing"; }

    /// Single-text form used by encode()
    Embedding embed(std::string_view text) const;

    /// Lower-cased ASCII alphanumeric words; bytes >= 0x80 stay inside words
    static std::vector<std::string> tokenize(std::string_view text);

private:
    void accumulate(Embedding& out, std::string_view feature) const;

    size_t dimension_;
};

namespace embedding_utils {

uint64_t fnv1a64(std::string_view data);

/**
 * Normalize an embedding to unit length (zero vectors are returned unchanged)
 */
Embedding normalize(const Embedding& embedding);

double computeMagnitude(const Embedding& embedding);

bool isUnitLength(const Embedding& embedding, double tolerance = 1e-4);

/**
 * Validate embedding dimensions and values
 */
bool validateEmbedding(const Embedding& embedding, size_t expected_dim);

} // namespace embedding_utils

} // namespace evistore::vector
