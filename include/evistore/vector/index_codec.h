#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <evistore/core/types.h>

namespace evistore::vector::codec {

// index.bin header layout (version 1), all integers in host byte order
inline constexpr char kIndexMagic[8] = {'E', 'V', 'S', 'T', 'I', 'D', 'X', '\0'};
inline constexpr uint32_t kIndexVersion = 1;
inline constexpr uint32_t kMetricSquaredL2 = 1;
inline constexpr size_t kIndexHeaderSize = 32;

inline constexpr std::string_view kTextsFormat = "evistore.texts";
inline constexpr uint32_t kTextsVersion = 1;

struct DecodedIndex {
    uint32_t dimension = 0;
    uint64_t count = 0;
    std::vector<float> vectors; // count * dimension, insertion order
};

struct DecodedTexts {
    uint64_t count = 0;
    uint32_t dimension = 0;
    std::string indexSha256;
    std::vector<std::string> texts;
};

/// Serialize packed vectors; `vectors.size()` must be a multiple of `dimension`
std::vector<std::byte> encodeIndex(uint32_t dimension, std::span<const float> vectors);

/**
 * Parse an index.bin image. Rejects bad magic, unknown version or metric,
 * a zero dimension with a non-zero count, and any size other than
 * exactly header + 4 * count * dimension bytes (CorruptedData).
 */
Result<DecodedIndex> decodeIndex(std::span<const std::byte> bytes);

/// Serialize the texts.dat JSON document
std::string encodeTexts(const std::vector<std::string>& texts, uint32_t dimension,
                        const std::string& indexSha256);

/// Parse texts.dat; count must equal the number of texts (CorruptedData otherwise)
Result<DecodedTexts> decodeTexts(std::string_view json);

} // namespace evistore::vector::codec
