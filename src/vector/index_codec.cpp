#include <evistore/vector/index_codec.h>

#include <nlohmann/json.hpp>
#include <fmt/format.h>

#include <cstring>
#include <limits>

namespace evistore::vector::codec {

using json = nlohmann::json;

namespace {

template <typename T> void putScalar(std::vector<std::byte>& out, size_t offset, T value) {
    std::memcpy(out.data() + offset, &value, sizeof(T));
}

template <typename T> T getScalar(std::span<const std::byte> in, size_t offset) {
    T value{};
    std::memcpy(&value, in.data() + offset, sizeof(T));
    return value;
}

Error corrupted(std::string message) {
    return Error{ErrorCode::CorruptedData, std::move(message)};
}

} // namespace

// ============================================================================
// index.bin
// ============================================================================

std::vector<std::byte> encodeIndex(uint32_t dimension, std::span<const float> vectors) {
    const uint64_t count = dimension == 0 ? 0 : vectors.size() / dimension;
    const size_t payload = vectors.size() * sizeof(float);

    std::vector<std::byte> out(kIndexHeaderSize + payload);
    std::memcpy(out.data(), kIndexMagic, sizeof(kIndexMagic));
    putScalar<uint32_t>(out, 8, kIndexVersion);
    putScalar<uint32_t>(out, 12, kMetricSquaredL2);
    putScalar<uint32_t>(out, 16, dimension);
    putScalar<uint32_t>(out, 20, 0);
    putScalar<uint64_t>(out, 24, count);
    if (payload > 0) {
        std::memcpy(out.data() + kIndexHeaderSize, vectors.data(), payload);
    }
    return out;
}

Result<DecodedIndex> decodeIndex(std::span<const std::byte> bytes) {
    if (bytes.size() < kIndexHeaderSize) {
        return corrupted(fmt::format("index too short: {} bytes", bytes.size()));
    }
    if (std::memcmp(bytes.data(), kIndexMagic, sizeof(kIndexMagic)) != 0) {
        return corrupted("bad index magic");
    }

    const auto version = getScalar<uint32_t>(bytes, 8);
    if (version != kIndexVersion) {
        return corrupted(fmt::format("unsupported index version {}", version));
    }
    const auto metric = getScalar<uint32_t>(bytes, 12);
    if (metric != kMetricSquaredL2) {
        return corrupted(fmt::format("unsupported metric {}", metric));
    }

    DecodedIndex decoded;
    decoded.dimension = getScalar<uint32_t>(bytes, 16);
    decoded.count = getScalar<uint64_t>(bytes, 24);

    if (decoded.dimension == 0 && decoded.count != 0) {
        return corrupted("index has vectors but no dimension");
    }

    const uint64_t payload = bytes.size() - kIndexHeaderSize;
    const uint64_t perVector = static_cast<uint64_t>(decoded.dimension) * sizeof(float);
    if (perVector != 0 && decoded.count > std::numeric_limits<uint64_t>::max() / perVector) {
        return corrupted("index count overflows");
    }
    if (decoded.count * perVector != payload) {
        return corrupted(fmt::format("index size mismatch: header says {} x {}, payload {} bytes",
                                     decoded.count, decoded.dimension, payload));
    }

    decoded.vectors.resize(static_cast<size_t>(payload / sizeof(float)));
    if (payload > 0) {
        std::memcpy(decoded.vectors.data(), bytes.data() + kIndexHeaderSize,
                    static_cast<size_t>(payload));
    }
    return decoded;
}

// ============================================================================
// texts.dat
// ============================================================================

std::string encodeTexts(const std::vector<std::string>& texts, uint32_t dimension,
                        const std::string& indexSha256) {
    json doc;
    doc["format"] = std::string(kTextsFormat);
    doc["version"] = kTextsVersion;
    doc["count"] = texts.size();
    doc["dimension"] = dimension;
    doc["index_sha256"] = indexSha256;
    doc["texts"] = texts;
    return doc.dump();
}

Result<DecodedTexts> decodeTexts(std::string_view text) {
    json doc;
    try {
        doc = json::parse(std::string(text));
    } catch (const json::parse_error& e) {
        return corrupted(fmt::format("texts parse error: {}", e.what()));
    }

    if (!doc.is_object()) {
        return corrupted("texts document is not an object");
    }

    auto field = [&](const char* name) -> const json* {
        auto it = doc.find(name);
        return it == doc.end() ? nullptr : &*it;
    };

    const json* format = field("format");
    if (!format || !format->is_string() || format->get<std::string>() != kTextsFormat) {
        return corrupted("texts format tag missing or wrong");
    }
    const json* version = field("version");
    if (!version || !version->is_number_unsigned() || version->get<uint64_t>() != kTextsVersion) {
        return corrupted("unsupported texts version");
    }

    const json* count = field("count");
    const json* dimension = field("dimension");
    const json* digest = field("index_sha256");
    const json* texts = field("texts");
    if (!count || !count->is_number_unsigned() || !dimension ||
        !dimension->is_number_unsigned() || !digest || !digest->is_string() || !texts ||
        !texts->is_array()) {
        return corrupted("texts document is missing required fields");
    }
    if (dimension->get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
        return corrupted("texts dimension out of range");
    }

    DecodedTexts decoded;
    decoded.count = count->get<uint64_t>();
    decoded.dimension = static_cast<uint32_t>(dimension->get<uint64_t>());
    decoded.indexSha256 = digest->get<std::string>();
    decoded.texts.reserve(texts->size());
    for (const auto& entry : *texts) {
        if (!entry.is_string()) {
            return corrupted("texts entry is not a string");
        }
        decoded.texts.push_back(entry.get<std::string>());
    }

    if (decoded.texts.size() != decoded.count) {
        return corrupted(fmt::format("texts count {} but {} entries", decoded.count,
                                     decoded.texts.size()));
    }
    return decoded;
}

} // namespace evistore::vector::codec
