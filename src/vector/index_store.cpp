#include <evistore/common/utf8_utils.h>
#include <evistore/crypto/hasher.h>
#include <evistore/storage/atomic_file_writer.h>
#include <evistore/storage/file_lock.h>
#include <evistore/vector/embedder.h>
#include <evistore/vector/index_codec.h>
#include <evistore/vector/index_store.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>
#include <limits>
#include <mutex>
#include <system_error>

namespace evistore::vector {

namespace fs = std::filesystem;

namespace {

Result<std::vector<std::byte>> readFileBytes(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error{ErrorCode::FileNotFound, fmt::format("cannot open {}", path.string())};
    }
    std::vector<char> raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Error{ErrorCode::IOError, fmt::format("read failed: {}", path.string())};
    }
    std::vector<std::byte> bytes(raw.size());
    std::transform(raw.begin(), raw.end(), bytes.begin(),
                   [](char c) { return static_cast<std::byte>(c); });
    return bytes;
}

float squaredL2(const float* a, const float* b, size_t dim) {
    float sum = 0.0f;
    for (size_t i = 0; i < dim; ++i) {
        const float d = a[i] - b[i];
        sum += d * d;
    }
    return sum;
}

} // namespace

// ============================================================================
// Construction / load
// ============================================================================

IndexStore::IndexStore(fs::path dir, size_t dimension, const IndexStoreOptions& options)
    : dir_(std::move(dir)), dimension_(dimension) {
    if (options.readOnly) {
        return;
    }

    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        spdlog::warn("Cannot create store directory {}: {}; store is read-only", dir_.string(),
                     ec.message());
        return;
    }

    lock_ = std::make_unique<storage::FileLock>(dir_ / kLockFileName);
    if (!lock_->locked()) {
        spdlog::warn("Store {} is locked by another process; opening read-only", dir_.string());
    }
}

IndexStore::~IndexStore() = default;

std::unique_ptr<IndexStore> IndexStore::createEmpty(const fs::path& dir, size_t dimension,
                                                    const IndexStoreOptions& options) {
    return std::unique_ptr<IndexStore>(new IndexStore(dir, dimension, options));
}

std::unique_ptr<IndexStore> IndexStore::open(const fs::path& dir, const IndexStoreOptions& options) {
    auto store = createEmpty(dir, 0, options);

    std::error_code ec;
    const bool hasIndex = fs::exists(store->indexPath(), ec);
    const bool hasTexts = fs::exists(store->textsPath(), ec);
    if (!hasIndex && !hasTexts) {
        spdlog::debug("No existing store in {}", dir.string());
        return store;
    }

    auto loaded = store->loadArtifacts();
    if (!loaded) {
        spdlog::warn("Ignoring store in {}: {}; starting empty", dir.string(),
                     loaded.error().message);
        store->dimension_ = 0;
        store->vectors_.clear();
        store->texts_.clear();
        return store;
    }

    spdlog::info("Loaded {} entries (dimension {}) from {}", store->texts_.size(),
                 store->dimension_, dir.string());
    return store;
}

Result<void> IndexStore::loadArtifacts() {
    auto indexBytes = readFileBytes(indexPath());
    if (!indexBytes) {
        return indexBytes.error();
    }
    auto textsBytes = readFileBytes(textsPath());
    if (!textsBytes) {
        return textsBytes.error();
    }

    auto index = codec::decodeIndex(indexBytes.value());
    if (!index) {
        return index.error();
    }

    const auto& raw = textsBytes.value();
    auto texts = codec::decodeTexts(
        std::string_view(reinterpret_cast<const char*>(raw.data()), raw.size()));
    if (!texts) {
        return texts.error();
    }

    const auto& idx = index.value();
    const auto& txt = texts.value();
    if (txt.count != idx.count) {
        return Error{ErrorCode::CorruptedData,
                     fmt::format("index holds {} vectors but texts hold {}", idx.count, txt.count)};
    }
    if (txt.dimension != idx.dimension) {
        return Error{ErrorCode::CorruptedData,
                     fmt::format("index dimension {} but texts record {}", idx.dimension,
                                 txt.dimension)};
    }

    std::string digest;
    try {
        digest = crypto::SHA256Hasher::hash(indexBytes.value());
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError, e.what()};
    }
    if (digest != txt.indexSha256) {
        return Error{ErrorCode::CorruptedData, "index digest does not match texts"};
    }
    const auto& data = index.value().vectors;
    if (std::any_of(data.begin(), data.end(), [](float v) { return !std::isfinite(v); })) {
        return Error{ErrorCode::CorruptedData, "index holds non-finite values"};
    }

    dimension_ = idx.dimension;
    vectors_ = std::move(index.value().vectors);
    texts_ = std::move(texts.value().texts);
    return {};
}

// ============================================================================
// Mutation
// ============================================================================

Result<void> IndexStore::add(const std::vector<Embedding>& vectors,
                             const std::vector<std::string>& texts) {
    if (vectors.size() != texts.size()) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("{} vectors but {} texts", vectors.size(), texts.size())};
    }
    if (vectors.empty()) {
        return {};
    }

    std::unique_lock lock(mutex_);

    if (!isWritable()) {
        return Error{ErrorCode::InvalidState,
                     fmt::format("store {} is read-only", dir_.string())};
    }

    const size_t dim = dimension_ != 0 ? dimension_ : vectors.front().size();
    if (dim == 0 || dim > std::numeric_limits<uint32_t>::max()) {
        return Error{ErrorCode::DimensionMismatch, fmt::format("unusable dimension {}", dim)};
    }
    for (size_t i = 0; i < vectors.size(); ++i) {
        if (vectors[i].size() != dim) {
            return Error{ErrorCode::DimensionMismatch,
                         fmt::format("vector {} has dimension {}, expected {}", i,
                                     vectors[i].size(), dim)};
        }
        // NaN or infinite components would break distance ordering for every search
        if (!embedding_utils::validateEmbedding(vectors[i], dim)) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("vector {} has non-finite components", i)};
        }
    }
    for (size_t i = 0; i < texts.size(); ++i) {
        if (!common::isValidUtf8(texts[i])) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("text {} is not valid UTF-8", i)};
        }
    }

    const size_t prevDimension = dimension_;
    const size_t prevVectors = vectors_.size();
    const size_t prevTexts = texts_.size();

    dimension_ = dim;
    vectors_.reserve(prevVectors + vectors.size() * dim);
    for (const auto& v : vectors) {
        vectors_.insert(vectors_.end(), v.begin(), v.end());
    }
    texts_.insert(texts_.end(), texts.begin(), texts.end());

    auto persisted = persistLocked();
    if (!persisted) {
        spdlog::error("Persisting {} failed ({}); rolling back {} entries", dir_.string(),
                      persisted.error().message, texts.size());
        vectors_.resize(prevVectors);
        texts_.resize(prevTexts);
        dimension_ = prevDimension;
        restorePersistedLocked();
        return Error{ErrorCode::IOError, persisted.error().message};
    }

    spdlog::debug("Added {} entries to {} (total {})", texts.size(), dir_.string(), texts_.size());
    return {};
}

Result<void> IndexStore::persistLocked() const {
    const storage::AtomicFileWriter writer{};

    const auto indexBytes = codec::encodeIndex(static_cast<uint32_t>(dimension_), vectors_);
    std::string textsDoc;
    try {
        const auto digest = crypto::SHA256Hasher::hash(indexBytes);
        textsDoc = codec::encodeTexts(texts_, static_cast<uint32_t>(dimension_), digest);
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::InvalidArgument, e.what()};
    } catch (const std::runtime_error& e) {
        return Error{ErrorCode::InternalError, e.what()};
    }

    // Stage both before touching either target so a staging failure leaves disk untouched
    auto stagedIndex = writer.stage(indexPath(), indexBytes);
    if (!stagedIndex) {
        return stagedIndex.error();
    }
    auto stagedTexts =
        writer.stage(textsPath(), std::as_bytes(std::span(textsDoc.data(), textsDoc.size())));
    if (!stagedTexts) {
        return stagedTexts.error();
    }

    // Index first, texts last
    if (auto r = writer.commit(stagedIndex.value()); !r) {
        return r;
    }
    return writer.commit(stagedTexts.value());
}

void IndexStore::restorePersistedLocked() const {
    if (texts_.empty()) {
        // Nothing was ever persisted by this store; leftovers fail the digest check on load
        return;
    }
    if (auto r = persistLocked(); !r) {
        spdlog::error("Could not restore previous state of {}: {}", dir_.string(),
                      r.error().message);
    }
}

// ============================================================================
// Queries
// ============================================================================

Result<std::vector<Neighbor>> IndexStore::search(const Embedding& query, size_t k) const {
    std::shared_lock lock(mutex_);

    if (texts_.empty() || k == 0) {
        return std::vector<Neighbor>{};
    }
    if (query.size() != dimension_) {
        return Error{ErrorCode::DimensionMismatch,
                     fmt::format("query has dimension {}, store has {}", query.size(),
                                 dimension_)};
    }
    if (!embedding_utils::validateEmbedding(query, dimension_)) {
        return Error{ErrorCode::InvalidArgument, "query has non-finite components"};
    }

    std::vector<std::pair<float, size_t>> distances;
    distances.reserve(texts_.size());
    for (size_t i = 0; i < texts_.size(); ++i) {
        distances.emplace_back(squaredL2(query.data(), vectors_.data() + i * dimension_, dimension_),
                               i);
    }

    // Pair ordering breaks distance ties by lower ordinal
    const size_t resultSize = std::min(k, distances.size());
    std::partial_sort(distances.begin(), distances.begin() + resultSize, distances.end());

    std::vector<Neighbor> results;
    results.reserve(resultSize);
    for (size_t i = 0; i < resultSize; ++i) {
        results.push_back(Neighbor{texts_[distances[i].second], distances[i].first,
                                   distances[i].second});
    }
    return results;
}

size_t IndexStore::size() const {
    std::shared_lock lock(mutex_);
    return texts_.size();
}

size_t IndexStore::dimension() const {
    std::shared_lock lock(mutex_);
    return dimension_;
}

bool IndexStore::isWritable() const {
    return lock_ && lock_->locked();
}

std::vector<std::string> IndexStore::texts() const {
    std::shared_lock lock(mutex_);
    return texts_;
}

} // namespace evistore::vector
