#include <evistore/search/retrieval_engine.h>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <span>
#include <stdexcept>

namespace evistore::search {

class RetrievalEngine::Impl {
public:
    Impl(std::shared_ptr<vector::IEmbedder> embedder, std::shared_ptr<vector::IndexStore> store,
         RetrievalConfig config)
        : embedder_(std::move(embedder)), store_(std::move(store)), config_(config),
          pool_(std::max<size_t>(1, config.workerThreads)) {
        if (!embedder_ || !store_) {
            throw std::invalid_argument("RetrievalEngine requires an embedder and a store");
        }
        if (config_.batchSize == 0) {
            config_.batchSize = 1;
        }
    }

    ~Impl() {
        pool_.stop();
        pool_.join();
    }

    template <typename T> struct BoundedTask {
        std::promise<void> started;
        std::promise<Result<T>> done;
        std::atomic<bool> abandoned{false};
    };

    // Run `fn` on the pool. With a timeout set, the call waits up to embedTimeout for a
    // worker to pick the task up, then up to embedTimeout for it to finish. A task
    // abandoned while still queued is skipped when its turn comes.
    template <typename T, typename Fn> Result<T> runBounded(Fn fn, const char* what) {
        auto task = std::make_shared<BoundedTask<T>>();
        auto started = task->started.get_future();
        auto future = task->done.get_future();

        boost::asio::post(pool_, [task, fn = std::move(fn)]() mutable {
            if (task->abandoned.load()) {
                return;
            }
            task->started.set_value();
            try {
                task->done.set_value(fn());
            } catch (...) {
                task->done.set_exception(std::current_exception());
            }
        });

        const auto timeout = config_.embedTimeout;
        if (timeout.count() > 0) {
            if (started.wait_for(timeout) != std::future_status::ready) {
                task->abandoned.store(true);
                spdlog::warn("{} not started after {} ms; all workers busy", what,
                             timeout.count());
                return Error{ErrorCode::Timeout,
                             fmt::format("{} not started after {} ms", what, timeout.count())};
            }
            if (future.wait_for(timeout) != std::future_status::ready) {
                spdlog::warn("{} timed out after {} ms", what, timeout.count());
                return Error{ErrorCode::Timeout,
                             fmt::format("{} timed out after {} ms", what, timeout.count())};
            }
        }

        try {
            return future.get();
        } catch (const std::exception& e) {
            return Error{ErrorCode::EmbeddingError, fmt::format("{} failed: {}", what, e.what())};
        } catch (...) {
            return Error{ErrorCode::EmbeddingError,
                         fmt::format("{} failed: unknown exception", what)};
        }
    }

    Result<std::vector<Embedding>> embed(std::vector<std::string> texts) {
        const size_t expected = texts.size();
        auto result = runBounded<std::vector<Embedding>>(
            [embedder = embedder_, texts = std::move(texts)]() {
                return embedder->encode(std::span<const std::string>(texts));
            },
            "embedding");
        if (!result) {
            if (result.error().code == ErrorCode::Timeout) {
                return result;
            }
            return Error{ErrorCode::EmbeddingError, result.error().message};
        }
        if (result.value().size() != expected) {
            return Error{ErrorCode::EmbeddingError,
                         fmt::format("embedder returned {} vectors for {} texts",
                                     result.value().size(), expected)};
        }
        return result;
    }

    IndexingReport indexTexts(const std::vector<std::string>& texts,
                              const IndexingProgress& progress) {
        IndexingReport report;
        const size_t batchSize = config_.batchSize;
        report.batches = (texts.size() + batchSize - 1) / batchSize;

        for (size_t b = 0; b < report.batches; ++b) {
            const size_t begin = b * batchSize;
            const size_t end = std::min(texts.size(), begin + batchSize);
            std::vector<std::string> slice(texts.begin() + static_cast<std::ptrdiff_t>(begin),
                                           texts.begin() + static_cast<std::ptrdiff_t>(end));

            auto embeddings = embed(slice);
            Result<void> added = embeddings ? store_->add(embeddings.value(), slice)
                                            : Result<void>(embeddings.error());
            if (added) {
                report.indexed += slice.size();
                spdlog::info("Indexed batch {}/{} ({} texts)", b + 1, report.batches,
                             slice.size());
            } else {
                report.failedBatches++;
                report.failed += slice.size();
                spdlog::error("Batch {}/{} failed: {}", b + 1, report.batches,
                              added.error().message);
                report.errors.push_back(added.error());
            }

            if (progress) {
                progress(b, report.batches);
            }
        }

        return report;
    }

    Result<std::vector<vector::Neighbor>> queryWithDistances(const std::string& text, size_t k) {
        if (k == 0) {
            return std::vector<vector::Neighbor>{};
        }
        return runBounded<std::vector<vector::Neighbor>>(
            [embedder = embedder_, store = store_, text, k]() -> Result<std::vector<vector::Neighbor>> {
                auto embedded = embedder->encode(std::span<const std::string>(&text, 1));
                if (!embedded) {
                    return Error{ErrorCode::EmbeddingError, embedded.error().message};
                }
                if (embedded.value().size() != 1) {
                    return Error{ErrorCode::EmbeddingError, "embedder returned no vector"};
                }
                return store->search(embedded.value().front(), k);
            },
            "query");
    }

    std::shared_ptr<vector::IEmbedder> embedder_;
    std::shared_ptr<vector::IndexStore> store_;
    RetrievalConfig config_;
    boost::asio::thread_pool pool_;
};

// ============================================================================
// RetrievalEngine
// ============================================================================

RetrievalEngine::RetrievalEngine(std::shared_ptr<vector::IEmbedder> embedder,
                                 std::shared_ptr<vector::IndexStore> store, RetrievalConfig config)
    : pImpl(std::make_unique<Impl>(std::move(embedder), std::move(store), config)) {}

RetrievalEngine::~RetrievalEngine() = default;

IndexingReport RetrievalEngine::indexTexts(const std::vector<std::string>& texts,
                                           const IndexingProgress& progress) {
    return pImpl->indexTexts(texts, progress);
}

std::vector<std::string> RetrievalEngine::query(const std::string& text, size_t k) {
    auto result = pImpl->queryWithDistances(text, k);
    if (!result) {
        spdlog::warn("Vector query failed: {}", result.error().message);
        return {};
    }

    std::vector<std::string> texts;
    texts.reserve(result.value().size());
    for (auto& neighbor : result.value()) {
        texts.push_back(std::move(neighbor.text));
    }
    return texts;
}

Result<std::vector<vector::Neighbor>> RetrievalEngine::queryWithDistances(const std::string& text,
                                                                          size_t k) {
    return pImpl->queryWithDistances(text, k);
}

const RetrievalConfig& RetrievalEngine::config() const {
    return pImpl->config_;
}

vector::IndexStore& RetrievalEngine::store() {
    return *pImpl->store_;
}

vector::IEmbedder& RetrievalEngine::embedder() {
    return *pImpl->embedder_;
}

} // namespace evistore::search
