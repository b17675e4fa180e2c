// Test doubles for embedders, keyword stores and LLM clients

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <evistore/search/keyword_store.h>
#include <evistore/vector/embedder.h>
#include <evistore/workflow/llm_client.h>

namespace evistore::test {

/**
 * Embedder backed by a fixed text -> vector table. Unknown texts map to a
 * vector filled with `fallback`.
 */
class TableEmbedder : public vector::IEmbedder {
public:
    TableEmbedder(size_t dimension, std::map<std::string, Embedding> table, float fallback = 0.0f)
        : dimension_(dimension), table_(std::move(table)), fallback_(fallback) {}

    Result<std::vector<Embedding>> encode(std::span<const std::string> texts) override {
        calls++;
        std::vector<Embedding> out;
        for (const auto& t : texts) {
            auto it = table_.find(t);
            out.push_back(it != table_.end() ? it->second : Embedding(dimension_, fallback_));
        }
        return out;
    }

    size_t dimension() const override { return dimension_; }
    std::string name() const override { return "table"; }

    std::atomic<int> calls{0};

private:
    size_t dimension_;
    std::map<std::string, Embedding> table_;
    float fallback_;
};

/// Fails (or throws) on every call
class FailingEmbedder : public vector::IEmbedder {
public:
    explicit FailingEmbedder(bool throws = false) : throws_(throws) {}

    Result<std::vector<Embedding>> encode(std::span<const std::string>) override {
        if (throws_) {
            throw std::runtime_error("model crashed");
        }
        return Error{ErrorCode::EmbeddingError, "model unavailable"};
    }

    size_t dimension() const override { return 4; }
    std::string name() const override { return "failing"; }

private:
    bool throws_;
};

/// Wraps another embedder and sleeps before each call
class SlowEmbedder : public vector::IEmbedder {
public:
    SlowEmbedder(std::shared_ptr<vector::IEmbedder> inner, std::chrono::milliseconds delay)
        : SlowEmbedder(std::move(inner), std::vector<std::chrono::milliseconds>{delay}) {}

    /// Call i sleeps delays[i]; calls past the end reuse the last delay
    SlowEmbedder(std::shared_ptr<vector::IEmbedder> inner,
                 std::vector<std::chrono::milliseconds> delays)
        : inner_(std::move(inner)), delays_(std::move(delays)) {}

    Result<std::vector<Embedding>> encode(std::span<const std::string> texts) override {
        const size_t call = calls++;
        if (!delays_.empty()) {
            std::this_thread::sleep_for(delays_[std::min(call, delays_.size() - 1)]);
        }
        return inner_->encode(texts);
    }

    size_t dimension() const override { return inner_->dimension(); }
    std::string name() const override { return "slow"; }

    std::atomic<size_t> calls{0};

private:
    std::shared_ptr<vector::IEmbedder> inner_;
    std::vector<std::chrono::milliseconds> delays_;
};

/// Fails only on the Nth call (1-based)
class FailOnCallEmbedder : public vector::IEmbedder {
public:
    FailOnCallEmbedder(std::shared_ptr<vector::IEmbedder> inner, int failingCall)
        : inner_(std::move(inner)), failingCall_(failingCall) {}

    Result<std::vector<Embedding>> encode(std::span<const std::string> texts) override {
        if (++calls_ == failingCall_) {
            return Error{ErrorCode::EmbeddingError, "transient failure"};
        }
        return inner_->encode(texts);
    }

    size_t dimension() const override { return inner_->dimension(); }
    std::string name() const override { return "flaky"; }

private:
    std::shared_ptr<vector::IEmbedder> inner_;
    int failingCall_;
    std::atomic<int> calls_{0};
};

class FakeKeywordStore : public search::IKeywordStore {
public:
    explicit FakeKeywordStore(std::vector<std::string> results, bool throws = false)
        : results_(std::move(results)), throws_(throws) {}

    std::vector<std::string> search(const std::string& query) override {
        calls++;
        lastQuery = query;
        if (throws_) {
            throw std::runtime_error("keyword backend down");
        }
        return results_;
    }

    std::atomic<int> calls{0};
    std::string lastQuery;

private:
    std::vector<std::string> results_;
    bool throws_;
};

/// Returns scripted responses in order, repeating the last one
class FakeLlmClient : public workflow::ILlmClient {
public:
    explicit FakeLlmClient(std::vector<std::string> responses)
        : responses_(std::move(responses)) {}

    Result<std::string> complete(const std::string& prompt) override {
        std::lock_guard<std::mutex> lock(mutex_);
        prompts.push_back(prompt);
        if (fail) {
            return Error{ErrorCode::InternalError, "model offline"};
        }
        if (responses_.empty()) {
            return std::string{};
        }
        const size_t idx = std::min(prompts.size() - 1, responses_.size() - 1);
        return responses_[idx];
    }

    std::vector<std::string> prompts;
    bool fail = false;

private:
    std::vector<std::string> responses_;
    std::mutex mutex_;
};

} // namespace evistore::test
