// Catch2 tests for the feature-hashing embedder

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include <evistore/vector/embedder.h>

using namespace evistore;
using namespace evistore::vector;

TEST_CASE("HashingEmbedder - tokenize", "[vector][embedder][catch2]") {
    CHECK(HashingEmbedder::tokenize("Hello, World!") == std::vector<std::string>{"hello", "world"});
    CHECK(HashingEmbedder::tokenize("  ") == std::vector<std::string>{});
    CHECK(HashingEmbedder::tokenize("gen-z 2024") ==
          std::vector<std::string>{"gen", "z", "2024"});
    CHECK(HashingEmbedder::tokenize("Caf\xC3\xA9 au lait") ==
          std::vector<std::string>{"caf\xC3\xA9", "au", "lait"});
}

TEST_CASE("HashingEmbedder - output shape and norm", "[vector][embedder][catch2]") {
    HashingEmbedder embedder(64);
    CHECK(embedder.dimension() == 64);
    CHECK(embedder.name() == "hashing");

    const std::vector<std::string> texts{"young professionals love coffee", "", "!!!"};
    auto encoded = embedder.encode(texts);
    REQUIRE(encoded);
    REQUIRE(encoded.value().size() == 3);

    CHECK(embedding_utils::validateEmbedding(encoded.value()[0], 64));
    CHECK(embedding_utils::isUnitLength(encoded.value()[0]));

    // No words: zero vector
    for (size_t i = 1; i < 3; ++i) {
        CHECK(embedding_utils::computeMagnitude(encoded.value()[i]) == 0.0);
    }
}

TEST_CASE("HashingEmbedder - deterministic and case-insensitive", "[vector][embedder][catch2]") {
    HashingEmbedder a(128);
    HashingEmbedder b(128);

    CHECK(a.embed("Budget travelers") == b.embed("Budget travelers"));
    CHECK(a.embed("BUDGET travelers") == a.embed("budget, travelers."));
}

TEST_CASE("HashingEmbedder - shared words are closer than unrelated text",
          "[vector][embedder][catch2]") {
    HashingEmbedder embedder(256);
    auto dist = [](const Embedding& x, const Embedding& y) {
        double sum = 0.0;
        for (size_t i = 0; i < x.size(); ++i) {
            const double d = x[i] - y[i];
            sum += d * d;
        }
        return sum;
    };

    const auto query = embedder.embed("coffee lovers");
    const auto related = embedder.embed("coffee lovers in the city");
    const auto unrelated = embedder.embed("mountain bike repair");
    CHECK(dist(query, related) < dist(query, unrelated));
}

TEST_CASE("HashingEmbedder - zero dimension is rejected", "[vector][embedder][catch2]") {
    CHECK_THROWS_AS(HashingEmbedder(0), std::invalid_argument);
}

TEST_CASE("EmbeddingUtils - helpers", "[vector][embedder][catch2]") {
    CHECK(embedding_utils::fnv1a64("") == 14695981039346656037ULL);
    CHECK(embedding_utils::fnv1a64("a") == 0xaf63dc4c8601ec8cULL);

    const Embedding v{3.0f, 4.0f};
    CHECK(embedding_utils::computeMagnitude(v) == Catch::Approx(5.0));
    const auto n = embedding_utils::normalize(v);
    CHECK(n[0] == Catch::Approx(0.6f));
    CHECK(n[1] == Catch::Approx(0.8f));

    const Embedding zero(3, 0.0f);
    CHECK(embedding_utils::normalize(zero) == zero);
    CHECK_FALSE(embedding_utils::isUnitLength(zero));

    CHECK_FALSE(embedding_utils::validateEmbedding(v, 3));
    CHECK_FALSE(embedding_utils::validateEmbedding(
        Embedding{std::numeric_limits<float>::quiet_NaN(), 0.0f}, 2));
}
