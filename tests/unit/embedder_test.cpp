#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cmath>

#include "engine/embedder.hpp"
#include "engine/http.hpp"
#include "engine/vector_store.hpp"
#include "test_support.hpp"

using namespace ragmill;
using namespace ragmill::engine;
using Catch::Matchers::WithinAbs;

TEST_CASE("hash embedder is deterministic and normalized", "[embedder]") {
    auto embedder = create_hash_embedder(64);
    REQUIRE(embedder->dimension() == 64);
    CHECK(embedder->model_id() == "hash:fnv-64");

    auto a = embedder->embed("The quick brown fox");
    auto b = embedder->embed("the QUICK brown fox");
    REQUIRE(a.size() == 64);
    CHECK(a == b);

    double norm = 0.0;
    for (float v : a) norm += v * v;
    CHECK_THAT(std::sqrt(norm), WithinAbs(1.0, 1e-5));

    auto empty = embedder->embed("");
    CHECK(empty == std::vector<float>(64, 0.0f));
}

TEST_CASE("hash embedder ranks overlapping text higher", "[embedder]") {
    auto embedder = create_hash_embedder(256);
    auto query = embedder->embed("vector database indexing");
    auto close = embedder->embed("indexing a vector database");
    auto far = embedder->embed("baking sourdough bread");

    float s_close = VectorStore::similarity(Metric::Cosine, query.data(), close.data(), query.size());
    float s_far = VectorStore::similarity(Metric::Cosine, query.data(), far.data(), query.size());
    CHECK(s_close > s_far);
}

TEST_CASE("input clipping respects UTF-8 boundaries", "[embedder]") {
    std::string text = "ab\xE6\x97\xA5";
    CHECK(Embedder::clip_input(text, 10) == text);
    CHECK(Embedder::clip_input(text, 4) == "ab");
    CHECK(Embedder::clip_input(text, 2) == "ab");
}

TEST_CASE("embedder factory follows the configured backend", "[embedder]") {
    Config config;
    config.embedding_backend = "hash";
    config.embedding_model = "unit";
    config.embedding_dimension = 16;
    auto embedder = create_embedder(config);
    CHECK(embedder->model_id() == "hash:unit-16");

    config.embedding_backend = "ollama";
    config.embedding_model = "all-minilm";
    CHECK(create_embedder(config)->model_id() == "ollama:all-minilm");

    config.embedding_backend = "openai";
    config.openai_key.clear();
    CHECK_THROWS_AS(create_embedder(config), ValidationError);

    config.embedding_backend = "sentencepiece";
    CHECK_THROWS_AS(create_embedder(config), ValidationError);
}

TEST_CASE("unreachable embedding service is a retryable failure", "[embedder]") {
    auto embedder = create_ollama_embedder("all-minilm", "http://127.0.0.1:1/api/embeddings", 384, 2048);
    try {
        embedder->embed("hello");
        FAIL("expected EmbeddingError");
    } catch (const EmbeddingError& e) {
        CHECK(e.retryable());
    }
}

TEST_CASE("http status classification", "[embedder]") {
    CHECK(http::is_retryable_status(429));
    CHECK(http::is_retryable_status(503));
    CHECK(http::is_retryable_status(408));
    CHECK_FALSE(http::is_retryable_status(400));
    CHECK_FALSE(http::is_retryable_status(401));
    CHECK_FALSE(http::is_retryable_status(200));
}
