#include <catch2/catch_test_macros.hpp>

#include <cstdlib>

#include "engine/config.hpp"
#include "test_support.hpp"

using namespace ragmill;
using namespace ragmill::engine;
using ragmill::test::TempDir;
using ragmill::test::write_file;

TEST_CASE("missing config file yields defaults", "[config]") {
    TempDir dir;
    Config config = Config::load(dir / "absent.json");
    CHECK(config.chunking.chunk_size == 500);
    CHECK(config.chunking.overlap == 50);
    CHECK(config.default_top_k == 5);
    CHECK(config.metric == Metric::Cosine);
    CHECK_NOTHROW(config.validate());
}

TEST_CASE("config file values override defaults", "[config]") {
    TempDir dir;
    write_file(dir / "config.json", R"({
        "source_dir": "/srv/docs",
        "chunk_size": 300,
        "chunk_overlap": 30,
        "embedding_backend": "hash",
        "embedding_dimension": 64,
        "metric": "inner_product",
        "similarity_threshold": 0.25,
        "index_workers": 4,
        "retry_initial_backoff_ms": 10
    })");

    Config config = Config::load(dir / "config.json");
    CHECK(config.source_dir.string() == "/srv/docs");
    CHECK(config.chunking.chunk_size == 300);
    CHECK(config.chunking.overlap == 30);
    CHECK(config.embedding_backend == "hash");
    CHECK(config.embedding_dimension == 64);
    CHECK(config.metric == Metric::InnerProduct);
    REQUIRE(config.similarity_threshold);
    CHECK(*config.similarity_threshold == 0.25f);
    CHECK(config.index_workers == 4);
    CHECK(config.retry.initial_backoff == std::chrono::milliseconds(10));
}

TEST_CASE("config round-trips through save", "[config]") {
    TempDir dir;
    Config config;
    config.embedding_model = "nomic-embed-text";
    config.embedding_dimension = 768;
    config.default_top_k = 8;
    config.save(dir / "saved.json");

    Config loaded = Config::load(dir / "saved.json");
    CHECK(loaded.embedding_model == "nomic-embed-text");
    CHECK(loaded.embedding_dimension == 768);
    CHECK(loaded.default_top_k == 8);
}

TEST_CASE("malformed config files are rejected", "[config]") {
    TempDir dir;
    write_file(dir / "broken.json", "{ chunk_size: ");
    CHECK_THROWS_AS(Config::load(dir / "broken.json"), ValidationError);

    write_file(dir / "typed.json", R"({"source_dir": 12})");
    CHECK_THROWS_AS(Config::load(dir / "typed.json"), ValidationError);

    write_file(dir / "metric.json", R"({"metric": "manhattan"})");
    CHECK_THROWS_AS(Config::load(dir / "metric.json"), ValidationError);
}

TEST_CASE("validation rejects inconsistent settings", "[config]") {
    Config config;
    config.chunking.overlap = config.chunking.chunk_size;
    CHECK_THROWS_AS(config.validate(), ValidationError);

    config = Config{};
    config.chunking.chunk_size = config.embedding_max_input + 1;
    CHECK_THROWS_AS(config.validate(), ValidationError);

    // A merged tail would push the last chunk past what the embedder reads.
    config = Config{};
    config.chunking.chunk_size = config.embedding_max_input;
    config.chunking.min_chunk_size = 100;
    CHECK_THROWS_AS(config.validate(), ValidationError);
    config.chunking.min_chunk_size = 1;
    CHECK_NOTHROW(config.validate());

    config = Config{};
    config.embedding_backend = "word2vec";
    CHECK_THROWS_AS(config.validate(), ValidationError);

    config = Config{};
    config.similarity_threshold = 1.5f;
    CHECK_THROWS_AS(config.validate(), ValidationError);

    config = Config{};
    config.default_top_k = config.max_top_k + 1;
    CHECK_THROWS_AS(config.validate(), ValidationError);
}

TEST_CASE("environment overrides config values", "[config]") {
    setenv("RAGMILL_CHUNK_SIZE", "256", 1);
    setenv("EMBEDDING_MODEL", "mxbai-embed-large", 1);

    Config config;
    config.apply_environment();
    CHECK(config.chunking.chunk_size == 256);
    CHECK(config.embedding_model == "mxbai-embed-large");

    setenv("RAGMILL_CHUNK_SIZE", "lots", 1);
    CHECK_THROWS_AS(config.apply_environment(), ValidationError);

    unsetenv("RAGMILL_CHUNK_SIZE");
    unsetenv("EMBEDDING_MODEL");
}
