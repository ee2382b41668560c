#include <catch2/catch_test_macros.hpp>

#include <set>

#include "engine/indexer.hpp"
#include "engine/retriever.hpp"
#include "engine/vector_store.hpp"
#include "test_support.hpp"

using namespace ragmill;
using namespace ragmill::engine;
using ragmill::test::ScriptedEmbedder;
using ragmill::test::TempDir;
using ragmill::test::small_config;
using ragmill::test::store_factory;
using ragmill::test::write_file;

namespace {

    struct Fixture {
        TempDir dir;
        Config config = small_config(dir.path(), 256);
        ScriptedEmbedder embedder{config.embedding_dimension};
        std::unique_ptr<VectorStore> store;

        void index() {
            Indexer indexer(config, embedder, store_factory(config));
            indexer.run({config.source_dir, true});
            store = store_factory(config)();
        }
    };

    std::string long_document() {
        std::string text;
        const char* topics[] = {"apples", "bridges", "comets", "dolphins", "engines", "forests"};
        for (const char* topic : topics) {
            for (int i = 0; i < 3; ++i) {
                text += std::string("Notes on ") + topic + " " + topic + " " + topic + " part " + std::to_string(i) + ". ";
            }
            text += "\n\n";
        }
        return text;
    }

}

TEST_CASE("query returns at most the chunks that exist", "[retriever]") {
    Fixture f;
    write_file(f.config.source_dir / "short.txt", "Solar panels convert sunlight. They need cleaning.");
    f.index();
    REQUIRE(f.store->chunk_count() == 1);

    Retriever retriever(f.config, f.embedder, *f.store);
    auto result = retriever.query("solar sunlight", 5, std::nullopt);
    REQUIRE(result.size() == 1);
    CHECK(result[0].chunk.document_id == "short.txt");
    CHECK(result[0].score > 0.0f);
}

TEST_CASE("query ranks the matching document first", "[retriever]") {
    Fixture f;
    write_file(f.config.source_dir / "cats.txt", "Cats purr and chase mice around the barn.");
    write_file(f.config.source_dir / "rockets.txt", "Rockets burn fuel to reach orbit around earth.");
    write_file(f.config.source_dir / "bread.txt", "Bread dough rises when yeast ferments sugar.");
    f.index();

    Retriever retriever(f.config, f.embedder, *f.store);
    auto result = retriever.query("yeast bread dough", 3, std::nullopt);
    REQUIRE(result.size() == 3);
    CHECK(result[0].chunk.document_id == "bread.txt");
    CHECK(result[0].score >= result[1].score);
    CHECK(result[1].score >= result[2].score);

    // Same query, same store, same answer.
    auto again = retriever.query("yeast bread dough", 3, std::nullopt);
    for (size_t i = 0; i < result.size(); ++i) {
        CHECK(again[i].chunk.document_id == result[i].chunk.document_id);
        CHECK(again[i].chunk.index == result[i].chunk.index);
        CHECK(again[i].score == result[i].score);
    }

    auto thresholded = retriever.query("yeast bread dough", 3, 0.3f);
    REQUIRE(thresholded.size() == 1);
    CHECK(thresholded[0].chunk.document_id == "bread.txt");
}

TEST_CASE("query validates its arguments", "[retriever]") {
    Fixture f;
    write_file(f.config.source_dir / "a.txt", "anything at all");
    f.index();

    Retriever retriever(f.config, f.embedder, *f.store);
    CHECK_THROWS_AS(retriever.query("", 5, std::nullopt), ValidationError);
    CHECK_THROWS_AS(retriever.query("   \n", 5, std::nullopt), ValidationError);
    CHECK_THROWS_AS(retriever.query("text", 0, std::nullopt), ValidationError);
    CHECK_THROWS_AS(retriever.query("text", 5, 2.0f), ValidationError);
    CHECK_NOTHROW(retriever.query("text", 100000, std::nullopt));
}

TEST_CASE("an empty corpus yields an empty result", "[retriever]") {
    Fixture f;
    std::filesystem::create_directories(f.config.source_dir);
    f.index();

    Retriever retriever(f.config, f.embedder, *f.store);
    CHECK(retriever.query("anything", 5, std::nullopt).empty());
    CHECK(retriever.document_count() == 0);
    CHECK(f.embedder.calls() == 0);
}

TEST_CASE("querying with another model is refused", "[retriever]") {
    Fixture f;
    write_file(f.config.source_dir / "a.txt", "indexed with the default test model");
    f.index();

    ScriptedEmbedder other(f.config.embedding_dimension);
    other.set_model_id("hash:different-256");
    Retriever retriever(f.config, other, *f.store);
    CHECK_THROWS_AS(retriever.query("default model", 5, std::nullopt), ConfigMismatchError);
    CHECK(other.calls() == 0);
}

TEST_CASE("a cancelled query throws", "[retriever]") {
    Fixture f;
    write_file(f.config.source_dir / "a.txt", "some content");
    f.index();

    Retriever retriever(f.config, f.embedder, *f.store);
    CancellationToken cancel;
    cancel.cancel();
    CHECK_THROWS_AS(retriever.query("content", 5, std::nullopt, cancel), CancelledError);
}

TEST_CASE("search expands matches with neighbouring chunks", "[retriever]") {
    Fixture f;
    write_file(f.config.source_dir / "long.txt", long_document());
    f.index();
    size_t total = f.store->chunk_count("long.txt");
    REQUIRE(total >= 4);

    Retriever retriever(f.config, f.embedder, *f.store);

    SearchOptions plain;
    plain.top_k = 1;
    auto hits = retriever.search("comets comets", plain);
    REQUIRE(hits.size() == 1);
    CHECK_FALSE(hits[0].is_context);
    size_t match = hits[0].chunk_index;

    SearchOptions context = plain;
    context.with_context = true;
    context.context_size = 1;
    hits = retriever.search("comets comets", context);

    std::set<size_t> indices;
    size_t matches = 0;
    for (const auto& hit : hits) {
        indices.insert(hit.chunk_index);
        if (!hit.is_context) {
            ++matches;
            CHECK(hit.chunk_index == match);
        }
    }
    CHECK(matches == 1);
    CHECK(indices.size() == hits.size());
    CHECK(indices.count(match));
    if (match > 0) CHECK(indices.count(match - 1));
    if (match + 1 < total) CHECK(indices.count(match + 1));
    CHECK(hits.size() <= 3);

    SearchOptions whole = plain;
    whole.full_document = true;
    hits = retriever.search("comets comets", whole);
    CHECK(hits.size() == total);
    for (size_t i = 0; i < hits.size(); ++i) {
        CHECK(hits[i].chunk_index == i);
        CHECK(hits[i].is_full_document);
    }
}
