#include <catch2/catch_test_macros.hpp>

#include <fstream>
#include <sstream>

#include "engine/chunker.hpp"
#include "engine/indexer.hpp"
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

    std::string paragraph(const std::string& topic, int sentences) {
        std::string text;
        for (int i = 0; i < sentences; ++i) {
            text += "This sentence talks about " + topic + " number " + std::to_string(i) + ". ";
        }
        return text;
    }

    void write_corpus(const std::filesystem::path& source) {
        write_file(source / "a.md", "# Alpha\n\n" + paragraph("alpha particles", 6));
        write_file(source / "b.txt", paragraph("beta decay", 5));
        write_file(source / "c.txt", paragraph("gamma rays", 4));
    }

}

TEST_CASE("indexing a corpus stores every chunk", "[indexer]") {
    TempDir dir;
    auto config = small_config(dir.path());
    write_corpus(config.source_dir);

    ScriptedEmbedder embedder(config.embedding_dimension);
    Indexer indexer(config, embedder, store_factory(config));

    auto summary = indexer.run({config.source_dir, true});
    CHECK(summary.documents_indexed == 3);
    CHECK(summary.documents_skipped == 0);
    CHECK(summary.documents_failed == 0);
    CHECK_FALSE(summary.cancelled);

    auto store = store_factory(config)();
    CHECK(store->document_count() == 3);
    CHECK(store->chunk_count() == summary.chunks_written);
    CHECK(embedder.calls() == summary.chunks_written);

    for (const auto& record : store->list_documents()) {
        CHECK(record.status == DocumentStatus::Processed);
        CHECK(record.model == embedder.model_id());
        CHECK(record.chunk_count == store->chunk_count(record.id));
        CHECK(record.hash.size() == 64);
    }
}

TEST_CASE("re-running without changes writes nothing", "[indexer]") {
    TempDir dir;
    auto config = small_config(dir.path());
    write_corpus(config.source_dir);

    ScriptedEmbedder embedder(config.embedding_dimension);
    Indexer indexer(config, embedder, store_factory(config));
    auto first = indexer.run({config.source_dir, true});
    size_t calls = embedder.calls();

    auto second = indexer.run({config.source_dir, true});
    CHECK(second.documents_indexed == 0);
    CHECK(second.documents_skipped == 3);
    CHECK(second.chunks_written == 0);
    CHECK(embedder.calls() == calls);

    auto store = store_factory(config)();
    CHECK(store->chunk_count() == first.chunks_written);
}

TEST_CASE("only the edited document is re-indexed", "[indexer]") {
    TempDir dir;
    auto config = small_config(dir.path());
    write_corpus(config.source_dir);

    ScriptedEmbedder embedder(config.embedding_dimension);
    Indexer indexer(config, embedder, store_factory(config));
    indexer.run({config.source_dir, true});

    auto store = store_factory(config)();
    auto old_hash = store->get_document_hash("b.txt");
    auto a_before = store->get_document("a.md");

    write_file(config.source_dir / "b.txt", paragraph("beta decay, revised", 9));
    auto summary = indexer.run({config.source_dir, true});
    CHECK(summary.documents_indexed == 1);
    CHECK(summary.documents_skipped == 2);

    CHECK(store->get_document_hash("b.txt") != old_hash);
    CHECK(store->get_document("a.md")->updated_at_ms == a_before->updated_at_ms);
    for (const auto& chunk : store->chunks_for_document("b.txt")) {
        CHECK(chunk.content.find("revised") != std::string::npos);
    }
}

TEST_CASE("a full run re-embeds unchanged documents", "[indexer]") {
    TempDir dir;
    auto config = small_config(dir.path());
    write_corpus(config.source_dir);

    ScriptedEmbedder embedder(config.embedding_dimension);
    Indexer indexer(config, embedder, store_factory(config));
    auto first = indexer.run({config.source_dir, true});
    auto second = indexer.run({config.source_dir, false});

    CHECK(second.documents_indexed == 3);
    CHECK(second.chunks_written == first.chunks_written);
    auto store = store_factory(config)();
    CHECK(store->chunk_count() == first.chunks_written);
}

TEST_CASE("a failing document is reported and the rest is indexed", "[indexer]") {
    TempDir dir;
    auto config = small_config(dir.path());
    write_corpus(config.source_dir);
    write_file(config.source_dir / "scan.pdf", "%PDF-1.4");

    {
        ScriptedEmbedder embedder(config.embedding_dimension);
        Indexer indexer(config, embedder, store_factory(config));
        indexer.run({config.source_dir, true});
    }

    // b.txt now embeds a poisoned sentence; its old chunks must survive untouched.
    auto store = store_factory(config)();
    size_t b_chunks = store->chunk_count("b.txt");
    write_file(config.source_dir / "b.txt", paragraph("beta decay", 5) + "POISON here.");

    ScriptedEmbedder failing(config.embedding_dimension, "POISON", false);
    Indexer indexer(config, failing, store_factory(config));
    auto summary = indexer.run({config.source_dir, true});

    CHECK(summary.documents_failed == 2);
    REQUIRE(summary.failures.size() == 2);
    CHECK(summary.failures[0].document_id == "b.txt");
    CHECK(summary.failures[0].kind == "EmbeddingError");
    CHECK(summary.failures[1].document_id == "scan.pdf");
    CHECK(summary.failures[1].kind == "LoadError");
    CHECK(summary.documents_skipped == 2);

    auto b = store->get_document("b.txt");
    REQUIRE(b);
    CHECK(b->status == DocumentStatus::Stale);
    CHECK(store->chunk_count("b.txt") == b_chunks);
    CHECK(store->document_count() == 2);
}

TEST_CASE("a new document that fails stays unprocessed and is retried", "[indexer]") {
    TempDir dir;
    auto config = small_config(dir.path());
    write_file(config.source_dir / "new.txt", "POISON " + paragraph("delta", 3));

    ScriptedEmbedder failing(config.embedding_dimension, "POISON", false);
    Indexer failing_indexer(config, failing, store_factory(config));
    auto summary = failing_indexer.run({config.source_dir, true});
    CHECK(summary.documents_failed == 1);

    auto store = store_factory(config)();
    auto record = store->get_document("new.txt");
    REQUIRE(record);
    CHECK(record->status == DocumentStatus::Unprocessed);
    CHECK(record->hash.empty());
    CHECK(store->chunk_count("new.txt") == 0);

    ScriptedEmbedder healthy(config.embedding_dimension);
    Indexer indexer(config, healthy, store_factory(config));
    summary = indexer.run({config.source_dir, true});
    CHECK(summary.documents_indexed == 1);
    CHECK(store->get_document("new.txt")->status == DocumentStatus::Processed);
}

TEST_CASE("changing the embedding model re-indexes everything", "[indexer]") {
    TempDir dir;
    auto config = small_config(dir.path());
    write_corpus(config.source_dir);

    ScriptedEmbedder embedder(config.embedding_dimension);
    Indexer indexer(config, embedder, store_factory(config));
    indexer.run({config.source_dir, true});

    embedder.set_model_id("hash:other-32");
    auto summary = indexer.run({config.source_dir, true});
    CHECK(summary.documents_indexed == 3);

    auto store = store_factory(config)();
    CHECK(store->models() == std::vector<std::string>{"hash:other-32"});
}

TEST_CASE("a cancelled run leaves no partial documents", "[indexer]") {
    TempDir dir;
    auto config = small_config(dir.path());
    config.index_workers = 1;
    for (int i = 0; i < 6; ++i) {
        write_file(config.source_dir / ("doc" + std::to_string(i) + ".txt"), paragraph("topic " + std::to_string(i), 6));
    }

    ScriptedEmbedder embedder(config.embedding_dimension);
    Indexer indexer(config, embedder, store_factory(config));

    CancellationToken cancel;
    cancel.cancel();
    auto summary = indexer.run({config.source_dir, true}, cancel);
    CHECK(summary.cancelled);
    CHECK(summary.documents_indexed == 0);
    CHECK(embedder.calls() == 0);

    auto store = store_factory(config)();
    CHECK(store->chunk_count() == 0);

    summary = indexer.run({config.source_dir, true});
    CHECK(summary.documents_indexed == 6);
    for (const auto& record : store->list_documents()) {
        CHECK(record.chunk_count == store->chunk_count(record.id));
    }
}

TEST_CASE("cancelling in the middle of a document keeps committed work only", "[indexer]") {
    TempDir dir;
    auto config = small_config(dir.path());
    config.index_workers = 1;
    for (int i = 0; i < 4; ++i) {
        write_file(config.source_dir / ("doc" + std::to_string(i) + ".txt"), paragraph("topic " + std::to_string(i), 6));
    }

    {
        ScriptedEmbedder embedder(config.embedding_dimension);
        Indexer indexer(config, embedder, store_factory(config));
        REQUIRE(indexer.run({config.source_dir, true}).documents_indexed == 4);
    }

    auto store = store_factory(config)();
    std::vector<DocumentRecord> before = store->list_documents();
    REQUIRE(before.size() == 4);

    std::vector<std::string> revised;
    for (int i = 0; i < 4; ++i) {
        revised.push_back(paragraph("revised topic " + std::to_string(i), 7));
        write_file(config.source_dir / ("doc" + std::to_string(i) + ".txt"), revised.back());
    }
    Chunker chunker(config.chunking);
    size_t doc0_chunks = chunker.split("doc0.txt", revised[0]).size();
    REQUIRE(chunker.split("doc1.txt", revised[1]).size() > 1);

    // The first embedding of doc1 trips the token.
    CancellationToken cancel;
    ScriptedEmbedder embedder(config.embedding_dimension);
    embedder.cancel_on_call(doc0_chunks + 1, cancel);
    Indexer indexer(config, embedder, store_factory(config));
    auto summary = indexer.run({config.source_dir, true}, cancel);

    CHECK(summary.cancelled);
    CHECK(summary.documents_indexed == 1);
    CHECK(summary.documents_failed == 0);
    CHECK(summary.chunks_written == doc0_chunks);
    CHECK(embedder.calls() == doc0_chunks + 1);

    auto doc0 = store->get_document("doc0.txt");
    REQUIRE(doc0);
    CHECK(doc0->status == DocumentStatus::Processed);
    CHECK(doc0->hash != before[0].hash);
    CHECK(doc0->chunk_count == doc0_chunks);
    CHECK(store->chunk_count("doc0.txt") == doc0_chunks);

    // The in-flight document and the ones after it are exactly as the first run left them.
    for (size_t i = 1; i < before.size(); ++i) {
        auto record = store->get_document(before[i].id);
        REQUIRE(record);
        CHECK(record->status == DocumentStatus::Processed);
        CHECK(record->hash == before[i].hash);
        CHECK(record->chunk_count == before[i].chunk_count);
        CHECK(store->chunk_count(before[i].id) == before[i].chunk_count);
        for (const auto& chunk : store->chunks_for_document(before[i].id)) {
            CHECK(chunk.content.find("revised") == std::string::npos);
        }
    }

    summary = indexer.run({config.source_dir, true});
    CHECK_FALSE(summary.cancelled);
    CHECK(summary.documents_indexed == 3);
    CHECK(summary.documents_skipped == 1);
}

TEST_CASE("an unexpected exception fails one document without stopping the run", "[indexer]") {
    TempDir dir;
    auto config = small_config(dir.path());
    write_corpus(config.source_dir);
    write_file(config.source_dir / "d.txt", "CRASH " + paragraph("delta", 3));

    ScriptedEmbedder embedder(config.embedding_dimension, "CRASH");
    embedder.use_foreign_failures();
    Indexer indexer(config, embedder, store_factory(config));
    auto summary = indexer.run({config.source_dir, true});

    CHECK(summary.documents_indexed == 3);
    CHECK(summary.documents_failed == 1);
    REQUIRE(summary.failures.size() == 1);
    CHECK(summary.failures[0].document_id == "d.txt");
    CHECK(summary.failures[0].kind == "Error");

    auto store = store_factory(config)();
    auto record = store->get_document("d.txt");
    REQUIRE(record);
    CHECK(record->status == DocumentStatus::Unprocessed);
    CHECK(store->chunk_count("d.txt") == 0);
}

TEST_CASE("dimension mismatch between embedder and store is refused", "[indexer]") {
    TempDir dir;
    auto config = small_config(dir.path());
    write_corpus(config.source_dir);

    ScriptedEmbedder embedder(config.embedding_dimension * 2);
    Indexer indexer(config, embedder, store_factory(config));
    CHECK_THROWS_AS(indexer.run({config.source_dir, true}), ConfigMismatchError);
}

TEST_CASE("normalized text is exported and removal cleans it up", "[indexer]") {
    TempDir dir;
    auto config = small_config(dir.path());
    config.processed_dir = dir / "processed";
    write_file(config.source_dir / "notes/page.html", "<html><body><p>Hello processed world</p></body></html>");

    ScriptedEmbedder embedder(config.embedding_dimension);
    Indexer indexer(config, embedder, store_factory(config));
    indexer.run({config.source_dir, true});

    auto exported = config.processed_dir / "notes/page.html.md";
    REQUIRE(std::filesystem::exists(exported));
    std::ifstream in(exported);
    std::stringstream content;
    content << in.rdbuf();
    CHECK(content.str().find("Hello processed world") != std::string::npos);
    CHECK(content.str().find('<') == std::string::npos);

    CHECK(indexer.remove_document("notes/page.html"));
    CHECK_FALSE(std::filesystem::exists(exported));
    CHECK_FALSE(indexer.remove_document("notes/page.html"));
}

TEST_CASE("a missing source directory fails the run", "[indexer]") {
    TempDir dir;
    auto config = small_config(dir.path());
    ScriptedEmbedder embedder(config.embedding_dimension);
    Indexer indexer(config, embedder, store_factory(config));
    CHECK_THROWS_AS(indexer.run({dir / "absent", true}), LoadError);
}
