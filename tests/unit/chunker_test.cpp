#include <catch2/catch_test_macros.hpp>

#include "engine/chunker.hpp"
#include "ragmill/errors.hpp"

using namespace ragmill;
using namespace ragmill::engine;

namespace {

    // Every byte of text lies in some chunk and chunks appear in document order.
    void check_coverage(const std::vector<Chunk>& chunks, const std::string& text) {
        REQUIRE_FALSE(chunks.empty());
        CHECK(chunks.front().start_offset == 0);
        CHECK(chunks.back().end_offset == text.size());
        for (size_t i = 0; i < chunks.size(); ++i) {
            CHECK(chunks[i].index == i);
            CHECK(chunks[i].content == text.substr(chunks[i].start_offset,
                                                   chunks[i].end_offset - chunks[i].start_offset));
            if (i > 0) {
                CHECK(chunks[i].start_offset > chunks[i - 1].start_offset);
                CHECK(chunks[i].start_offset <= chunks[i - 1].end_offset);
            }
        }
    }

}

TEST_CASE("chunker splits unbroken text into overlapping windows", "[chunker]") {
    Chunker chunker({500, 50, 100});
    std::string text(1200, 'x');

    auto chunks = chunker.split("doc", text);
    REQUIRE(chunks.size() == 3);
    CHECK(chunks[0].start_offset == 0);
    CHECK(chunks[0].end_offset == 500);
    CHECK(chunks[1].start_offset == 450);
    CHECK(chunks[1].end_offset == 950);
    CHECK(chunks[2].start_offset == 900);
    CHECK(chunks[2].end_offset == 1200);
    check_coverage(chunks, text);
}

TEST_CASE("chunker handles empty and short documents", "[chunker]") {
    Chunker chunker({500, 50, 100});
    CHECK(chunker.split("doc", "").empty());

    auto chunks = chunker.split("doc", "tiny");
    REQUIRE(chunks.size() == 1);
    CHECK(chunks[0].content == "tiny");
    CHECK(chunks[0].document_id == "doc");
    CHECK(chunks[0].embedding.empty());
}

TEST_CASE("chunker prefers paragraph and sentence boundaries", "[chunker]") {
    Chunker chunker({100, 10, 10});

    std::string para = std::string(70, 'a') + "\n\n" + std::string(70, 'b');
    auto chunks = chunker.split("doc", para);
    REQUIRE(chunks.size() >= 2);
    CHECK(chunks[0].end_offset == 72);

    std::string sentences = std::string(60, 'a') + ". " + std::string(80, 'b');
    chunks = chunker.split("doc", sentences);
    REQUIRE(chunks.size() >= 2);
    CHECK(chunks[0].content.back() == '.');
    check_coverage(chunks, sentences);
}

TEST_CASE("chunker merges a short tail into the previous chunk", "[chunker]") {
    Chunker chunker({100, 0, 40});
    std::string text(120, 'z');

    auto chunks = chunker.split("doc", text);
    REQUIRE(chunks.size() == 1);
    CHECK(chunks[0].end_offset == 120);
}

TEST_CASE("chunker never splits a UTF-8 sequence", "[chunker]") {
    Chunker chunker({50, 5, 5});
    std::string text;
    for (int i = 0; i < 60; ++i) text += "\xE6\x97\xA5"; // 日

    auto chunks = chunker.split("doc", text);
    check_coverage(chunks, text);
    for (const auto& c : chunks) {
        CHECK(c.start_offset % 3 == 0);
        CHECK(c.end_offset % 3 == 0);
    }
}

TEST_CASE("chunker output is deterministic", "[chunker]") {
    Chunker chunker({80, 15, 20});
    std::string text;
    for (int i = 0; i < 40; ++i) text += "Sentence number " + std::to_string(i) + " ends here. ";

    auto a = chunker.split("doc", text);
    auto b = chunker.split("doc", text);
    REQUIRE(a.size() == b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        CHECK(a[i].start_offset == b[i].start_offset);
        CHECK(a[i].end_offset == b[i].end_offset);
    }
    check_coverage(a, text);
}

TEST_CASE("chunker rejects invalid configurations", "[chunker]") {
    CHECK_THROWS_AS(Chunker({0, 0, 0}), ValidationError);
    CHECK_THROWS_AS(Chunker({100, 100, 10}), ValidationError);
    CHECK_THROWS_AS(Chunker({100, 150, 10}), ValidationError);
    CHECK_THROWS_AS(Chunker({100, 10, 200}), ValidationError);
    CHECK_NOTHROW(Chunker({100, 99, 100}));
}

TEST_CASE("overlap larger than half a chunk still advances and repeats the overlap", "[chunker]") {
    SECTION("paragraph break early in the window") {
        Chunker chunker({100, 80, 0});
        std::string text = std::string(60, 'a') + "\n\n" + std::string(200, 'b');

        auto chunks = chunker.split("doc", text);
        check_coverage(chunks, text);
        for (size_t i = 1; i < chunks.size(); ++i) {
            CHECK(chunks[i].start_offset == chunks[i - 1].end_offset - 80);
        }
    }

    SECTION("sentence ends early in the window") {
        Chunker chunker({100, 60, 10});
        std::string text = std::string(55, 'a') + ". " + std::string(55, 'b') + ". " + std::string(100, 'c');

        auto chunks = chunker.split("doc", text);
        check_coverage(chunks, text);
        for (size_t i = 0; i < chunks.size(); ++i) {
            CHECK(chunks[i].content.size() <= chunker.config().max_chunk_length());
            if (i > 0) CHECK(chunks[i].start_offset == chunks[i - 1].end_offset - 60);
        }
    }

    SECTION("multi-byte text with the largest allowed overlap") {
        Chunker chunker({10, 9, 0});
        std::string text;
        for (int i = 0; i < 20; ++i) text += "\xE6\x97\xA5"; // 日

        auto chunks = chunker.split("doc", text);
        check_coverage(chunks, text);
        for (const auto& c : chunks) {
            CHECK(c.start_offset % 3 == 0);
            CHECK(c.end_offset % 3 == 0);
        }
    }
}

TEST_CASE("max chunk length accounts for a merged tail", "[chunker]") {
    CHECK(ChunkerConfig{500, 50, 100}.max_chunk_length() == 599);
    CHECK(ChunkerConfig{500, 50, 0}.max_chunk_length() == 500);

    Chunker chunker({100, 0, 40});
    auto chunks = chunker.split("doc", std::string(139, 'z'));
    REQUIRE(chunks.size() == 1);
    CHECK(chunks[0].content.size() == chunker.config().max_chunk_length());
}
