#include <catch2/catch_test_macros.hpp>

#include "engine/ignore.hpp"
#include "engine/loader.hpp"
#include "ragmill/sha256.hpp"
#include "test_support.hpp"

using namespace ragmill;
using namespace ragmill::engine;
using ragmill::test::TempDir;
using ragmill::test::write_file;

TEST_CASE("ignore patterns match names and anchored paths", "[loader][ignore]") {
    Ignore ignore;
    ignore.add("*.log");
    ignore.add("drafts/");
    ignore.add("docs/private/**");

    CHECK(ignore.check("server.log"));
    CHECK(ignore.check("deep/dir/server.log"));
    CHECK(ignore.check("drafts"));
    CHECK(ignore.check("notes/drafts"));
    CHECK(ignore.check("docs/private/a/b.md"));
    CHECK_FALSE(ignore.check("docs/public/a.md"));
    CHECK_FALSE(ignore.check("logbook.txt"));
}

TEST_CASE("loader lists candidate files in id order", "[loader]") {
    TempDir dir;
    write_file(dir / "b.md", "# B");
    write_file(dir / "a.txt", "A");
    write_file(dir / "sub/c.txt", "C");
    write_file(dir / ".git/HEAD", "ref");
    write_file(dir / "skip.tmp", "tmp");
    write_file(dir / ".ragmillignore", "# comment\n*.tmp\n");

    Loader loader(dir.path());
    auto entries = loader.list();

    REQUIRE(entries.size() == 3);
    CHECK(entries[0].id == "a.txt");
    CHECK(entries[1].id == "b.md");
    CHECK(entries[2].id == "sub/c.txt");
    CHECK(entries[2].size == 1);
}

TEST_CASE("loader loads, hashes and normalizes documents", "[loader]") {
    TempDir dir;
    write_file(dir / "doc.txt", "first\r\nsecond\r\n");

    Loader loader(dir.path());
    auto entries = loader.list();
    REQUIRE(entries.size() == 1);

    Document doc = loader.load(entries[0]);
    CHECK(doc.id == "doc.txt");
    CHECK(doc.content == "first\nsecond\n");
    CHECK(doc.hash == crypto::SHA256::hash_bytes("first\r\nsecond\r\n"));
    CHECK(doc.format == "text");
    CHECK(doc.size == 15);
}

TEST_CASE("loader skips failing files and keeps going", "[loader]") {
    TempDir dir;
    write_file(dir / "good.md", "fine");
    write_file(dir / "scan.pdf", "%PDF-1.4");
    write_file(dir / "bad.txt", std::string("bin\0ary", 7));
    write_file(dir / "z.txt", "last");

    Loader loader(dir.path());
    std::vector<std::string> loaded;
    std::vector<std::string> failed;
    size_t delivered = loader.for_each(
        [&](Document&& doc) { loaded.push_back(doc.id); },
        [&](const LoadFailure& failure) { failed.push_back(failure.document_id); });

    CHECK(delivered == 2);
    CHECK(loaded == std::vector<std::string>{"good.md", "z.txt"});
    CHECK(failed == std::vector<std::string>{"bad.txt", "scan.pdf"});
}

TEST_CASE("loader rejects a missing source root", "[loader]") {
    TempDir dir;
    Loader loader(dir / "nope");
    CHECK_THROWS_AS(loader.list(), LoadError);
}

TEST_CASE("the walk continues past odd entries", "[loader]") {
    TempDir dir;
    write_file(dir / "a/b/c/d/deep.txt", "deep");
    std::filesystem::create_directories(dir / "empty/inner");
    std::filesystem::create_symlink(dir / "missing.txt", dir / "dangling.txt");
    std::filesystem::create_directory_symlink(dir / "a", dir / "z_link");
    write_file(dir / "zz_last.txt", "last");

    Loader loader(dir.path());
    auto entries = loader.list();

    std::vector<std::string> ids;
    for (const auto& e : entries) ids.push_back(e.id);
    CHECK(ids == std::vector<std::string>{"a/b/c/d/deep.txt", "zz_last.txt"});
}
