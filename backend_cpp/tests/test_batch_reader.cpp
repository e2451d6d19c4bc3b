#include <catch2/catch.hpp>
#include <cerrno>
#include <iterator>
#include <system_error>
#include "tools/BatchReader.hpp"
#include "tools/FileSystemTools.hpp"
#include "tools/AtomicJournal.hpp"
#include "TestHelpers.hpp"

using namespace repopatch;
using repopatch::testing::TempDir;

TEST_CASE("Batch read reports every path on its own", "[batch]") {
    TempDir tmp;
    std::string a = tmp.write("a.txt", "alpha\n").string();
    std::string missing = (tmp.path() / "missing.txt").string();

    BatchReader reader;
    BatchReadResults results = reader.read_many({a, missing});

    REQUIRE(results.size() == 2);
    REQUIRE(results.count(a) == 1);
    REQUIRE(results.count(missing) == 1);

    CHECK(results[a].success());
    CHECK(results[a].content == std::optional<std::string>("alpha\n"));
    CHECK_FALSE(results[a].error.has_value());

    CHECK_FALSE(results[missing].success());
    CHECK(results[missing].status == ReadStatus::InvalidPath);
    CHECK_FALSE(results[missing].content.has_value());
    CHECK(results[missing].error.has_value());
}

TEST_CASE("Results are keyed by the path string as sent", "[batch]") {
    TempDir tmp;
    tmp.write("dir/f.txt", "x");
    std::string roundabout = (tmp.path() / "dir" / ".." / "dir" / "f.txt").string();

    BatchReadResults results = BatchReader().read_many({roundabout});
    REQUIRE(results.count(roundabout) == 1);
    CHECK(results[roundabout].success());
}

TEST_CASE("Directories and oversized files fail per path", "[batch]") {
    TempDir tmp;
    std::string dir = tmp.mkdir("folder").string();
    std::string big = tmp.write("big.txt", std::string(64, 'x')).string();
    std::string small = tmp.write("small.txt", "ok").string();

    BatchReadResults results = BatchReader(16).read_many({dir, big, small});
    CHECK(results[dir].status == ReadStatus::NotAFile);
    CHECK(results[dir].error == std::optional<std::string>("Path is not a file"));
    CHECK(results[big].status == ReadStatus::TooLarge);
    CHECK(results[small].success());
}

TEST_CASE("Many paths beyond the worker cap all get results", "[batch]") {
    TempDir tmp;
    std::vector<std::string> paths;
    for (int i = 0; i < BatchReader::kMaxConcurrentReads * 3; ++i) {
        paths.push_back(tmp.write("f" + std::to_string(i) + ".txt", std::to_string(i)).string());
    }

    BatchReadResults results = BatchReader().read_many(paths);
    REQUIRE(results.size() == paths.size());
    for (size_t i = 0; i < paths.size(); ++i) {
        CHECK(results[paths[i]].content == std::optional<std::string>(std::to_string(i)));
    }
}

TEST_CASE("Batch results serialize with null placeholders", "[batch]") {
    TempDir tmp;
    std::string a = tmp.write("a.txt", "hi").string();
    std::string missing = (tmp.path() / "nope").string();

    auto j = BatchReader::to_json(BatchReader().read_many({a, missing}));
    CHECK(j[a]["success"] == true);
    CHECK(j[a]["content"] == "hi");
    CHECK(j[a]["error"].is_null());
    CHECK(j[missing]["success"] == false);
    CHECK(j[missing]["content"].is_null());
    CHECK(j[missing]["error"].is_string());
}

TEST_CASE("Writability probe leaves nothing behind", "[fs]") {
    TempDir tmp;
    WritableProbe probe = FileSystemTools::check_writable(tmp.path());
    CHECK(probe.writable);
    CHECK(probe.error.empty());
    CHECK(std::filesystem::is_empty(tmp.path()));

    WritableProbe missing = FileSystemTools::check_writable(tmp.path() / "absent");
    CHECK_FALSE(missing.writable);
    CHECK(missing.error.find("Failed to create temporary test file") == 0);
    CHECK(missing.error.find(std::error_code(ENOENT, std::generic_category()).message()) != std::string::npos);
}

TEST_CASE("Containment check rejects escapes", "[fs]") {
    CHECK(FileSystemTools::is_safe_path("/base", "/base/a/b.txt"));
    CHECK(FileSystemTools::is_safe_path("/base/", "/base/a.txt"));
    CHECK_FALSE(FileSystemTools::is_safe_path("/base", "/base/../etc/passwd"));
    CHECK_FALSE(FileSystemTools::is_safe_path("/base", "/basement/x"));
    CHECK_FALSE(FileSystemTools::is_safe_path("/base", "/etc/passwd"));
}

TEST_CASE("Journal restores the previous content on rollback", "[fs][journal]") {
    TempDir tmp;
    std::string target = tmp.write("doc.txt", "before\n").string();

    std::optional<std::string> journal = AtomicJournal::journal_path(target);
    REQUIRE(journal);
    REQUIRE(AtomicJournal::backup(target, *journal));
    CHECK(std::filesystem::exists(*journal));
    tmp.write("doc.txt", "half writ");
    AtomicJournal::rollback(target, *journal);

    CHECK(tmp.read("doc.txt") == "before\n");
    CHECK_FALSE(std::filesystem::exists(*journal));
}

TEST_CASE("Journal names avoid existing entries", "[fs][journal]") {
    TempDir tmp;
    std::string target = tmp.write("doc.txt", "x").string();
    tmp.write("doc.txt.repopatch_journal", "user data");

    std::optional<std::string> journal = AtomicJournal::journal_path(target);
    REQUIRE(journal);
    CHECK_FALSE(std::filesystem::exists(*journal));
    CHECK(*journal != target + ".repopatch_journal");

    // backup refuses to clobber a name that became taken
    tmp.write(std::filesystem::path(*journal).filename().string(), "taken");
    CHECK_FALSE(AtomicJournal::backup(target, *journal));
    CHECK(tmp.read(std::filesystem::path(*journal).filename().string()) == "taken");
}

TEST_CASE("Journaled rewrite commits and cleans up", "[fs][journal]") {
    TempDir tmp;
    std::string target = tmp.write("doc.txt", "before\n").string();

    CHECK(AtomicJournal::rewrite_safe(target, "after\n"));
    CHECK(tmp.read("doc.txt") == "after\n");
    auto entries = std::distance(std::filesystem::directory_iterator(tmp.path()),
                                 std::filesystem::directory_iterator());
    CHECK(entries == 1);

    CHECK_FALSE(AtomicJournal::rewrite_safe((tmp.path() / "no_dir" / "x.txt").string(), "x"));
}
