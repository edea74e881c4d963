#include <catch2/catch.hpp>
#include <globstar/filesystem.hpp>
#include "temp_dir.hpp"
#include <algorithm>

using namespace globstar;

TEST_CASE("list_dir returns entry names", "[filesystem]") {
    TempDir td;
    td.touch("a.txt");
    td.makedirs("sub");

    LocalFileSystem lfs;
    auto r = lfs.list_dir(td.str());
    REQUIRE(r.is_ok());
    auto names = r.value();
    std::sort(names.begin(), names.end());
    REQUIRE(names == std::vector<std::string>{"a.txt", "sub"});
}

TEST_CASE("list_dir on missing directory returns NotFound", "[filesystem]") {
    LocalFileSystem lfs;
    auto r = lfs.list_dir("/nonexistent_dir_xyz_123");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == GlobError::NotFound);
}

TEST_CASE("list_dir on a regular file is an error", "[filesystem]") {
    TempDir td;
    td.touch("file");
    LocalFileSystem lfs;
    REQUIRE(lfs.list_dir(td.str("file")).is_err());
}

TEST_CASE("exists, is_directory and is_symlink", "[filesystem]") {
    TempDir td;
    td.touch("file");
    td.makedirs("dir");

    LocalFileSystem lfs;
    REQUIRE(lfs.exists(td.str("file")));
    REQUIRE(lfs.exists(td.str("dir")));
    REQUIRE_FALSE(lfs.exists(td.str("missing")));
    REQUIRE(lfs.is_directory(td.str("dir")));
    REQUIRE_FALSE(lfs.is_directory(td.str("file")));
    REQUIRE_FALSE(lfs.is_symlink(td.str("dir")));
    REQUIRE_FALSE(lfs.exists(""));
    REQUIRE_FALSE(lfs.is_directory(""));
}

#ifndef _WIN32
TEST_CASE("broken symlinks exist", "[filesystem]") {
    TempDir td;
    fs::create_symlink(td.path / "nowhere", td.path / "dangling");

    LocalFileSystem lfs;
    REQUIRE(lfs.exists(td.str("dangling")));
    REQUIRE(lfs.is_symlink(td.str("dangling")));
    REQUIRE_FALSE(lfs.is_directory(td.str("dangling")));
}

TEST_CASE("is_directory follows directory symlinks", "[filesystem]") {
    TempDir td;
    td.makedirs("real");
    fs::create_directory_symlink(td.path / "real", td.path / "link");

    LocalFileSystem lfs;
    REQUIRE(lfs.is_symlink(td.str("link")));
    REQUIRE(lfs.is_directory(td.str("link")));
}
#endif

TEST_CASE("local_filesystem is shared", "[filesystem]") {
    REQUIRE(local_filesystem() == local_filesystem());
}

struct FakeEntry {
    fs::path p;
    const fs::path& path() const { return p; }
};

// Directory iterator stand-in whose increment fails after `fail_after` entries.
struct FailingDirIter {
    std::vector<FakeEntry> entries;
    size_t pos = 0;
    size_t fail_after = 0;
    bool at_end = true;

    FailingDirIter() = default;
    FailingDirIter(std::vector<FakeEntry> e, size_t fail)
        : entries(std::move(e)), fail_after(fail), at_end(entries.empty()) {}

    const FakeEntry* operator->() const { return &entries[pos]; }

    void increment(std::error_code& ec) {
        if (++pos == fail_after) {
            ec = std::make_error_code(std::errc::io_error);
            at_end = true;
        } else if (pos == entries.size()) {
            at_end = true;
        }
    }

    bool operator!=(const FailingDirIter& other) const { return at_end != other.at_end; }
};

TEST_CASE("a read error keeps the entries already listed", "[filesystem]") {
    std::vector<FakeEntry> entries = {{"d/one"}, {"d/two"}, {"d/three"}};

    std::error_code ec;
    auto names = read_entry_names(FailingDirIter(entries, 2), ec);
    REQUIRE(ec);
    REQUIRE(names == std::vector<std::string>{"one", "two"});

    std::error_code clean;
    REQUIRE(read_entry_names(FailingDirIter(entries, 99), clean) ==
            std::vector<std::string>{"one", "two", "three"});
    REQUIRE_FALSE(clean);

    REQUIRE(read_entry_names(FailingDirIter(), clean).empty());
}
