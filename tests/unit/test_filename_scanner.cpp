#include <catch2/catch_test_macros.hpp>

#include "FilenameScanner.hpp"
#include "TaxonomyErrors.hpp"
#include "TestHelpers.hpp"

#include <algorithm>

namespace {

ScanOptions any_size()
{
    ScanOptions options;
    options.min_file_size = 0;
    return options;
}

std::vector<std::string> relative_paths(const std::vector<ScannedFile>& files)
{
    std::vector<std::string> paths;
    for (const auto& file : files) {
        paths.push_back(file.relative_path);
    }
    return paths;
}

template <typename Fn>
ScanError::Kind scan_error_kind(Fn&& fn)
{
    try {
        fn();
    } catch (const ScanError& ex) {
        return ex.kind();
    }
    FAIL("expected ScanError");
    return ScanError::Kind::AccessDenied;
}

} // namespace

TEST_CASE("Flat scan walks the tree and skips noise") {
    TempDir dir;
    dir.write_file("Card Trick.MP4", "video");
    dir.write_file("notes/recipe.txt", "flour");
    dir.write_file(".hidden.txt", "secret");
    dir.write_file(".DS_Store", "meta");
    dir.write_file("node_modules/pkg/index.js", "code");
    dir.write_file(".git/config", "git");

    const FilenameScanner scanner(any_size());
    const auto result = scanner.scan(dir.path().string());

    CHECK(result.folder_name == dir.path().filename().string());
    CHECK(relative_paths(result.files) == std::vector<std::string>{"Card Trick.MP4", "notes/recipe.txt"});
    CHECK(result.skipped == 2);
    CHECK_FALSE(result.reached_limit);

    const auto& video = result.files.front();
    CHECK(video.name == "Card Trick.MP4");
    CHECK(video.extension == "mp4");
    CHECK(video.size == 5);
    CHECK(video.id == FilenameScanner::file_id_for("Card Trick.MP4"));
    CHECK(video.modified_at != TimePoint{});
}

TEST_CASE("Hidden files are included on request") {
    TempDir dir;
    dir.write_file(".profile", "x");
    dir.write_file(".config/app.ini", "y");

    ScanOptions options = any_size();
    options.include_hidden = true;
    const auto result = FilenameScanner(options).scan(dir.path().string());

    CHECK(relative_paths(result.files) == std::vector<std::string>{".config/app.ini", ".profile"});
}

TEST_CASE("Files below the minimum size are skipped") {
    TempDir dir;
    dir.write_file("tiny.txt", "a");
    dir.write_file("big.txt", std::string(200, 'b'));

    const auto result = FilenameScanner().scan(dir.path().string());

    REQUIRE(result.files.size() == 1);
    CHECK(result.files.front().name == "big.txt");
    CHECK(result.skipped == 1);
}

TEST_CASE("File limit stops the scan") {
    TempDir dir;
    for (int i = 0; i < 5; ++i) {
        dir.write_file("file" + std::to_string(i) + ".txt", "data");
    }
    ScanOptions options = any_size();
    options.max_files = 3;

    const auto result = FilenameScanner(options).scan(dir.path().string());

    CHECK(result.files.size() == 3);
    CHECK(result.reached_limit);
}

TEST_CASE("File ids are stable and path dependent") {
    CHECK(FilenameScanner::file_id_for("a/b.txt") == FilenameScanner::file_id_for("a/b.txt"));
    CHECK(FilenameScanner::file_id_for("a/b.txt") != FilenameScanner::file_id_for("b/b.txt"));
    CHECK_FALSE(FilenameScanner::file_id_for("").empty());
}

TEST_CASE("Hierarchy scan keeps top-level folders as units") {
    TempDir dir;
    dir.write_file("Magic/card.mp4", "v");
    dir.write_file("Magic/coins/coin.mp4", "v");
    dir.write_file("Single/only.pdf", "p");
    dir.write_file("Empty/.keep", "");
    dir.write_file("loose.txt", "t");
    dir.write_file("build/output.o", "o");

    ScanOptions options = any_size();
    options.min_files_for_folder = 2;
    const auto result = FilenameScanner(options).scan_with_hierarchy(dir.path().string());

    REQUIRE(result.folders.size() == 1);
    const auto& magic = result.folders.front();
    CHECK(magic.name == "Magic");
    CHECK(magic.relative_path == "Magic");
    CHECK(relative_paths(magic.files) == std::vector<std::string>{"Magic/card.mp4", "Magic/coins/coin.mp4"});
    CHECK(magic.total_size == 2);

    CHECK(relative_paths(result.loose_files) == std::vector<std::string>{"Single/only.pdf", "loose.txt"});
    CHECK(result.total_files() == 4);
    CHECK(relative_paths(result.all_files()) ==
          std::vector<std::string>{"Magic/card.mp4", "Magic/coins/coin.mp4", "Single/only.pdf", "loose.txt"});
    CHECK(result.skipped >= 2);
}

TEST_CASE("Invalid roots raise scan errors") {
    TempDir dir;
    const auto file = dir.write_file("plain.txt", "x");
    const FilenameScanner scanner;

    CHECK(scan_error_kind([&] { (void)scanner.scan((dir.path() / "missing").string()); }) ==
          ScanError::Kind::FolderNotFound);
    CHECK(scan_error_kind([&] { (void)scanner.scan_with_hierarchy(file.string()); }) ==
          ScanError::Kind::NotADirectory);
}
