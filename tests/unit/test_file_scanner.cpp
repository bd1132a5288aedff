#include <catch2/catch.hpp>
#include "FileScanner.hpp"
#include "TestHelpers.hpp"
#include <filesystem>

TEST_CASE("hidden files require explicit flag") {
    TempDir temp_dir;
    const auto hidden_file = temp_dir.path() / ".secret.txt";
    write_file(hidden_file);

    FileScanner scanner;
    auto entries = scanner.get_directory_entries(temp_dir.path().string(),
        FileScanOptions::Files);
    REQUIRE(entries.empty());

    entries = scanner.get_directory_entries(temp_dir.path().string(),
        FileScanOptions::Files | FileScanOptions::HiddenFiles);
    REQUIRE(entries.size() == 1);
    CHECK(entries.front().file_name == ".secret.txt");
    CHECK(entries.front().type == FileType::File);
}

TEST_CASE("files and directories are filtered by the scan options") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "b.txt");
    std::filesystem::create_directories(temp_dir.path() / "a_dir");

    FileScanner scanner;
    auto files = scanner.get_directory_entries(temp_dir.path().string(), FileScanOptions::Files);
    REQUIRE(files.size() == 1);
    CHECK(files.front().file_name == "b.txt");

    auto dirs = scanner.get_directory_entries(temp_dir.path().string(), FileScanOptions::Directories);
    REQUIRE(dirs.size() == 1);
    CHECK(dirs.front().type == FileType::Directory);

    auto both = scanner.get_directory_entries(temp_dir.path().string(),
        FileScanOptions::Files | FileScanOptions::Directories);
    REQUIRE(both.size() == 2);
    CHECK(both[0].file_name == "a_dir");
    CHECK(both[1].file_name == "b.txt");
}

#ifndef _WIN32
TEST_CASE("symlinks are only listed when requested") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "target.txt");
    std::filesystem::create_symlink(temp_dir.path() / "target.txt", temp_dir.path() / "link.txt");

    FileScanner scanner;
    auto files = scanner.get_directory_entries(temp_dir.path().string(), FileScanOptions::Files);
    REQUIRE(files.size() == 1);
    CHECK(files.front().file_name == "target.txt");

    auto all = scanner.get_directory_entries(temp_dir.path().string(), kAllEntries);
    REQUIRE(all.size() == 2);
    CHECK(all[0].file_name == "link.txt");
    CHECK(all[0].type == FileType::Symlink);
}
#endif

TEST_CASE("list_names includes hidden entries") {
    TempDir temp_dir;
    write_file(temp_dir.path() / ".hidden");
    write_file(temp_dir.path() / "visible");

    FileScanner scanner;
    const auto names = scanner.list_names(temp_dir.path().string());
    REQUIRE(names.size() == 2);
    CHECK(names[0] == ".hidden");
    CHECK(names[1] == "visible");
}

TEST_CASE("scanning a missing directory throws") {
    TempDir temp_dir;
    FileScanner scanner;
    REQUIRE_THROWS_AS(scanner.get_directory_entries((temp_dir.path() / "missing").string(), kAllEntries),
                      std::filesystem::filesystem_error);
}
