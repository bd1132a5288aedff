#include <catch2/catch.hpp>
#include "AppException.hpp"
#include "NumberingService.hpp"
#include "TestHelpers.hpp"
#include "Utils.hpp"

#include <filesystem>

namespace {

std::string file_name_of(const std::string& path)
{
    return std::filesystem::path(path).filename().string();
}

} // namespace

TEST_CASE("numbered names continue the sequence for the same base name") {
    TempDir temp;
    write_file(temp.path() / "document.txt");

    NumberingService numbering;
    const std::string first = numbering.generate_numbered_name(temp.str("document.txt"));
    CHECK(file_name_of(first) == "document_00001.txt");
    write_file(first);

    const std::string second = numbering.generate_numbered_name(temp.str("document.txt"));
    CHECK(file_name_of(second) == "document_00002.txt");
}

TEST_CASE("numbering an already numbered file strips its suffix first") {
    TempDir temp;
    write_file(temp.path() / "document_00004.txt");

    NumberingService numbering;
    const std::string next = numbering.generate_numbered_name(temp.str("document_00004.txt"));
    CHECK(file_name_of(next) == "document_00005.txt");
}

TEST_CASE("first use scans the directory for the highest existing number") {
    TempDir temp;
    write_file(temp.path() / "photo.jpg");
    write_file(temp.path() / "photo_00003.jpg");
    write_file(temp.path() / "photo_00011.jpg");
    write_file(temp.path() / "other_00050.jpg");

    NumberingService numbering;
    const std::string next = numbering.generate_numbered_name(temp.str("photo.jpg"));
    CHECK(file_name_of(next) == "photo_00012.jpg");
    CHECK(numbering.highest_issued(temp.str(), "photo") == 12U);
}

TEST_CASE("generated names never collide with existing entries") {
    TempDir temp;
    write_file(temp.path() / "a.txt");

    NumberingService numbering;
    for (int i = 0; i < 20; ++i) {
        const std::string name = numbering.generate_numbered_name(temp.str("a.txt"));
        REQUIRE_FALSE(std::filesystem::exists(name));
        write_file(name);
    }
}

TEST_CASE("counters never decrease even when numbered files disappear") {
    TempDir temp;
    write_file(temp.path() / "log.txt");

    NumberingService numbering;
    const std::string first = numbering.generate_numbered_name(temp.str("log.txt"));
    write_file(first);
    const std::string second = numbering.generate_numbered_name(temp.str("log.txt"));
    write_file(second);

    std::filesystem::remove(first);
    std::filesystem::remove(second);

    const std::string third = numbering.generate_numbered_name(temp.str("log.txt"));
    CHECK(file_name_of(third) == "log_00003.txt");
}

TEST_CASE("seeding raises but never lowers a counter") {
    TempDir temp;
    NumberingService numbering;
    numbering.seed(NumberingRecord{temp.str(), "report", 41, 5});
    numbering.seed(NumberingRecord{temp.str(), "report", 7, 5});

    CHECK(numbering.highest_issued(temp.str(), "report") == 41U);
    const std::string next = numbering.generate_numbered_name(temp.str("report.pdf"));
    CHECK(file_name_of(next) == "report_00042.pdf");
}

TEST_CASE("exceeding the rollover threshold widens the suffix permanently") {
    TempDir temp;
    NumberingService numbering;
    numbering.seed(NumberingRecord{temp.str(), "doc", 99999, 5});

    const std::string widened = numbering.generate_numbered_name(temp.str("doc.txt"));
    CHECK(file_name_of(widened) == "doc_100000.txt");

    const std::string after = numbering.generate_numbered_name(temp.str("doc.txt"));
    CHECK(file_name_of(after) == "doc_100001.txt");

    const auto records = numbering.records();
    REQUIRE(records.size() == 1);
    CHECK(records.front().width == 6);
}

TEST_CASE("a lower configured threshold triggers rollover earlier") {
    TempDir temp;
    NumberingConfig config;
    config.rollover_threshold = 3;
    NumberingService numbering(config);
    numbering.seed(NumberingRecord{temp.str(), "x", 3, 5});

    const std::string next = numbering.generate_numbered_name(temp.str("x.bin"));
    CHECK(file_name_of(next) == "x_000004.bin");
}

TEST_CASE("start number is honored for fresh counters") {
    TempDir temp;
    NumberingConfig config;
    config.start_number = 10;
    NumberingService numbering(config);

    const std::string next = numbering.generate_numbered_name(temp.str("fresh.txt"));
    CHECK(file_name_of(next) == "fresh_00010.txt");
}

TEST_CASE("custom templates shape the generated name") {
    TempDir temp;
    NumberingConfig config;
    config.name_template = "{name} ({number}){ext}";
    config.digit_width = 3;
    NumberingService numbering(config);

    const std::string first = numbering.generate_numbered_name(temp.str("song.mp3"));
    CHECK(file_name_of(first) == "song (001).mp3");
    write_file(first);

    const auto parsed = numbering.parse_numbered_name(first);
    CHECK(parsed.first == "song");
    CHECK(parsed.second == 1U);
}

TEST_CASE("parse_numbered_name reports zero when no suffix is present") {
    NumberingService numbering;

    const auto plain = numbering.parse_numbered_name("/tmp/notes.md");
    CHECK(plain.first == "notes");
    CHECK(plain.second == 0U);

    const auto short_suffix = numbering.parse_numbered_name("/tmp/notes_12.md");
    CHECK(short_suffix.first == "notes_12");
    CHECK(short_suffix.second == 0U);

    const auto numbered = numbering.parse_numbered_name("/tmp/notes_00042.md");
    CHECK(numbered.first == "notes");
    CHECK(numbered.second == 42U);
}

TEST_CASE("files without extension are numbered too") {
    TempDir temp;
    write_file(temp.path() / "Makefile");

    NumberingService numbering;
    const std::string next = numbering.generate_numbered_name(temp.str("Makefile"));
    CHECK(file_name_of(next) == "Makefile_00001");
}

TEST_CASE("unreadable directories are treated as empty") {
    TempDir temp;
    NumberingService numbering;
    const std::string next = numbering.generate_numbered_name(temp.str("missing/dir/file.txt"));
    CHECK(file_name_of(next) == "file_00001.txt");
}

TEST_CASE("templates missing a placeholder are rejected") {
    NumberingConfig config;
    config.name_template = "{name}{ext}";
    REQUIRE_THROWS_AS(NumberingService(config), ErrorCodes::AppException);

    config.name_template = "{ext}{number}{name}";
    REQUIRE_THROWS_AS(NumberingService(config), ErrorCodes::AppException);
}

TEST_CASE("a width in the template overrides the configured digit width") {
    TempDir temp;
    NumberingConfig config;
    config.name_template = "{name}-{number:03d}{ext}";
    config.digit_width = 5;
    NumberingService numbering(config);

    const std::string first = numbering.generate_numbered_name(temp.str("song.mp3"));
    CHECK(file_name_of(first) == "song-001.mp3");
    write_file(first);

    const auto parsed = numbering.parse_numbered_name(first);
    CHECK(parsed.first == "song");
    CHECK(parsed.second == 1U);
}

TEST_CASE("malformed number placeholders are rejected") {
    NumberingConfig config;
    config.name_template = "{name}_{number:x}{ext}";
    REQUIRE_THROWS_AS(NumberingService(config), ErrorCodes::AppException);

    config.name_template = "{name}_{number:00d}{ext}";
    REQUIRE_THROWS_AS(NumberingService(config), ErrorCodes::AppException);
}
