#include <catch2/catch.hpp>
#include "IniConfig.hpp"
#include "TestHelpers.hpp"

TEST_CASE("ini files are parsed into sections") {
    TempDir temp;
    write_file(temp.path() / "config.ini",
               "; leading comment\n"
               "[Numbering]\n"
               "  Template = {name}-{number}{ext}  \n"
               "# another comment\n"
               "DigitWidth=3\n"
               "not a key value line\n"
               "\n"
               "[History]\n"
               "MergeEnabled = Yes\n");

    IniConfig config;
    REQUIRE(config.load(temp.str("config.ini")));
    CHECK(config.getValue("Numbering", "Template") == "{name}-{number}{ext}");
    CHECK(config.getInt("Numbering", "DigitWidth") == 3);
    CHECK(config.getBool("History", "MergeEnabled") == true);
    CHECK_FALSE(config.hasValue("Numbering", "not a key value line"));
    CHECK(config.getValue("Missing", "Key", "fallback") == "fallback");
}

TEST_CASE("typed getters reject malformed values") {
    IniConfig config;
    config.setValue("S", "Number", "12abc");
    config.setValue("S", "Flag", "maybe");
    CHECK_FALSE(config.getInt("S", "Number").has_value());
    CHECK_FALSE(config.getBool("S", "Flag").has_value());
    CHECK_FALSE(config.getInt("S", "Absent").has_value());

    config.setValue("S", "Negative", "-4");
    config.setValue("S", "Off", "OFF");
    CHECK(config.getInt("S", "Negative") == -4);
    CHECK(config.getBool("S", "Off") == false);
}

TEST_CASE("saved ini files load back") {
    TempDir temp;
    IniConfig config;
    config.setValue("Storage", "TrashDir", "/var/trash");
    config.setValue("History", "MaxSize", "50");
    REQUIRE(config.save(temp.str("out.ini")));

    IniConfig reloaded;
    REQUIRE(reloaded.load(temp.str("out.ini")));
    CHECK(reloaded.getValue("Storage", "TrashDir") == "/var/trash");
    CHECK(reloaded.getInt("History", "MaxSize") == 50);
}

TEST_CASE("loading a missing ini file reports failure") {
    TempDir temp;
    IniConfig config;
    CHECK_FALSE(config.load(temp.str("absent.ini")));
}
