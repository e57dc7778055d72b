#include "errors.hpp"
#include "fakes.hpp"
#include "mapping.hpp"

#include <gtest/gtest.h>
#include <sstream>

TEST(Mapping, FirstFieldIsCardLastFieldIsPath) {
    std::istringstream in("04a1b2c3 lullabies/\n"
                          "deadbeef Story of the week story.mp3\n");
    auto table = parse_mapping(in);

    ASSERT_EQ(table.size(), 2u);
    EXPECT_EQ(table.at(parse_card_id("04a1b2c3")), "lullabies/");
    EXPECT_EQ(table.at(parse_card_id("deadbeef")), "story.mp3");
}

TEST(Mapping, SkipsBlankLinesAndComments) {
    std::istringstream in("# kids room\n"
                          "\n"
                          "   \n"
                          "0102 a.mp3\r\n");
    auto table = parse_mapping(in);

    ASSERT_EQ(table.size(), 1u);
    EXPECT_EQ(table.at(parse_card_id("0102")), "a.mp3");
}

TEST(Mapping, CardIdIsCaseInsensitive) {
    std::istringstream in("DEADBEEF song.mp3\n");
    auto table = parse_mapping(in);
    EXPECT_EQ(table.count(parse_card_id("deadbeef")), 1u);
}

TEST(Mapping, SingleFieldIsAnError) {
    std::istringstream in("0102 a.mp3\n0304\n");
    try {
        parse_mapping(in, "cards.txt");
        FAIL() << "expected StartupConfigError";
    } catch (const StartupConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("cards.txt:2"), std::string::npos);
    }
}

TEST(Mapping, BadHexIsAnError) {
    std::istringstream in("xyz1 a.mp3\n");
    EXPECT_THROW(parse_mapping(in), StartupConfigError);
}

TEST(Mapping, DuplicateCardIsAnError) {
    std::istringstream in("0102 a.mp3\n0102 b.mp3\n");
    EXPECT_THROW(parse_mapping(in), StartupConfigError);
}

TEST(Mapping, MissingFileIsAnError) {
    TempDir dir;
    EXPECT_THROW(load_mapping_file(dir.path() + "/nope.txt"), StartupConfigError);
    EXPECT_THROW(load_mapping_file(dir.path()), StartupConfigError);
}

TEST(Mapping, LoadsFromFile) {
    TempDir dir;
    auto file = dir.touch("cards.txt", "0a0b0c0d song.mp3\n");
    auto table = load_mapping_file(file);
    EXPECT_EQ(table.at(parse_card_id("0a0b0c0d")), "song.mp3");
}
