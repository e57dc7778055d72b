#include "content.hpp"
#include "errors.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>
#include <memory>

static const CardId SONG = parse_card_id("01");
static const CardId FOLDER = parse_card_id("02");
static const CardId EMPTY = parse_card_id("03");
static const CardId ABSOLUTE = parse_card_id("04");

class ContentResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir.touch("song.mp3");
        dir.touch("album/02 - second.mp3");
        dir.touch("album/01 - first.MP3");
        dir.touch("album/10 - tenth.ogg");
        dir.touch("album/cover.jpg");
        dir.touch("album/notes.txt");
        dir.mkdir("album/bonus.mp3.d");
        dir.mkdir("empty");

        MappingTable table;
        table[SONG] = "song.mp3";
        table[FOLDER] = "album";
        table[EMPTY] = "empty/";
        table[ABSOLUTE] = "/srv/audio/track.wav";
        resolver = std::make_unique<ContentResolver>(table, dir.path());
    }

    TempDir dir;
    std::unique_ptr<ContentResolver> resolver;
};

TEST_F(ContentResolverTest, UnknownCardThrows) {
    try {
        resolver->resolve(parse_card_id("eeff"));
        FAIL() << "expected UnknownCard";
    } catch (const UnknownCard& e) {
        EXPECT_EQ(e.card_hex(), "eeff");
    }
}

TEST_F(ContentResolverTest, FileTargetIsSingleTrackBelowAudioDir) {
    auto content = resolver->resolve(SONG);
    EXPECT_FALSE(content.is_playlist());
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(content.current().path, dir.path() + "/song.mp3");
}

TEST_F(ContentResolverTest, AbsoluteTargetIsKept) {
    auto content = resolver->resolve(ABSOLUTE);
    EXPECT_EQ(content.current().path, "/srv/audio/track.wav");
}

TEST_F(ContentResolverTest, FolderExpandsToSortedPlaylist) {
    auto content = resolver->resolve(FOLDER);
    ASSERT_TRUE(content.is_playlist());
    ASSERT_EQ(content.size(), 3u);
    EXPECT_EQ(content.tracks()[0].path, dir.path() + "/album/01 - first.MP3");
    EXPECT_EQ(content.tracks()[1].path, dir.path() + "/album/02 - second.mp3");
    EXPECT_EQ(content.tracks()[2].path, dir.path() + "/album/10 - tenth.ogg");
    EXPECT_EQ(content.cursor(), 0u);
}

TEST_F(ContentResolverTest, FolderOrderIsReproducible) {
    auto first = resolver->resolve(FOLDER);
    auto second = resolver->resolve(FOLDER);
    EXPECT_EQ(first.tracks(), second.tracks());
}

TEST_F(ContentResolverTest, FolderWithoutAudioIsUnreadable) {
    EXPECT_THROW(resolver->resolve(EMPTY), ContentUnreadable);
}

TEST_F(ContentResolverTest, UnlistableFolderIsUnreadable) {
    EXPECT_THROW(list_playable_files(dir.path() + "/no-such-folder"), ContentUnreadable);
    EXPECT_THROW(list_playable_files(dir.path() + "/song.mp3"), ContentUnreadable);
}

TEST(ContentEntry, CursorStaysInRange) {
    auto content = ContentEntry::playlist({{"a.mp3"}, {"b.mp3"}});
    EXPECT_TRUE(content.has_next());
    EXPECT_TRUE(content.advance());
    EXPECT_EQ(content.current().path, "b.mp3");
    EXPECT_FALSE(content.has_next());
    EXPECT_FALSE(content.advance());
    EXPECT_EQ(content.cursor(), 1u);
    content.rewind();
    EXPECT_EQ(content.cursor(), 0u);
}

TEST(ContentEntry, EmptyPlaylistIsRejected) {
    EXPECT_THROW(ContentEntry::playlist({}), ContentUnreadable);
}
