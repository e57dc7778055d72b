#pragma once

#include "card_id.hpp"
#include "mapping.hpp"
#include <string>
#include <vector>

/// One playable file
struct Track {
    std::string path;

    bool operator==(const Track& other) const { return path == other.path; }
};

/// Either a single track or a non-empty playlist with a cursor
class ContentEntry {
public:
    static ContentEntry single(Track track);

    /// Throws ContentUnreadable if `tracks` is empty
    static ContentEntry playlist(std::vector<Track> tracks);

    bool is_playlist() const { return is_playlist_; }
    const std::vector<Track>& tracks() const { return tracks_; }
    size_t size() const { return tracks_.size(); }

    size_t cursor() const { return cursor_; }
    const Track& current() const { return tracks_[cursor_]; }

    bool has_next() const { return cursor_ + 1 < tracks_.size(); }

    /// Move to the next track; returns false (cursor unchanged) at the end
    bool advance();

    /// Move the cursor back to the first track
    void rewind() { cursor_ = 0; }

private:
    ContentEntry(std::vector<Track> tracks, bool is_playlist);

    std::vector<Track> tracks_;
    size_t cursor_ = 0;
    bool is_playlist_ = false;
};

/// File extensions treated as playable when expanding a folder (lowercase, with dot)
const std::vector<std::string>& playable_extensions();

/// Playable files in `dir`, sorted lexicographically by file name
std::vector<Track> list_playable_files(const std::string& dir);

/// Maps card IDs to content entries using a loaded mapping table
class ContentResolver {
public:
    ContentResolver(MappingTable table, std::string audio_dir);

    /// Resolve a card to its content.
    /// Throws UnknownCard for unmapped cards, ContentUnreadable for a
    /// folder target without playable files.
    ContentEntry resolve(const CardId& id) const;

    const MappingTable& table() const { return table_; }

    /// Mapping target joined onto the audio folder (absolute paths unchanged)
    std::string target_path(const std::string& content_path) const;

private:
    MappingTable table_;
    std::string audio_dir_;
};
