#include "content.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

ContentEntry::ContentEntry(std::vector<Track> tracks, bool is_playlist)
    : tracks_(std::move(tracks)), is_playlist_(is_playlist) {}

ContentEntry ContentEntry::single(Track track) {
    return ContentEntry({std::move(track)}, false);
}

ContentEntry ContentEntry::playlist(std::vector<Track> tracks) {
    if (tracks.empty()) {
        throw ContentUnreadable("Playlist is empty");
    }
    return ContentEntry(std::move(tracks), true);
}

bool ContentEntry::advance() {
    if (!has_next()) return false;
    cursor_++;
    return true;
}

const std::vector<std::string>& playable_extensions() {
    static const std::vector<std::string> exts = {
        ".mp3", ".wav", ".ogg", ".flac", ".m4a", ".aac", ".opus",
    };
    return exts;
}

static bool is_playable(const fs::path& file) {
    std::string ext = file.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const auto& exts = playable_extensions();
    return std::find(exts.begin(), exts.end(), ext) != exts.end();
}

std::vector<Track> list_playable_files(const std::string& dir) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        throw ContentUnreadable("Cannot list " + dir + ": " + ec.message());
    }

    std::vector<fs::path> files;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && is_playable(it->path())) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        throw ContentUnreadable("Cannot list " + dir + ": " + ec.message());
    }

    // directory_iterator order is unspecified
    std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });

    std::vector<Track> tracks;
    tracks.reserve(files.size());
    for (const auto& f : files) {
        tracks.push_back({f.string()});
    }
    return tracks;
}

ContentResolver::ContentResolver(MappingTable table, std::string audio_dir)
    : table_(std::move(table)), audio_dir_(std::move(audio_dir)) {}

std::string ContentResolver::target_path(const std::string& content_path) const {
    fs::path p(content_path);
    if (p.is_absolute() || audio_dir_.empty()) {
        return p.string();
    }
    return (fs::path(audio_dir_) / p).string();
}

ContentEntry ContentResolver::resolve(const CardId& id) const {
    auto it = table_.find(id);
    if (it == table_.end()) {
        throw UnknownCard(id.to_hex());
    }

    std::string path = target_path(it->second);

    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        auto tracks = list_playable_files(path);
        if (tracks.empty()) {
            throw ContentUnreadable("No playable files in " + path);
        }
        return ContentEntry::playlist(std::move(tracks));
    }
    return ContentEntry::single({path});
}
