#pragma once

#include "card_reader.hpp"
#include "errors.hpp"
#include "playback_backend.hpp"

#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

/// Temporary directory removed on destruction
class TempDir {
public:
    TempDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "rfid_player_XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (!mkdtemp(buf.data())) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = buf.data();
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::string& path() const { return path_; }

    /// Create (or overwrite) a file below the directory, returns its full path
    std::string touch(const std::string& rel, const std::string& content = "") const {
        std::filesystem::path p = std::filesystem::path(path_) / rel;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream out(p);
        out << content;
        return p.string();
    }

    std::string mkdir(const std::string& rel) const {
        std::filesystem::path p = std::filesystem::path(path_) / rel;
        std::filesystem::create_directories(p);
        return p.string();
    }

private:
    std::string path_;
};

/// Records every command; simulates in-track position
class FakeBackend : public PlaybackBackend {
public:
    std::vector<std::string> calls;
    std::set<std::string> unreadable;

    std::string current;
    bool playing = false;
    bool paused = false;
    bool finished = false;
    int position = 0;

    void play(const std::string& path) override {
        calls.push_back("play " + path);
        if (unreadable.count(path)) {
            throw ContentUnreadable("Error opening " + path);
        }
        current = path;
        playing = true;
        paused = false;
        finished = false;
        position = 0;
    }

    void pause() override {
        calls.push_back("pause");
        paused = true;
    }

    void resume() override {
        calls.push_back("resume");
        paused = false;
    }

    void stop() override {
        calls.push_back("stop");
        current.clear();
        playing = false;
        paused = false;
        finished = false;
    }

    bool is_finished() override { return finished; }

    /// Let playback run for `seconds`
    void run_for(int seconds) {
        if (playing && !paused) position += seconds;
    }

    void finish_track() { finished = true; }

    /// Paths passed to play(), in order
    std::vector<std::string> played() const {
        std::vector<std::string> out;
        for (const auto& c : calls) {
            if (c.compare(0, 5, "play ") == 0) out.push_back(c.substr(5));
        }
        return out;
    }
};

/// Replays a fixed sequence of poll results; empty polls once exhausted
class ScriptedReader : public CardReader {
public:
    int opened = 0;
    int closed = 0;

    void open() override { opened++; }
    void close() override { closed++; }

    std::optional<CardId> poll() override {
        if (script_.empty()) return std::nullopt;
        Step step = script_.front();
        script_.pop_front();
        if (step.fail) {
            throw HardwareReadFailure("scripted read failure");
        }
        return step.card;
    }

    ScriptedReader& card(const CardId& id, int times = 1) {
        for (int i = 0; i < times; i++) script_.push_back({id, false});
        return *this;
    }

    ScriptedReader& empty(int times = 1) {
        for (int i = 0; i < times; i++) script_.push_back({std::nullopt, false});
        return *this;
    }

    ScriptedReader& failure(int times = 1) {
        for (int i = 0; i < times; i++) script_.push_back({std::nullopt, true});
        return *this;
    }

    size_t remaining() const { return script_.size(); }

private:
    struct Step {
        std::optional<CardId> card;
        bool fail;
    };
    std::deque<Step> script_;
};
