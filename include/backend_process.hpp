#pragma once

#include "playback_backend.hpp"
#include <string>
#include <vector>

/// Plays each track with an external command-line player (mpg123, aplay, ...).
/// Pause and resume suspend and continue the player process.
class ProcessBackend : public PlaybackBackend {
public:
    /// `command` is split on whitespace; the track path is appended as last argument
    explicit ProcessBackend(const std::string& command, int stop_timeout_ms = 1000);
    ~ProcessBackend() override;

    ProcessBackend(const ProcessBackend&) = delete;
    ProcessBackend& operator=(const ProcessBackend&) = delete;

    void play(const std::string& path) override;
    void pause() override;
    void resume() override;
    void stop() override;
    bool is_finished() override;

private:
    /// Reap the child if it exited; returns true when it is gone
    bool reap(bool log_status);

    std::vector<std::string> argv_;
    int stop_timeout_ms_;
    int pid_ = -1;
    bool paused_ = false;
    std::string current_;
};
