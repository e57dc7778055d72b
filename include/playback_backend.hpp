#pragma once

#include <string>

/// Audio output consumed by the session controller
class PlaybackBackend {
public:
    virtual ~PlaybackBackend() = default;

    /// Start playing `path` from the beginning, replacing anything playing.
    /// Throws ContentUnreadable if the file cannot be played.
    virtual void play(const std::string& path) = 0;

    virtual void pause() = 0;
    virtual void resume() = 0;
    virtual void stop() = 0;

    /// Non-blocking, idempotent: has the current track ended on its own?
    virtual bool is_finished() = 0;
};
