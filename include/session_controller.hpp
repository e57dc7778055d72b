#pragma once

#include "card_events.hpp"
#include "config.hpp"
#include "content.hpp"
#include "playback_backend.hpp"
#include <optional>

enum class PlayState { Stopped, Playing, Paused };

const char* to_string(PlayState state);

/// What is currently happening. play_state != Stopped implies that
/// active_card and content are both set.
struct Session {
    std::optional<CardId> active_card;
    std::optional<ContentEntry> content;
    PlayState play_state = PlayState::Stopped;

    bool idle() const { return play_state == PlayState::Stopped; }
};

/// Playback state machine: reacts to card edge events and backend
/// completion, and owns the current Session.
class SessionController {
public:
    SessionController(const ContentResolver& resolver, PlaybackBackend& backend,
                      SessionPolicy policy = SessionPolicy());

    /// React to one normalized card event
    void handle(const CardEvent& event);

    /// Poll the backend; advance the playlist when the current track ended
    void tick();

    /// Stop any playback and clear the session
    void shutdown();

    const Session& session() const { return session_; }

private:
    void on_arrived(const CardId& id);
    void on_removed();
    void on_track_finished();

    void toggle_pause();
    void start_session(const CardId& id, ContentEntry content);

    /// Try tracks from the cursor on until one starts; false if none would
    bool play_from_cursor();

    /// Step the cursor honoring the end policy; false at the end of content
    bool step_cursor();

    void clear_session();

    const ContentResolver& resolver_;
    PlaybackBackend& backend_;
    SessionPolicy policy_;
    Session session_;
};
