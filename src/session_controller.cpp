#include "session_controller.hpp"
#include "errors.hpp"
#include "log.hpp"

const char* to_string(PlayState state) {
    switch (state) {
    case PlayState::Stopped: return "Stopped";
    case PlayState::Playing: return "Playing";
    case PlayState::Paused:  return "Paused";
    }
    return "?";
}

SessionController::SessionController(const ContentResolver& resolver, PlaybackBackend& backend,
                                     SessionPolicy policy)
    : resolver_(resolver), backend_(backend), policy_(policy) {}

void SessionController::handle(const CardEvent& event) {
    switch (event.type) {
    case CardEvent::Type::Arrived:
        on_arrived(event.id);
        break;
    case CardEvent::Type::Removed:
        on_removed();
        break;
    case CardEvent::Type::StillPresent:
        break;
    }
}

void SessionController::tick() {
    if (session_.play_state != PlayState::Playing) return;
    if (backend_.is_finished()) {
        on_track_finished();
    }
}

void SessionController::shutdown() {
    if (!session_.idle()) {
        RFID_LOG_INFO("Stopping playback");
    }
    backend_.stop();
    session_ = Session();
}

void SessionController::on_arrived(const CardId& id) {
    if (session_.active_card && *session_.active_card == id && !session_.idle()) {
        toggle_pause();
        return;
    }

    // Resolve before touching the running session: a bad card changes nothing
    std::optional<ContentEntry> content;
    try {
        content = resolver_.resolve(id);
    } catch (const UnknownCard& e) {
        RFID_LOG_WARN(e.what());
        return;
    } catch (const ContentUnreadable& e) {
        RFID_LOG_WARN("Card " << id.to_hex() << ": " << e.what());
        return;
    }

    if (!session_.idle()) {
        RFID_LOG_INFO("Card " << id.to_hex() << " replaces " << session_.active_card->to_hex());
        backend_.stop();
        clear_session();
    }
    start_session(id, std::move(*content));
}

void SessionController::on_removed() {
    if (session_.idle()) return;

    if (policy_.on_remove == RemovalPolicy::KeepPlaying) {
        RFID_LOG_DEBUG("Card " << session_.active_card->to_hex() << " lifted, session kept");
        return;
    }

    RFID_LOG_INFO("Card " << session_.active_card->to_hex() << " removed, stopping");
    backend_.stop();
    clear_session();
}

void SessionController::on_track_finished() {
    auto& content = *session_.content;
    RFID_LOG_DEBUG("Finished " << content.current().path);

    if (!step_cursor()) {
        RFID_LOG_INFO("Content of card " << session_.active_card->to_hex() << " finished");
        backend_.stop();
        clear_session();
        return;
    }
    if (!play_from_cursor()) {
        backend_.stop();
        clear_session();
    }
}

void SessionController::toggle_pause() {
    if (session_.play_state == PlayState::Playing) {
        backend_.pause();
        session_.play_state = PlayState::Paused;
        RFID_LOG_INFO("Paused " << session_.content->current().path);
        return;
    }

    if (policy_.resume == ResumePolicy::RestartTrack) {
        RFID_LOG_INFO("Restarting " << session_.content->current().path);
        if (!play_from_cursor()) {
            backend_.stop();
            clear_session();
        }
        return;
    }

    backend_.resume();
    session_.play_state = PlayState::Playing;
    RFID_LOG_INFO("Resumed " << session_.content->current().path);
}

void SessionController::start_session(const CardId& id, ContentEntry content) {
    session_.active_card = id;
    session_.content = std::move(content);
    session_.content->rewind();

    RFID_LOG_INFO("Card " << id.to_hex() << ": "
                  << (session_.content->is_playlist() ? "playlist of " : "")
                  << session_.content->size() << " track(s)");

    if (!play_from_cursor()) {
        RFID_LOG_WARN("Nothing playable for card " << id.to_hex());
        clear_session();
    }
}

bool SessionController::play_from_cursor() {
    auto& content = *session_.content;

    // Each track gets one attempt, so an all-failing looped playlist ends
    for (size_t attempt = 0; attempt < content.size(); attempt++) {
        try {
            backend_.play(content.current().path);
            session_.play_state = PlayState::Playing;
            RFID_LOG_INFO("Playing " << content.current().path
                          << " (" << content.cursor() + 1 << "/" << content.size() << ")");
            return true;
        } catch (const ContentUnreadable& e) {
            RFID_LOG_WARN(e.what());
        }
        if (!step_cursor()) break;
    }
    return false;
}

bool SessionController::step_cursor() {
    auto& content = *session_.content;
    if (content.advance()) return true;
    if (policy_.on_end == EndPolicy::Loop) {
        content.rewind();
        return true;
    }
    return false;
}

void SessionController::clear_session() {
    session_ = Session();
}
