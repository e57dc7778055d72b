#pragma once

#include "card_events.hpp"
#include "card_reader.hpp"
#include "config.hpp"
#include "session_controller.hpp"
#include <atomic>

/// Cooperative poll cycle: read the card, normalize, dispatch, check playback
class ControlLoop {
public:
    ControlLoop(CardReader& reader, SessionController& controller,
                const PlayerConfig& config);

    /// Run cycles until `stop` becomes true, then stop playback
    void run(const std::atomic<bool>& stop);

    /// One cycle without sleeping
    void tick();

    int consecutive_failures() const { return consecutive_failures_; }

private:
    void read_card();

    CardReader& reader_;
    SessionController& controller_;
    CardEventNormalizer normalizer_;
    int poll_interval_ms_;
    int failure_threshold_;
    int consecutive_failures_ = 0;
};
