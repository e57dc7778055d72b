#pragma once

#include <string>

// ── Defaults
#define RFID_DEFAULT_POLL_MS            500
#define RFID_DEFAULT_REMOVAL_DWELL      2
#define RFID_DEFAULT_FAILURE_THRESHOLD  10
#define RFID_DEFAULT_PLAYER_COMMAND     "mpg123 -q"
#define RFID_PLAYER_STOP_TIMEOUT_MS     1000

/// What re-presenting a paused card does
enum class ResumePolicy {
    Position,      // continue inside the track where it was paused
    RestartTrack,  // play the current playlist track again from its start
};

/// What happens after the last track of the content finished
enum class EndPolicy {
    Stop,  // clear the session
    Loop,  // start over at the first track
};

/// What lifting the card off the reader does
enum class RemovalPolicy {
    Stop,         // stop playback and clear the session
    KeepPlaying,  // keep playing; the next presentation is a pause/resume gesture
};

/// Session controller behavior
struct SessionPolicy {
    ResumePolicy resume = ResumePolicy::Position;
    EndPolicy on_end = EndPolicy::Stop;
    RemovalPolicy on_remove = RemovalPolicy::Stop;
};

/// All runtime settings, filled from defaults and the command line
struct PlayerConfig {
    std::string audio_dir;
    std::string mapping_file;

    int poll_interval_ms = RFID_DEFAULT_POLL_MS;
    int removal_dwell = RFID_DEFAULT_REMOVAL_DWELL;
    int failure_threshold = RFID_DEFAULT_FAILURE_THRESHOLD;
    std::string player_command = RFID_DEFAULT_PLAYER_COMMAND;
    std::string log_file;

    SessionPolicy policy;
};

/// Parse policy names as accepted on the command line; throw std::invalid_argument
ResumePolicy parse_resume_policy(const std::string& name);
EndPolicy parse_end_policy(const std::string& name);
RemovalPolicy parse_removal_policy(const std::string& name);
