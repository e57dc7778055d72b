#include "control_loop.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

ControlLoop::ControlLoop(CardReader& reader, SessionController& controller,
                         const PlayerConfig& config)
    : reader_(reader),
      controller_(controller),
      normalizer_(config.removal_dwell),
      poll_interval_ms_(std::max(1, config.poll_interval_ms)),
      failure_threshold_(std::max(1, config.failure_threshold)) {}

void ControlLoop::run(const std::atomic<bool>& stop) {
    const int slice_ms = std::min(poll_interval_ms_, 50);

    while (!stop) {
        tick();

        // Sleep in slices so a shutdown request is noticed quickly
        auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(poll_interval_ms_);
        while (!stop && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(slice_ms));
        }
    }

    controller_.shutdown();
}

void ControlLoop::tick() {
    read_card();

    try {
        controller_.tick();
    } catch (const std::exception& e) {
        RFID_LOG_ERROR("Playback check failed: " << e.what());
    }
}

void ControlLoop::read_card() {
    std::optional<CardId> poll;
    try {
        poll = reader_.poll();
    } catch (const HardwareReadFailure& e) {
        // No input this cycle: an error is not an empty read
        consecutive_failures_++;
        if (consecutive_failures_ % failure_threshold_ == 0) {
            RFID_LOG_ERROR("Card reader failed " << consecutive_failures_
                           << " times in a row: " << e.what());
        } else {
            RFID_LOG_DEBUG("Card read failed: " << e.what());
        }
        return;
    }

    if (consecutive_failures_ >= failure_threshold_) {
        RFID_LOG_INFO("Card reader recovered");
    }
    consecutive_failures_ = 0;

    for (const auto& event : normalizer_.feed(poll)) {
        if (event.type != CardEvent::Type::StillPresent) {
            RFID_LOG_DEBUG(to_string(event.type) << " " << event.id.to_hex());
        }
        try {
            controller_.handle(event);
        } catch (const std::exception& e) {
            RFID_LOG_ERROR("Handling " << to_string(event.type) << " failed: " << e.what());
        }
    }
}
