#include "card_events.hpp"

#include <algorithm>

const char* to_string(CardEvent::Type type) {
    switch (type) {
    case CardEvent::Type::Arrived:      return "Arrived";
    case CardEvent::Type::StillPresent: return "StillPresent";
    case CardEvent::Type::Removed:      return "Removed";
    }
    return "?";
}

CardEventNormalizer::CardEventNormalizer(int removal_dwell)
    : removal_dwell_(std::max(1, removal_dwell)) {}

std::vector<CardEvent> CardEventNormalizer::feed(const std::optional<CardId>& poll) {
    std::vector<CardEvent> events;

    if (!poll) {
        if (!last_seen_) {
            return events;
        }
        // Card may only be flickering; confirm after the dwell count
        if (++empty_polls_ >= removal_dwell_) {
            events.push_back(CardEvent::removed());
            last_seen_.reset();
            empty_polls_ = 0;
        }
        return events;
    }

    empty_polls_ = 0;

    if (last_seen_ && *last_seen_ == *poll) {
        events.push_back(CardEvent::still_present(*poll));
        return events;
    }

    // Swap without an empty read in between: remove, then insert
    if (last_seen_) {
        events.push_back(CardEvent::removed());
    }
    events.push_back(CardEvent::arrived(*poll));
    last_seen_ = poll;
    return events;
}

void CardEventNormalizer::reset() {
    last_seen_.reset();
    empty_polls_ = 0;
}
