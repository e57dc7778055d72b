#pragma once

#include "card_id.hpp"
#include <optional>
#include <vector>

/// Edge event derived from presence polling
struct CardEvent {
    enum class Type { Arrived, StillPresent, Removed };

    Type type;
    CardId id;   // empty for Removed

    static CardEvent arrived(const CardId& id) { return {Type::Arrived, id}; }
    static CardEvent still_present(const CardId& id) { return {Type::StillPresent, id}; }
    static CardEvent removed() { return {Type::Removed, CardId()}; }
};

const char* to_string(CardEvent::Type type);

/// Turns raw poll results into Arrived/StillPresent/Removed edges.
///
/// A card swap without an empty read in between is reported as Removed
/// followed by Arrived. Removal is only confirmed after `removal_dwell`
/// consecutive empty polls, so a flickering read of a card resting on the
/// reader never produces a Removed/Arrived pair.
class CardEventNormalizer {
public:
    explicit CardEventNormalizer(int removal_dwell = 2);

    /// Feed one poll result, returns the events it produced (0, 1 or 2)
    std::vector<CardEvent> feed(const std::optional<CardId>& poll);

    /// Card currently considered present, if any
    const std::optional<CardId>& present() const { return last_seen_; }

    /// Forget the present card without emitting events
    void reset();

private:
    int removal_dwell_;
    int empty_polls_ = 0;
    std::optional<CardId> last_seen_;
};
