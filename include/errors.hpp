#pragma once

#include <stdexcept>
#include <string>

/// Card is not present in the mapping table (recoverable)
class UnknownCard : public std::runtime_error {
public:
    explicit UnknownCard(const std::string& card_hex)
        : std::runtime_error("Card with id " + card_hex + " is not mapped"),
          card_hex_(card_hex) {}

    const std::string& card_hex() const { return card_hex_; }

private:
    std::string card_hex_;
};

/// A track or playlist cannot be opened or is empty (recoverable)
class ContentUnreadable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Transient card reader error, retried on the next poll cycle
class HardwareReadFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Missing mapping file, invalid entries or unavailable reader (fatal)
class StartupConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
