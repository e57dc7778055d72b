#pragma once

#include "card_id.hpp"
#include <memory>
#include <optional>

/// Abstract RFID/NFC card reader polled by the control loop
class CardReader {
public:
    virtual ~CardReader() = default;

    /// Open the reader device.
    /// Throws StartupConfigError when no reader is available.
    virtual void open() = 0;

    /// Release the reader device
    virtual void close() = 0;

    /// Look for a card in the field once (bounded, non-waiting).
    /// Returns the UID of the card present, or nullopt if there is none.
    /// Throws HardwareReadFailure on communication errors.
    virtual std::optional<CardId> poll() = 0;
};

/// Create the default card reader (selected at build time)
std::unique_ptr<CardReader> create_card_reader();
