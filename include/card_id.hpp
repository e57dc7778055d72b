#pragma once

#include <cstdint>
#include <string>
#include <vector>

/// Card UID as read from the reader (4, 7 or 10 bytes for ISO14443A)
struct CardId {
    std::vector<uint8_t> bytes;

    CardId() = default;
    explicit CardId(std::vector<uint8_t> uid) : bytes(std::move(uid)) {}

    bool empty() const { return bytes.empty(); }

    /// Lowercase hex form, as written in the mapping file
    std::string to_hex() const;

    bool operator==(const CardId& other) const { return bytes == other.bytes; }
    bool operator!=(const CardId& other) const { return bytes != other.bytes; }
};

/// Parse a hex string (case-insensitive, even length) into a CardId.
/// Throws std::invalid_argument on malformed input.
CardId parse_card_id(const std::string& hex);

/// Hash for unordered containers keyed by CardId
struct CardIdHash {
    size_t operator()(const CardId& id) const;
};
