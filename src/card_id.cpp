#include "card_id.hpp"

#include <cctype>
#include <functional>
#include <stdexcept>

std::string CardId::to_hex() const {
    static const char* digits = "0123456789abcdef";
    std::string s;
    s.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        s.push_back(digits[b >> 4]);
        s.push_back(digits[b & 0x0F]);
    }
    return s;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

CardId parse_card_id(const std::string& hex) {
    if (hex.empty() || hex.size() % 2 != 0) {
        throw std::invalid_argument("Card id must be an even number of hex digits: '" + hex + "'");
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("Card id contains a non-hex digit: '" + hex + "'");
        }
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return CardId(std::move(bytes));
}

size_t CardIdHash::operator()(const CardId& id) const {
    return std::hash<std::string>()(std::string(id.bytes.begin(), id.bytes.end()));
}
