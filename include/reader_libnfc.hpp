#pragma once

#include "card_reader.hpp"

/// libnfc-based card reader — works with PN53x and other libnfc-supported readers
class LibnfcReader : public CardReader {
public:
    LibnfcReader();
    ~LibnfcReader() override;

    void open() override;
    void close() override;
    std::optional<CardId> poll() override;

private:
    void* nfc_context_ = nullptr;   // nfc_context*
    void* nfc_device_ = nullptr;    // nfc_device*
};
