#pragma once

#include "card_reader.hpp"
#include <cstdint>
#include <vector>

/// RC-S380 (NFC Port-100) card reader via libusb — direct USB communication
class Rcs380Reader : public CardReader {
public:
    Rcs380Reader();
    ~Rcs380Reader() override;

    void open() override;
    void close() override;
    std::optional<CardId> poll() override;

private:
    // USB transport
    void usb_open();
    void usb_write(const std::vector<uint8_t>& data);
    std::vector<uint8_t> usb_read(int timeout_ms = 500);

    // NFC Port-100 framing
    std::vector<uint8_t> build_frame(const std::vector<uint8_t>& data);
    std::vector<uint8_t> parse_frame(const std::vector<uint8_t>& frame);

    // NFC Port-100 commands
    std::vector<uint8_t> send_command(uint8_t cmd_code, const std::vector<uint8_t>& cmd_data);
    void set_command_type(uint8_t type);
    void get_firmware_version();
    void switch_rf(bool on);
    void in_set_rf(const std::vector<uint8_t>& settings);
    void in_set_protocol(const std::vector<uint8_t>& data);
    std::vector<uint8_t> in_comm_rf(const std::vector<uint8_t>& data, int timeout_ms);

    // ISO14443A anticollision, returns the assembled UID (empty if no card answered)
    std::vector<uint8_t> sense_target_uid();

    void* usb_ctx_ = nullptr;
    void* usb_handle_ = nullptr;
    uint8_t ep_out_ = 0;
    uint8_t ep_in_ = 0;
};
