#include "reader_rcs380.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <libusb-1.0/libusb.h>

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>

// RC-S380 USB identifiers
static const uint16_t RC_S380_VENDOR_ID  = 0x054C; // Sony
static const uint16_t RC_S380_PRODUCT_ID = 0x06C1; // RC-S380

// NFC Port-100 constants
static const uint8_t ACK_FRAME[] = {0x00, 0x00, 0xFF, 0x00, 0xFF, 0x00};

// Default protocol settings (from nfcpy)
static const std::vector<uint8_t> IN_SET_PROTOCOL_DEFAULTS = {
    0x00, 0x18, 0x01, 0x01, 0x02, 0x01, 0x03, 0x00,
    0x04, 0x00, 0x05, 0x00, 0x06, 0x00, 0x07, 0x08,
    0x08, 0x00, 0x09, 0x00, 0x0A, 0x00, 0x0B, 0x00,
    0x0C, 0x00, 0x0E, 0x04, 0x0F, 0x00, 0x10, 0x00,
    0x11, 0x00, 0x12, 0x00, 0x13, 0x06
};

// ISO14443A cascade tag in an SDD response
static const uint8_t CASCADE_TAG = 0x88;

Rcs380Reader::Rcs380Reader() {}

Rcs380Reader::~Rcs380Reader() {
    close();
}

// ==================== USB Transport ====================

void Rcs380Reader::usb_open() {
    libusb_context* ctx = nullptr;
    if (libusb_init(&ctx) < 0) {
        throw StartupConfigError("Failed to initialize libusb");
    }
    usb_ctx_ = ctx;

    libusb_device_handle* handle = libusb_open_device_with_vid_pid(
        ctx, RC_S380_VENDOR_ID, RC_S380_PRODUCT_ID);
    if (!handle) {
        throw StartupConfigError("RC-S380 not found (is it connected?)");
    }
    usb_handle_ = handle;

    if (libusb_kernel_driver_active(handle, 0) == 1) {
        libusb_detach_kernel_driver(handle, 0);
    }

    if (libusb_claim_interface(handle, 0) < 0) {
        throw StartupConfigError("Failed to claim USB interface");
    }

    libusb_device* dev = libusb_get_device(handle);
    libusb_config_descriptor* config = nullptr;
    if (libusb_get_active_config_descriptor(dev, &config) < 0) {
        throw StartupConfigError("Failed to read USB configuration");
    }

    for (int i = 0; i < config->interface[0].altsetting[0].bNumEndpoints; i++) {
        auto& ep = config->interface[0].altsetting[0].endpoint[i];
        if ((ep.bEndpointAddress & LIBUSB_ENDPOINT_IN) != 0) {
            ep_in_ = ep.bEndpointAddress;
        } else {
            ep_out_ = ep.bEndpointAddress;
        }
    }

    libusb_free_config_descriptor(config);

    if (!ep_in_ || !ep_out_) {
        throw StartupConfigError("Could not find USB endpoints");
    }
}

void Rcs380Reader::usb_write(const std::vector<uint8_t>& data) {
    auto handle = static_cast<libusb_device_handle*>(usb_handle_);
    int transferred;
    int ret = libusb_bulk_transfer(handle, ep_out_,
        const_cast<uint8_t*>(data.data()), (int)data.size(),
        &transferred, 1000);
    if (ret < 0) {
        throw HardwareReadFailure(std::string("USB write failed: ") +
                                  libusb_error_name(ret));
    }
}

/// Returns an empty buffer on timeout
std::vector<uint8_t> Rcs380Reader::usb_read(int timeout_ms) {
    auto handle = static_cast<libusb_device_handle*>(usb_handle_);
    uint8_t buf[512];
    int transferred = 0;
    int ret = libusb_bulk_transfer(handle, ep_in_, buf, sizeof(buf),
                                   &transferred, timeout_ms);
    if (ret == LIBUSB_ERROR_TIMEOUT) {
        return {};
    }
    if (ret < 0) {
        throw HardwareReadFailure(std::string("USB read failed: ") +
                                  libusb_error_name(ret));
    }
    return std::vector<uint8_t>(buf, buf + transferred);
}

void Rcs380Reader::close() {
    if (usb_handle_) {
        auto handle = static_cast<libusb_device_handle*>(usb_handle_);
        libusb_release_interface(handle, 0);
        libusb_close(handle);
        usb_handle_ = nullptr;
    }
    if (usb_ctx_) {
        libusb_exit(static_cast<libusb_context*>(usb_ctx_));
        usb_ctx_ = nullptr;
    }
}

// ==================== NFC Port-100 Framing ====================

std::vector<uint8_t> Rcs380Reader::build_frame(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> frame = {0x00, 0x00, 0xFF, 0xFF, 0xFF};
    uint16_t len = (uint16_t)data.size();
    frame.push_back(len & 0xFF);
    frame.push_back((len >> 8) & 0xFF);
    uint8_t len_sum = (uint8_t)((256 - ((frame[5] + frame[6]) & 0xFF)) & 0xFF);
    frame.push_back(len_sum);
    frame.insert(frame.end(), data.begin(), data.end());
    uint8_t data_sum = 0;
    for (size_t i = 8; i < frame.size(); i++) data_sum += frame[i];
    frame.push_back((uint8_t)((256 - data_sum) & 0xFF));
    frame.push_back(0x00);
    return frame;
}

std::vector<uint8_t> Rcs380Reader::parse_frame(const std::vector<uint8_t>& frame) {
    if (frame.size() >= 8 &&
        frame[0] == 0x00 && frame[1] == 0x00 && frame[2] == 0xFF &&
        frame[3] == 0xFF && frame[4] == 0xFF) {
        uint16_t len = frame[5] | (frame[6] << 8);
        if (frame.size() >= (size_t)(8 + len)) {
            return std::vector<uint8_t>(frame.begin() + 8, frame.begin() + 8 + len);
        }
    }
    return {};
}

std::vector<uint8_t> Rcs380Reader::send_command(uint8_t cmd_code,
                                                const std::vector<uint8_t>& cmd_data) {
    std::vector<uint8_t> cmd = {0xD6, cmd_code};
    cmd.insert(cmd.end(), cmd_data.begin(), cmd_data.end());
    usb_write(build_frame(cmd));

    std::vector<uint8_t> buffer;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);

    while (std::chrono::steady_clock::now() < deadline) {
        auto raw = usb_read(100);
        buffer.insert(buffer.end(), raw.begin(), raw.end());

        // Process buffer for frames
        while (buffer.size() >= 6) {
            auto it = std::search(buffer.begin(), buffer.end(), ACK_FRAME, ACK_FRAME + 3);
            if (it == buffer.end()) {
                if (buffer.size() > 1024) buffer.clear();
                break;
            }
            if (it != buffer.begin()) {
                buffer.erase(buffer.begin(), it);
            }

            if (buffer.size() < 6) break;

            // ACK
            if (buffer[3] == 0x00 && buffer[4] == 0xFF && buffer[5] == 0x00) {
                buffer.erase(buffer.begin(), buffer.begin() + 6);
                continue;
            }

            if (buffer.size() >= 10 && buffer[3] == 0xFF && buffer[4] == 0xFF) {
                uint16_t len = buffer[5] | (buffer[6] << 8);
                if (buffer.size() < (size_t)(10 + len)) break;

                auto data_frame = std::vector<uint8_t>(buffer.begin(), buffer.begin() + 10 + len);
                buffer.erase(buffer.begin(), buffer.begin() + 10 + len);

                auto rsp = parse_frame(data_frame);
                if (rsp.size() >= 2 && rsp[0] == 0xD7 && rsp[1] == cmd_code + 1) {
                    return std::vector<uint8_t>(rsp.begin() + 2, rsp.end());
                }
            } else if (buffer.size() >= 10) {
                buffer.erase(buffer.begin());
            } else {
                break;
            }
        }
    }

    throw HardwareReadFailure("Timeout waiting for RC-S380 command response");
}

void Rcs380Reader::set_command_type(uint8_t type) {
    auto data = send_command(0x2A, {type});
    if (!data.empty() && data[0] != 0) throw HardwareReadFailure("set_command_type failed");
}

void Rcs380Reader::get_firmware_version() {
    auto data = send_command(0x20, {});
    if (data.size() >= 2) {
        std::ostringstream oss;
        oss << (int)data[1] << "." << std::setw(2) << std::setfill('0') << (int)data[0];
        RFID_LOG_INFO("RC-S380 firmware: v" << oss.str());
    }
}

void Rcs380Reader::switch_rf(bool on) {
    auto data = send_command(0x06, {(uint8_t)(on ? 1 : 0)});
    if (!data.empty() && data[0] != 0) throw HardwareReadFailure("switch_rf failed");
}

void Rcs380Reader::in_set_rf(const std::vector<uint8_t>& settings) {
    auto data = send_command(0x00, settings);
    if (!data.empty() && data[0] != 0) throw HardwareReadFailure("in_set_rf failed");
}

void Rcs380Reader::in_set_protocol(const std::vector<uint8_t>& data) {
    if (data.empty()) return;
    auto result = send_command(0x02, data);
    if (!result.empty() && result[0] != 0) throw HardwareReadFailure("in_set_protocol failed");
}

/// Returns the card's answer; empty when the card did not respond in time
std::vector<uint8_t> Rcs380Reader::in_comm_rf(const std::vector<uint8_t>& data, int timeout_ms) {
    uint16_t timeout = std::min((timeout_ms + 1) * 10, 0xFFFF);
    std::vector<uint8_t> cmd_data;
    cmd_data.push_back(timeout & 0xFF);
    cmd_data.push_back((timeout >> 8) & 0xFF);
    cmd_data.insert(cmd_data.end(), data.begin(), data.end());
    auto result = send_command(0x04, cmd_data);
    if (result.size() >= 4 && (result[0] != 0 || result[1] != 0 ||
                                result[2] != 0 || result[3] != 0)) {
        // Status bits report RF timeouts and collisions: no usable answer
        return {};
    }
    if (result.size() > 5) {
        return std::vector<uint8_t>(result.begin() + 5, result.end());
    }
    return {};
}

// ==================== ISO14443A Anticollision ====================

std::vector<uint8_t> Rcs380Reader::sense_target_uid() {
    in_set_rf({0x02, 0x03, 0x0F, 0x03});
    in_set_protocol(IN_SET_PROTOCOL_DEFAULTS);
    in_set_protocol({
        0x00, 0x06, 0x01, 0x00, 0x02, 0x00, 0x05, 0x01, 0x07, 0x07,
    });

    // SENS_REQ
    auto sens_res = in_comm_rf({0x26}, 30);
    if (sens_res.size() != 2) return {};

    in_set_protocol({0x07, 0x08, 0x04, 0x01});

    std::vector<uint8_t> uid;
    for (uint8_t sel_cmd : {0x93, 0x95, 0x97}) {
        in_set_protocol({0x01, 0x00, 0x02, 0x00});
        auto sdd_res = in_comm_rf({sel_cmd, 0x20}, 30);
        if (sdd_res.size() < 5) return {};

        // UID CLn: CT + 3 bytes when another level follows, else 4 bytes
        if (sdd_res[0] == CASCADE_TAG) {
            uid.insert(uid.end(), sdd_res.begin() + 1, sdd_res.begin() + 4);
        } else {
            uid.insert(uid.end(), sdd_res.begin(), sdd_res.begin() + 4);
        }

        in_set_protocol({0x01, 0x01, 0x02, 0x01});
        std::vector<uint8_t> sel_req = {sel_cmd, 0x70};
        sel_req.insert(sel_req.end(), sdd_res.begin(), sdd_res.begin() + 5);
        auto sel_res = in_comm_rf(sel_req, 30);
        if (sel_res.empty()) return {};

        uint8_t sak = sel_res[0];
        if (!(sak & 0x04)) return uid;
    }

    return {};
}

// ==================== Public Interface ====================

void Rcs380Reader::open() {
    usb_open();

    try {
        std::vector<uint8_t> ack(ACK_FRAME, ACK_FRAME + sizeof(ACK_FRAME));
        usb_write(ack);
        while (!usb_read(100).empty()) {}

        set_command_type(1);
        get_firmware_version();
        switch_rf(false);
    } catch (const HardwareReadFailure& e) {
        throw StartupConfigError(std::string("RC-S380 initialization failed: ") + e.what());
    }
}

std::optional<CardId> Rcs380Reader::poll() {
    if (!usb_handle_) {
        throw HardwareReadFailure("RC-S380 is not open");
    }

    switch_rf(true);
    std::vector<uint8_t> uid;
    try {
        uid = sense_target_uid();
    } catch (const HardwareReadFailure&) {
        // Leave the field off even when the exchange broke down
        switch_rf(false);
        throw;
    }
    switch_rf(false);

    if (uid.empty()) {
        return std::nullopt;
    }
    return CardId(std::move(uid));
}

// Factory function for RC-S380 backend
#ifdef RFID_BACKEND_RCS380
std::unique_ptr<CardReader> create_card_reader() {
    return std::make_unique<Rcs380Reader>();
}
#endif
