#include "reader_libnfc.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <nfc/nfc.h>
#include <nfc/nfc-types.h>

#include <string>

LibnfcReader::LibnfcReader() {}

LibnfcReader::~LibnfcReader() {
    close();
}

void LibnfcReader::open() {
    nfc_context* context = nullptr;
    nfc_init(&context);
    if (!context) {
        throw StartupConfigError("Failed to initialize libnfc");
    }
    nfc_context_ = context;

    nfc_device* device = nfc_open(context, nullptr);
    if (!device) {
        throw StartupConfigError(
            "Failed to open NFC device. libnfc-supported reader required "
            "(e.g. PN532, ACR122U). For RC-S380, build with the rcs380 backend.");
    }
    nfc_device_ = device;

    if (nfc_initiator_init(device) < 0) {
        throw StartupConfigError(std::string("Failed to initialize NFC initiator mode: ") +
                                 nfc_strerror(device));
    }

    // Selection must return when no card is in the field
    if (nfc_device_set_property_bool(device, NP_INFINITE_SELECT, false) < 0) {
        throw StartupConfigError(std::string("Failed to disable infinite select: ") +
                                 nfc_strerror(device));
    }

    RFID_LOG_INFO("NFC reader opened: " << nfc_device_get_name(device));
}

void LibnfcReader::close() {
    if (nfc_device_) {
        nfc_close(static_cast<nfc_device*>(nfc_device_));
        nfc_device_ = nullptr;
    }
    if (nfc_context_) {
        nfc_exit(static_cast<nfc_context*>(nfc_context_));
        nfc_context_ = nullptr;
    }
}

std::optional<CardId> LibnfcReader::poll() {
    if (!nfc_device_) {
        throw HardwareReadFailure("NFC reader is not open");
    }

    nfc_device* device = static_cast<nfc_device*>(nfc_device_);

    nfc_modulation nm;
    nm.nmt = NMT_ISO14443A;
    nm.nbr = NBR_106;

    nfc_target target;
    int res = nfc_initiator_select_passive_target(device, nm, nullptr, 0, &target);
    if (res == 0 || res == NFC_ETIMEOUT) {
        return std::nullopt;
    }
    if (res < 0) {
        throw HardwareReadFailure(std::string("Card read failed: ") + nfc_strerror(device));
    }

    std::vector<uint8_t> uid(target.nti.nai.abtUid,
                             target.nti.nai.abtUid + target.nti.nai.szUidLen);

    // Release the card so the next poll selects it again
    nfc_initiator_deselect_target(device);

    if (uid.empty()) {
        return std::nullopt;
    }
    return CardId(std::move(uid));
}

// Factory function for libnfc backend
#ifdef RFID_BACKEND_LIBNFC
std::unique_ptr<CardReader> create_card_reader() {
    return std::make_unique<LibnfcReader>();
}
#endif
