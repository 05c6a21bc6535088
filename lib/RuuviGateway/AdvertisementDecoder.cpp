#include "AdvertisementDecoder.h"
#include <stdio.h>

namespace {

const uint8_t AD_FLAGS = 0x01;
const uint8_t AD_UUID16_INCOMPLETE = 0x02;
const uint8_t AD_UUID16_COMPLETE = 0x03;
const uint8_t AD_UUID128_INCOMPLETE = 0x06;
const uint8_t AD_UUID128_COMPLETE = 0x07;
const uint8_t AD_NAME_SHORT = 0x08;
const uint8_t AD_NAME_COMPLETE = 0x09;
const uint8_t AD_TX_POWER = 0x0A;
const uint8_t AD_SERVICE_DATA16 = 0x16;
const uint8_t AD_SERVICE_DATA128 = 0x21;
const uint8_t AD_MANUFACTURER = 0xFF;

uint16_t readLe16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

}  // namespace

std::string GapAdvertisementDecoder::uuid16ToString(uint16_t uuid) {
    char buf[40];
    snprintf(buf, sizeof(buf), "0000%04x-0000-1000-8000-00805f9b34fb", uuid);
    return std::string(buf);
}

std::string GapAdvertisementDecoder::uuid128ToString(const uint8_t* littleEndian) {
    static const char HEX_CHARS[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (int i = 15; i >= 0; i--) {
        out += HEX_CHARS[littleEndian[i] >> 4];
        out += HEX_CHARS[littleEndian[i] & 0x0F];
        if (i == 12 || i == 10 || i == 8 || i == 6) out += '-';
    }
    return out;
}

bool GapAdvertisementDecoder::decode(const std::vector<uint8_t>& payload, Advertisement& advertisement,
                                     std::string& error) const {
    Advertisement decoded;
    size_t offset = 0;

    while (offset < payload.size()) {
        const uint8_t fieldLen = payload[offset];
        if (fieldLen == 0) {
            break; // zero padding after the last structure
        }
        if (offset + 1 + fieldLen > payload.size()) {
            error = "AD structure at offset " + std::to_string(offset) + " overruns payload";
            return false;
        }

        const uint8_t adType = payload[offset + 1];
        const uint8_t* value = payload.data() + offset + 2;
        const size_t valueLen = fieldLen - 1;

        switch (adType) {
            case AD_FLAGS:
                if (valueLen >= 1) {
                    decoded.hasFlags = true;
                    decoded.flags = value[0];
                }
                break;

            case AD_UUID16_INCOMPLETE:
            case AD_UUID16_COMPLETE:
                for (size_t i = 0; i + 2 <= valueLen; i += 2) {
                    decoded.serviceUuids.push_back(uuid16ToString(readLe16(value + i)));
                }
                break;

            case AD_UUID128_INCOMPLETE:
            case AD_UUID128_COMPLETE:
                for (size_t i = 0; i + 16 <= valueLen; i += 16) {
                    decoded.serviceUuids.push_back(uuid128ToString(value + i));
                }
                break;

            case AD_NAME_SHORT:
            case AD_NAME_COMPLETE:
                // A complete name wins over a shortened one.
                if (adType == AD_NAME_COMPLETE || decoded.localName.empty()) {
                    decoded.localName.assign(value, value + valueLen);
                }
                break;

            case AD_TX_POWER:
                if (valueLen >= 1) {
                    decoded.hasTxPower = true;
                    decoded.txPower = static_cast<int8_t>(value[0]);
                }
                break;

            case AD_SERVICE_DATA16:
                if (valueLen < 2) {
                    error = "Service data shorter than its UUID";
                    return false;
                }
                decoded.serviceData[uuid16ToString(readLe16(value))].assign(value + 2, value + valueLen);
                break;

            case AD_SERVICE_DATA128:
                if (valueLen < 16) {
                    error = "Service data shorter than its UUID";
                    return false;
                }
                decoded.serviceData[uuid128ToString(value)].assign(value + 16, value + valueLen);
                break;

            case AD_MANUFACTURER:
                if (valueLen < 2) {
                    error = "Manufacturer data shorter than company id";
                    return false;
                }
                decoded.manufacturerData[readLe16(value)].assign(value + 2, value + valueLen);
                break;

            default:
                break;
        }

        offset += static_cast<size_t>(fieldLen) + 1;
    }

    advertisement = decoded;
    return true;
}
