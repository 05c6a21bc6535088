#ifndef RUUVI_ADVERTISEMENT_DECODER_H
#define RUUVI_ADVERTISEMENT_DECODER_H

#include <stdint.h>
#include <map>
#include <string>
#include <vector>

struct Advertisement {
    bool hasFlags = false;
    uint8_t flags = 0;
    std::string localName;
    std::vector<std::string> serviceUuids;
    std::map<std::string, std::vector<uint8_t>> serviceData;
    std::map<uint16_t, std::vector<uint8_t>> manufacturerData;
    bool hasTxPower = false;
    int8_t txPower = 0;
};

class AdvertisementDecoder {
public:
    virtual ~AdvertisementDecoder() = default;
    virtual bool decode(const std::vector<uint8_t>& payload, Advertisement& advertisement,
                        std::string& error) const = 0;
};

// Generic GAP AD-structure walker. Manufacturer payloads are kept opaque.
class GapAdvertisementDecoder : public AdvertisementDecoder {
public:
    bool decode(const std::vector<uint8_t>& payload, Advertisement& advertisement,
                std::string& error) const override;

    static std::string uuid16ToString(uint16_t uuid);
    static std::string uuid128ToString(const uint8_t* littleEndian);
};

#endif
