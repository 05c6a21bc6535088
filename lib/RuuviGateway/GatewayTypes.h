#ifndef RUUVI_GATEWAY_TYPES_H
#define RUUVI_GATEWAY_TYPES_H

#include <stdint.h>
#include <map>
#include <string>
#include <vector>

enum class GatewayResult {
    SUCCESS = 0,
    ERROR_INVALID_AUTH = -1,
    ERROR_CANNOT_CONNECT = -2,
    ERROR_DECODE = -3,
    ERROR_INVALID_PARAM = -4
};

// One beacon sighting as reported by the gateway history endpoint.
struct TagData {
    std::string mac;
    int rssi = 0;
    int64_t timestamp = 0;
    std::vector<uint8_t> data;
    bool hasAgeSeconds = false;
    int64_t ageSeconds = 0;

    std::string dataHex() const;
    std::string isoTime() const;
};

struct HistoryResponse {
    int64_t timestamp = 0;
    std::string gwMac;
    std::vector<TagData> tags;
    std::string coordinates;

    // Last five characters of the gateway MAC, upper-cased. Labels only.
    std::string gwMacSuffix() const;
    std::string title() const;
};

// Last seen payload per normalized tag identifier.
typedef std::map<std::string, std::vector<uint8_t>> TagState;

const char* gatewayResultToString(GatewayResult result);
// Upper-case hex, two characters per byte.
std::string toHex(const std::vector<uint8_t>& bytes);
std::string formatUtcTimestamp(int64_t epochSeconds);

#endif
