#include "GatewayTypes.h"
#include <ctype.h>
#include <stdio.h>
#include <time.h>

std::string TagData::dataHex() const {
    return toHex(data);
}

std::string TagData::isoTime() const {
    return formatUtcTimestamp(timestamp);
}

std::string HistoryResponse::gwMacSuffix() const {
    std::string suffix = gwMac.size() > 5 ? gwMac.substr(gwMac.size() - 5) : gwMac;
    for (auto& c : suffix) {
        c = static_cast<char>(toupper(static_cast<unsigned char>(c)));
    }
    return suffix;
}

std::string HistoryResponse::title() const {
    return "Ruuvi Gateway " + gwMacSuffix();
}

const char* gatewayResultToString(GatewayResult result) {
    switch (result) {
        case GatewayResult::SUCCESS: return "Success";
        case GatewayResult::ERROR_INVALID_AUTH: return "Invalid authentication";
        case GatewayResult::ERROR_CANNOT_CONNECT: return "Cannot connect";
        case GatewayResult::ERROR_DECODE: return "Invalid gateway data";
        case GatewayResult::ERROR_INVALID_PARAM: return "Invalid parameter";
        default: return "Unknown error";
    }
}

std::string toHex(const std::vector<uint8_t>& bytes) {
    static const char HEX_CHARS[] = "0123456789ABCDEF";
    std::string hex;
    hex.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        hex += HEX_CHARS[b >> 4];
        hex += HEX_CHARS[b & 0x0F];
    }
    return hex;
}

std::string formatUtcTimestamp(int64_t epochSeconds) {
    time_t raw = static_cast<time_t>(epochSeconds);
    struct tm utc;
    if (gmtime_r(&raw, &utc) == nullptr) {
        return "";
    }

    char buf[32];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ",
             utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
             utc.tm_hour, utc.tm_min, utc.tm_sec);
    return std::string(buf);
}
