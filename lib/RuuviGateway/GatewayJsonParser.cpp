#include "GatewayJsonParser.h"
#include <ctype.h>
#include <limits.h>
#include <stdint.h>
#include <set>

namespace GatewayJsonParser {

namespace {

bool hexNibble(char c, uint8_t& nibble) {
    if (c >= '0' && c <= '9') {
        nibble = c - '0';
    } else if (c >= 'A' && c <= 'F') {
        nibble = c - 'A' + 10;
    } else if (c >= 'a' && c <= 'f') {
        nibble = c - 'a' + 10;
    } else {
        return false;
    }
    return true;
}

std::string trim(const std::string& value) {
    size_t start = 0;
    size_t end = value.size();
    while (start < end && isspace(static_cast<unsigned char>(value[start]))) start++;
    while (end > start && isspace(static_cast<unsigned char>(value[end - 1]))) end--;
    return value.substr(start, end - start);
}

bool readRequiredInteger(JsonObjectConst obj, const char* field, const std::string& context,
                         int64_t& parsed, std::string& error) {
    JsonVariantConst value = obj[field];
    if (value.isNull()) {
        error = context + ": missing field '" + field + "'";
        return false;
    }
    std::string detail;
    if (!parseInteger(value, parsed, detail)) {
        error = context + ": field '" + field + "' " + detail;
        return false;
    }
    return true;
}

bool decodeTag(const std::string& mac, JsonVariantConst value, int64_t responseTimestamp,
               TagData& tag, std::string& error) {
    const std::string context = "Tag " + mac;
    if (!value.is<JsonObjectConst>()) {
        error = context + ": entry is not an object";
        return false;
    }
    JsonObjectConst obj = value.as<JsonObjectConst>();

    int64_t timestamp = 0;
    if (!readRequiredInteger(obj, "timestamp", context, timestamp, error)) return false;

    int64_t rssi = 0;
    if (!readRequiredInteger(obj, "rssi", context, rssi, error)) return false;
    if (rssi < INT_MIN || rssi > INT_MAX) {
        error = context + ": field 'rssi' out of range";
        return false;
    }

    JsonVariantConst data = obj["data"];
    if (data.isNull()) {
        error = context + ": missing field 'data'";
        return false;
    }
    if (!data.is<const char*>()) {
        error = context + ": field 'data' is not a string";
        return false;
    }
    std::vector<uint8_t> payload;
    std::string hexError;
    if (!parseHex(data.as<const char*>(), payload, hexError)) {
        error = context + ": field 'data' " + hexError;
        return false;
    }
    if (payload.empty()) {
        error = context + ": field 'data' is empty";
        return false;
    }

    // A zero response timestamp means the gateway clock is not synchronised.
    const bool hasAge = responseTimestamp != 0;
    if (hasAge && (timestamp < 0 ? responseTimestamp > INT64_MAX + timestamp
                                 : responseTimestamp < INT64_MIN + timestamp)) {
        error = context + ": field 'timestamp' too far from response timestamp";
        return false;
    }

    tag.mac = mac;
    tag.rssi = static_cast<int>(rssi);
    tag.timestamp = timestamp;
    tag.data.swap(payload);
    tag.hasAgeSeconds = hasAge;
    tag.ageSeconds = hasAge ? responseTimestamp - timestamp : 0;
    return true;
}

}  // namespace

bool decodeHistory(JsonVariantConst root, HistoryResponse& response, std::string& error) {
    if (!root.is<JsonObjectConst>()) {
        error = "Response is not a JSON object";
        return false;
    }

    JsonVariantConst dataValue = root["data"];
    if (!dataValue.is<JsonObjectConst>()) {
        error = dataValue.isNull() ? "Missing field 'data'" : "Field 'data' is not an object";
        return false;
    }
    JsonObjectConst data = dataValue.as<JsonObjectConst>();

    HistoryResponse decoded;
    if (!readRequiredInteger(data, "timestamp", "Response", decoded.timestamp, error)) {
        return false;
    }

    JsonVariantConst gwMac = data["gw_mac"];
    if (!gwMac.is<const char*>()) {
        error = gwMac.isNull() ? "Response: missing field 'gw_mac'" : "Response: field 'gw_mac' is not a string";
        return false;
    }
    decoded.gwMac = gwMac.as<const char*>();

    JsonVariantConst coordinates = data["coordinates"];
    if (!coordinates.isNull()) {
        if (!coordinates.is<const char*>()) {
            error = "Response: field 'coordinates' is not a string";
            return false;
        }
        decoded.coordinates = coordinates.as<const char*>();
    }

    JsonVariantConst tags = data["tags"];
    if (!tags.isNull()) {
        if (!tags.is<JsonObjectConst>()) {
            error = "Response: field 'tags' is not an object";
            return false;
        }

        std::set<std::string> seen;
        for (JsonPairConst entry : tags.as<JsonObjectConst>()) {
            std::string mac = normalizeMac(entry.key().c_str());
            if (mac.empty()) {
                error = "Response: tag with empty identifier";
                return false;
            }
            if (!seen.insert(mac).second) {
                error = "Response: duplicate tag identifier " + mac;
                return false;
            }

            TagData tag;
            if (!decodeTag(mac, entry.value(), decoded.timestamp, tag, error)) {
                return false;
            }
            decoded.tags.push_back(tag);
        }
    }

    response = decoded;
    return true;
}

bool parseHex(const std::string& hex, std::vector<uint8_t>& bytes, std::string& error) {
    if (hex.size() % 2 != 0) {
        error = "has odd hex length";
        return false;
    }

    std::vector<uint8_t> decoded;
    decoded.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        uint8_t high;
        uint8_t low;
        if (!hexNibble(hex[i], high) || !hexNibble(hex[i + 1], low)) {
            error = "contains non-hex characters";
            return false;
        }
        decoded.push_back(static_cast<uint8_t>((high << 4) | low));
    }

    bytes.swap(decoded);
    return true;
}

std::string normalizeMac(const std::string& mac) {
    std::string normalized = trim(mac);
    for (auto& c : normalized) {
        c = static_cast<char>(toupper(static_cast<unsigned char>(c)));
    }
    return normalized;
}

bool parseInteger(JsonVariantConst value, int64_t& parsed, std::string& error) {
    if (value.is<bool>()) {
        error = "is a boolean, expected an integer";
        return false;
    }
    if (value.is<int64_t>()) {
        parsed = value.as<int64_t>();
        return true;
    }
    if (value.is<const char*>()) {
        return parseInteger(std::string(value.as<const char*>()), parsed, error);
    }
    error = "is not an integer";
    return false;
}

bool parseInteger(const std::string& text, int64_t& parsed, std::string& error) {
    parsed = 0;
    std::string input = trim(text);
    if (input.empty()) {
        error = "is empty";
        return false;
    }

    size_t start = 0;
    bool negative = false;
    if (input[0] == '+' || input[0] == '-') {
        negative = input[0] == '-';
        start = 1;
    }
    if (start >= input.size()) {
        error = "has no digits";
        return false;
    }

    int64_t value = 0;
    const int64_t limit = INT64_MAX / 10;
    for (size_t i = start; i < input.size(); i++) {
        if (!isdigit(static_cast<unsigned char>(input[i]))) {
            error = "contains non-digit characters";
            return false;
        }
        int digit = input[i] - '0';
        if (value > limit || (value == limit && digit > INT64_MAX % 10)) {
            error = "is out of range";
            return false;
        }
        value = value * 10 + digit;
    }

    parsed = negative ? -value : value;
    return true;
}

}  // namespace GatewayJsonParser
