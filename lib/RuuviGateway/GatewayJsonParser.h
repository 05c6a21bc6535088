#ifndef RUUVI_GATEWAY_JSON_PARSER_H
#define RUUVI_GATEWAY_JSON_PARSER_H

#include <ArduinoJson.h>
#include <stdint.h>
#include <string>
#include <vector>
#include "GatewayTypes.h"

namespace GatewayJsonParser {

// Decodes an already parsed /history document. On failure `response` is left
// untouched and `error` names the offending field.
bool decodeHistory(JsonVariantConst root, HistoryResponse& response, std::string& error);

bool parseHex(const std::string& hex, std::vector<uint8_t>& bytes, std::string& error);
std::string normalizeMac(const std::string& mac);

// Accepts a JSON integer or a string holding a plain decimal integer.
bool parseInteger(JsonVariantConst value, int64_t& parsed, std::string& error);
bool parseInteger(const std::string& text, int64_t& parsed, std::string& error);

}  // namespace GatewayJsonParser

#endif
