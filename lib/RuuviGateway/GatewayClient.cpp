#include "GatewayClient.h"
#include "GatewayJsonParser.h"
#include <ctype.h>

static const size_t VERBOSE_BODY_LIMIT = 512;

static std::string trimmed(const std::string& value) {
    size_t start = 0;
    size_t end = value.size();
    while (start < end && isspace(static_cast<unsigned char>(value[start]))) start++;
    while (end > start && isspace(static_cast<unsigned char>(value[end - 1]))) end--;
    return value.substr(start, end - start);
}

GatewayClient::GatewayClient(HttpTransport& transport) : _transport(transport) {}

GatewayClient::GatewayClient(HttpTransport& transport, const GatewayConfig& config)
    : _transport(transport), _config(config) {}

std::string GatewayClient::historyUrl(const std::string& host) {
    return "http://" + host + "/history";
}

std::string GatewayClient::normalizeToken(const std::string& token) {
    return trimmed(token);
}

GatewayResult GatewayClient::fetchHistory(const std::string& host, const std::string& bearerToken,
                                          uint32_t timeoutMs, JsonDocument& doc) {
    std::string gatewayHost = trimmed(host);
    if (gatewayHost.empty()) {
        return fail(GatewayResult::ERROR_INVALID_PARAM, "Gateway host is not configured");
    }

    HttpRequest request;
    request.url = historyUrl(gatewayHost);
    request.timeoutMs = timeoutMs;

    std::string token = normalizeToken(bearerToken);
    if (!token.empty()) {
        request.headers.push_back(std::make_pair(std::string("Authorization"), "Bearer " + token));
    }

    logVerbose("GET " + request.url + (token.empty() ? " (no auth)" : " (bearer auth)"));

    HttpResponse response = _transport.get(request);

    if (response.error == TransportError::TIMEOUT) {
        return fail(GatewayResult::ERROR_CANNOT_CONNECT, "Timeout communicating with gateway");
    }
    if (response.error != TransportError::NONE) {
        std::string message = "Error communicating with gateway";
        if (!response.errorMessage.empty()) message += ": " + response.errorMessage;
        return fail(GatewayResult::ERROR_CANNOT_CONNECT, message);
    }

    if (response.statusCode == 401) {
        return fail(GatewayResult::ERROR_INVALID_AUTH, "Gateway rejected the bearer token");
    }
    if (response.statusCode != 200) {
        return fail(GatewayResult::ERROR_CANNOT_CONNECT,
                    "Unexpected response from gateway: HTTP " + std::to_string(response.statusCode));
    }

    if (_config.enableVerboseLogging) {
        std::string excerpt = response.body.substr(0, VERBOSE_BODY_LIMIT);
        if (response.body.size() > VERBOSE_BODY_LIMIT) excerpt += "...";
        logVerbose("Response body: " + excerpt);
    }

    // Gateways do not reliably send application/json, so the content type is ignored.
    doc.clear();
    DeserializationError jsonError = deserializeJson(doc, response.body);
    if (jsonError) {
        return fail(GatewayResult::ERROR_CANNOT_CONNECT,
                    std::string("Invalid response from gateway: ") + jsonError.c_str());
    }

    _lastError.clear();
    return GatewayResult::SUCCESS;
}

GatewayResult GatewayClient::getHistory(const std::string& host, const std::string& bearerToken,
                                        uint32_t timeoutMs, HistoryResponse& response) {
    JsonDocument doc;
    GatewayResult result = fetchHistory(host, bearerToken, timeoutMs, doc);
    if (result != GatewayResult::SUCCESS) return result;

    std::string error;
    if (!GatewayJsonParser::decodeHistory(doc.as<JsonVariantConst>(), response, error)) {
        return fail(GatewayResult::ERROR_DECODE, error);
    }

    logMessage("History from " + response.gwMac + ": " + std::to_string(response.tags.size()) + " tags");
    return GatewayResult::SUCCESS;
}

GatewayResult GatewayClient::fail(GatewayResult result, const std::string& message) {
    _lastError = message;
    logMessage(std::string(gatewayResultToString(result)) + ": " + message);
    return result;
}

void GatewayClient::logMessage(const std::string& message) {
    if (_config.enableLogging && _logCallback) {
        _logCallback(message);
    }
}

void GatewayClient::logVerbose(const std::string& message) {
    if (_config.enableVerboseLogging && _logCallback) {
        _logCallback(message);
    }
}
