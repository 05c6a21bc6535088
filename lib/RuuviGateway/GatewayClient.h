#ifndef RUUVI_GATEWAY_CLIENT_H
#define RUUVI_GATEWAY_CLIENT_H

#include <ArduinoJson.h>
#include <stdint.h>
#include <functional>
#include <string>
#include "GatewayTypes.h"
#include "HttpTransport.h"

struct GatewayConfig {
    std::string host;
    std::string bearerToken;
    uint32_t pollIntervalMs = 5000;
    uint32_t requestTimeoutMs = 0; // 0 = no bound from this side
    bool enableLogging = false;
    bool enableVerboseLogging = false;
};

class GatewayClient {
public:
    typedef std::function<void(const std::string&)> LogCallback;

    GatewayClient(HttpTransport& transport);
    GatewayClient(HttpTransport& transport, const GatewayConfig& config);

    // GET http://{host}/history. On SUCCESS `doc` holds the parsed body;
    // every other result leaves a message in lastError().
    GatewayResult fetchHistory(const std::string& host, const std::string& bearerToken,
                               uint32_t timeoutMs, JsonDocument& doc);

    // fetchHistory followed by decoding; decode failures map to ERROR_DECODE.
    GatewayResult getHistory(const std::string& host, const std::string& bearerToken,
                             uint32_t timeoutMs, HistoryResponse& response);

    const std::string& lastError() const { return _lastError; }

    void setConfig(const GatewayConfig& config) { _config = config; }
    const GatewayConfig& getConfig() const { return _config; }
    void setLogCallback(LogCallback callback) { _logCallback = callback; }
    void logMessage(const std::string& message);

    static std::string historyUrl(const std::string& host);
    static std::string normalizeToken(const std::string& token);

private:
    HttpTransport& _transport;
    GatewayConfig _config;
    std::string _lastError;
    LogCallback _logCallback = nullptr;

    GatewayResult fail(GatewayResult result, const std::string& message);
    void logVerbose(const std::string& message);
};

#endif
