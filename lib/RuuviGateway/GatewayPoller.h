#ifndef RUUVI_GATEWAY_POLLER_H
#define RUUVI_GATEWAY_POLLER_H

#include <stdint.h>
#include <functional>
#include <string>
#include <vector>
#include "ChangeCache.h"
#include "GatewayClient.h"
#include "GatewayTypes.h"

enum class PollPhase {
    IDLE = 0,
    FETCHING,
    DECODING,
    DIFFING
};

class GatewayPoller {
public:
    typedef std::function<unsigned long()> ClockFunction;
    typedef std::function<void(const std::vector<TagData>&)> ChangeCallback;
    typedef std::function<void(GatewayResult result, const std::string& message)> ErrorCallback;
    typedef std::function<void(const std::string&)> LogCallback;

    static const uint32_t DEFAULT_POLL_INTERVAL_MS = 5000;

    GatewayPoller(GatewayClient& client, ClockFunction clock);

    // Arms the schedule; the first cycle runs on the next update().
    void begin(const GatewayConfig& config);
    // Call from the main loop. Runs at most one cycle and returns true if it did.
    bool update();
    void stop();
    void pollNow() { _pollRequested = true; }

    bool isRunning() const { return _running; }
    PollPhase phase() const { return _phase; }
    uint32_t cycleCount() const { return _cycleCount; }
    uint32_t consecutiveFailures() const { return _consecutiveFailures; }
    GatewayResult lastResult() const { return _lastResult; }
    const std::string& lastError() const { return _lastError; }
    const std::string& gatewayMac() const { return _gatewayMac; }
    const std::string& gatewayTitle() const { return _gatewayTitle; }
    size_t cachedTagCount() const { return _state.size(); }

    void setChangeCallback(ChangeCallback callback) { _changeCallback = callback; }
    void setErrorCallback(ErrorCallback callback) { _errorCallback = callback; }
    void setLogCallback(LogCallback callback) { _logCallback = callback; }

private:
    GatewayClient& _client;
    ClockFunction _clock;
    GatewayConfig _config;
    TagState _state;
    PollPhase _phase = PollPhase::IDLE;
    bool _running = false;
    bool _pollRequested = false;
    unsigned long _nextPollMs = 0;

    uint32_t _cycleCount = 0;
    uint32_t _consecutiveFailures = 0;
    GatewayResult _lastResult = GatewayResult::SUCCESS;
    std::string _lastError;
    std::string _gatewayMac;
    std::string _gatewayTitle;

    ChangeCallback _changeCallback = nullptr;
    ErrorCallback _errorCallback = nullptr;
    LogCallback _logCallback = nullptr;

    GatewayResult runCycle();
    GatewayResult failCycle(GatewayResult result, const std::string& message);
    void logMessage(const std::string& message);
};

#endif
