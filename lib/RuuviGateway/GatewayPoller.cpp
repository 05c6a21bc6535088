#include "GatewayPoller.h"
#include "GatewayJsonParser.h"

const uint32_t GatewayPoller::DEFAULT_POLL_INTERVAL_MS;

GatewayPoller::GatewayPoller(GatewayClient& client, ClockFunction clock)
    : _client(client), _clock(clock) {}

void GatewayPoller::begin(const GatewayConfig& config) {
    _config = config;
    _config.bearerToken = GatewayClient::normalizeToken(config.bearerToken);
    if (_config.pollIntervalMs == 0) {
        _config.pollIntervalMs = DEFAULT_POLL_INTERVAL_MS;
    }

    _running = true;
    _pollRequested = false;
    _nextPollMs = _clock();
    logMessage("Polling " + GatewayClient::historyUrl(_config.host) + " every " +
               std::to_string(_config.pollIntervalMs) + " ms");
}

void GatewayPoller::stop() {
    if (!_running) return;
    _running = false;
    _pollRequested = false;
    logMessage("Polling stopped");
}

bool GatewayPoller::update() {
    // Callbacks may call back into update(); only one cycle is ever in flight.
    if (!_running || _phase != PollPhase::IDLE) return false;

    unsigned long now = _clock();
    if (!_pollRequested && static_cast<long>(now - _nextPollMs) < 0) return false;
    _pollRequested = false;

    runCycle();

    unsigned long finished = _clock();
    _nextPollMs = now + _config.pollIntervalMs;
    if (static_cast<long>(finished - _nextPollMs) >= 0) {
        logMessage("Cycle took " + std::to_string(finished - now) + " ms; skipping overdue tick");
        _nextPollMs = finished + _config.pollIntervalMs;
    }
    return true;
}

GatewayResult GatewayPoller::runCycle() {
    _phase = PollPhase::FETCHING;
    JsonDocument doc;
    GatewayResult result = _client.fetchHistory(_config.host, _config.bearerToken,
                                                _config.requestTimeoutMs, doc);

    if (!_running) {
        // Shut down while the request was in flight: drop the result.
        _phase = PollPhase::IDLE;
        logMessage("Discarding cycle result after stop");
        return result;
    }
    if (result != GatewayResult::SUCCESS) {
        return failCycle(result, _client.lastError());
    }

    _phase = PollPhase::DECODING;
    HistoryResponse response;
    std::string error;
    if (!GatewayJsonParser::decodeHistory(doc.as<JsonVariantConst>(), response, error)) {
        return failCycle(GatewayResult::ERROR_DECODE, error);
    }

    _phase = PollPhase::DIFFING;
    ChangeSet changes = ChangeCache::diff(_state, response);
    _state.swap(changes.updated);

    if (_gatewayMac != response.gwMac) {
        _gatewayMac = response.gwMac;
        _gatewayTitle = response.title();
        logMessage("Connected to " + _gatewayTitle);
    }
    _cycleCount++;
    _consecutiveFailures = 0;
    _lastResult = GatewayResult::SUCCESS;
    _lastError.clear();

    logMessage("Cycle " + std::to_string(_cycleCount) + ": " + std::to_string(response.tags.size()) +
               " tags, " + std::to_string(changes.changed.size()) + " changed");

    if (_changeCallback) _changeCallback(changes.changed);
    _phase = PollPhase::IDLE;
    return GatewayResult::SUCCESS;
}

GatewayResult GatewayPoller::failCycle(GatewayResult result, const std::string& message) {
    _cycleCount++;
    _consecutiveFailures++;
    _lastResult = result;
    _lastError = message;

    logMessage(std::string("Cycle failed (") + gatewayResultToString(result) + "): " + message);

    if (_errorCallback) _errorCallback(result, message);
    _phase = PollPhase::IDLE;
    return result;
}

void GatewayPoller::logMessage(const std::string& message) {
    if (_config.enableLogging && _logCallback) {
        _logCallback(message);
    }
}
