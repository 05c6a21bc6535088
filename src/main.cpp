#include <Arduino.h>
#include <WiFi.h>
#include <Adafruit_GFX.h>
#include <Adafruit_ST7789.h>
#include <Adafruit_MCP23X17.h>
#include <AdvertisementDecoder.h>
#include <GatewayClient.h>
#include <GatewayPoller.h>
#include <TagStore.h>
#include <string>
#include <vector>
#include "secrets.h"
#include "AppLogger.h"
#include "ButtonHandler.h"
#include "GatewayHttpTransport.h"
#include "TagDetail.h"
#include "TagList.h"

#define TFT_CS  D3
#define TFT_DC  D2
#define TFT_RST D1
#define TFT_BL  D6

// MCP23017 pins
#define BTN_UP    13
#define BTN_DOWN  14
#define BTN_CLICK 15

Adafruit_ST7789 tft = Adafruit_ST7789(TFT_CS, TFT_DC, TFT_RST);
Adafruit_MCP23X17 mcp;
GatewayHttpTransport transport;
GatewayClient gatewayClient(transport);
GatewayPoller poller(gatewayClient, []() { return (unsigned long)millis(); });
GapAdvertisementDecoder advertisementDecoder;
TagStore tagStore(advertisementDecoder);
TagList tagList;
TagDetail tagDetail;
ButtonHandler buttons(mcp, BTN_UP, BTN_DOWN, BTN_CLICK);

std::string selectedMac;
String statusText = "";
String shownTitle = "";
bool tagListDirty = false;
bool tagDetailDirty = false;

enum ScreenState {
    SCREEN_TAG_LIST,
    SCREEN_TAG_DETAIL
};

ScreenState currentScreen = SCREEN_TAG_LIST;

enum WiFiState {
    WIFI_DISCONNECTED,
    WIFI_CONNECTING,
    WIFI_CONNECTED
};

WiFiState wifiState = WIFI_DISCONNECTED;
unsigned long wifiConnectStartTime = 0;
const unsigned long WIFI_TIMEOUT = 30000; // 30 seconds timeout

std::string gatewayTitle;

static const char* headerTitle() {
    if (!poller.gatewayTitle().empty()) return poller.gatewayTitle().c_str();
    return gatewayTitle.empty() ? "Ruuvi Gateway" : gatewayTitle.c_str();
}

// Redraws the list header only when the title or status actually changed.
static void setStatus(const String& text) {
    String title = headerTitle();
    if (text == statusText && title == shownTitle) return;
    statusText = text;
    shownTitle = title;
    if (currentScreen == SCREEN_TAG_LIST) tagList.updateHeader(shownTitle.c_str(), statusText.c_str());
}

static const char* statusForResult(GatewayResult result) {
    switch (result) {
        case GatewayResult::ERROR_INVALID_AUTH: return "Auth failed";
        case GatewayResult::ERROR_CANNOT_CONNECT: return "Offline";
        case GatewayResult::ERROR_DECODE: return "Bad data";
        case GatewayResult::ERROR_INVALID_PARAM: return "No host";
        default: return "";
    }
}

GatewayConfig buildGatewayConfig() {
    GatewayConfig config;
    config.host = gatewayHost;
    config.bearerToken = gatewayToken;
    config.pollIntervalMs = GATEWAY_POLL_INTERVAL_MS;
    config.requestTimeoutMs = GATEWAY_REQUEST_TIMEOUT_MS;
    config.enableLogging = true;
    config.enableVerboseLogging = AppLogger::getMinLevel() == LogLevel::DEBUG;
    return config;
}

// One-shot check before polling starts. Polling is not started when the
// token is rejected or no host is configured.
void connectToGateway() {
    GatewayConfig config = buildGatewayConfig();
    HistoryResponse response;
    GatewayResult result = gatewayClient.getHistory(config.host, config.bearerToken,
                                                    config.requestTimeoutMs, response);
    if (result == GatewayResult::SUCCESS) {
        gatewayTitle = response.title();
        LOG_INFO("gateway", "Found " + gatewayTitle + " with " + std::to_string(response.tags.size()) + " tags");
        setStatus("Polling");
    } else {
        LOG_WARN("gateway", std::string(gatewayResultToString(result)) + ": " + gatewayClient.lastError());
        setStatus(statusForResult(result));
        if (result == GatewayResult::ERROR_INVALID_AUTH || result == GatewayResult::ERROR_INVALID_PARAM) {
            return;
        }
    }
    poller.begin(config);
}

void startWiFiConnection() {
    LOG_INFO("wifi", "Starting WiFi connection");
    WiFi.persistent(true);
    WiFi.mode(WIFI_STA);
#if USE_STATIC_IP
    WiFi.config(STATIC_IP, GATEWAY, SUBNET);
#endif
    WiFi.begin(ssid, password);
    WiFi.setAutoReconnect(true);
    wifiState = WIFI_CONNECTING;
    wifiConnectStartTime = millis();
    setStatus("WiFi...");
}

void checkWiFiConnection() {
    if (wifiState == WIFI_CONNECTING) {
        if (WiFi.status() == WL_CONNECTED) {
            wifiState = WIFI_CONNECTED;
            LOG_INFO("wifi", "WiFi connected: " + WiFi.localIP().toString());
            if (!poller.isRunning()) connectToGateway();
        } else if (millis() - wifiConnectStartTime > WIFI_TIMEOUT) {
            wifiState = WIFI_DISCONNECTED;
            LOG_WARN("wifi", "WiFi connect timeout, retrying");
            WiFi.disconnect();
            delay(100);
            startWiFiConnection();
        }
    }
}

void onTagsChanged(const std::vector<TagData>& changed) {
    setStatus("");
    if (changed.empty()) return;

    size_t added = tagStore.apply(changed, millis());
    LOG_DEBUG("tags", String(changed.size()) + " changed, " + String(added) + " new, " +
                      String(tagStore.size()) + " total");

    for (const auto& tag : changed) {
        LOG_DEBUG("tags", tag.mac + " rssi=" + std::to_string(tag.rssi) + " data=" + tag.dataHex());
        if (tag.mac == selectedMac) tagDetailDirty = true;
    }
    tagListDirty = true;
}

void onPollError(GatewayResult result, const std::string& message) {
    LOG_WARN("poll", std::string(gatewayResultToString(result)) + ": " + message);
    setStatus(statusForResult(result));
}

void openTagDetail(const TagEntry& entry) {
    selectedMac = entry.tag.mac;
    currentScreen = SCREEN_TAG_DETAIL;
    tagDetail.drawStatic(selectedMac.c_str());
    tagDetail.drawEntry(entry);
    tagDetailDirty = false;
}

void handleTagListNavigation() {
    const auto& entries = tagStore.entries();
    int selectedIndex = tagList.getSelectedIndex();
    bool selectionChanged = false;

    if (buttons.upPressed() && selectedIndex > 0) {
        tagList.setSelectedIndex(selectedIndex - 1);
        selectionChanged = true;
    }
    if (buttons.downPressed() && selectedIndex < (int)entries.size() - 1) {
        tagList.setSelectedIndex(selectedIndex + 1);
        selectionChanged = true;
    }
    if (buttons.downLongPressed()) {
        LOG_INFO("ui", "Manual poll requested");
        poller.pollNow();
    }

    if (buttons.clickPressed() && !entries.empty()) {
        openTagDetail(entries[tagList.getSelectedIndex()]);
        return;
    }

    if (selectionChanged || tagListDirty) {
        tagListDirty = false;
        tagList.refreshTags(entries);
    }
}

void handleTagDetailNavigation() {
    if (buttons.clickLongPressed() || buttons.clickPressed()) {
        currentScreen = SCREEN_TAG_LIST;
        int index = tagStore.indexOf(selectedMac);
        if (index >= 0) tagList.setSelectedIndex(index);
        tagList.draw(tagStore.entries());
        tagList.updateHeader(shownTitle.c_str(), statusText.c_str());
        tagListDirty = false;
        return;
    }

    if (buttons.downLongPressed()) {
        poller.pollNow();
    }

    if (tagDetailDirty) {
        tagDetailDirty = false;
        const TagEntry* entry = tagStore.find(selectedMac);
        if (entry != nullptr) tagDetail.drawEntry(*entry);
    }
}

void setup() {
    WiFi.mode(WIFI_STA); // Initialize stack early
    Serial.begin(115200);

    LogLevel level = LogLevel::INFO;
    if (!AppLogger::levelFromString(APP_LOG_LEVEL, level)) level = LogLevel::INFO;
    AppLogger::begin(Serial, level);
    AppLogger::setEnabled(true);
    AppLogger::clearAllowedChannels();
    AppLogger::clearBlockedChannels();

    LOG_INFO("core", "Ruuvi Gateway monitor starting");
    LOG_INFO("core", "Log level set to " + String(AppLogger::levelToString(level)));

    gatewayClient.setConfig(buildGatewayConfig());
    gatewayClient.setLogCallback([](const std::string& message) {
        AppLogger::logTo(LogLevel::DEBUG, "gateway", message);
    });
    poller.setLogCallback([](const std::string& message) {
        AppLogger::logTo(LogLevel::INFO, "poll", message);
    });
    poller.setChangeCallback(onTagsChanged);
    poller.setErrorCallback(onPollError);

    if (!mcp.begin_I2C(0x20)) {
        LOG_ERROR("core", "MCP23017 not found");
    }

    pinMode(TFT_BL, OUTPUT);
    digitalWrite(TFT_BL, HIGH);
    tft.init(240, 280);
    tft.setRotation(2);

    buttons.begin();
    tagList.setSelectedIndex(0);
    tagList.draw(tagStore.entries());

    startWiFiConnection();
}

void loop() {
    checkWiFiConnection();
    buttons.update();

    if (wifiState == WIFI_CONNECTED) {
        poller.update();
    }

    if (currentScreen == SCREEN_TAG_LIST) {
        handleTagListNavigation();
    } else if (currentScreen == SCREEN_TAG_DETAIL) {
        handleTagDetailNavigation();
    }
}
