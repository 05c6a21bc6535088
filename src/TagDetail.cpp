#include <Arduino.h>
#include <Adafruit_GFX.h>
#include <Adafruit_ST7789.h>
#include "TagDetail.h"
#include "UIGlobals.h"

extern Adafruit_ST7789 tft;

// RSSI range mapped onto the signal bar.
static const int RSSI_FLOOR = -100;
static const int RSSI_CEIL = -40;

void TagDetail::drawStatic(const char* mac) {
    tft.fillScreen(ST77XX_BLACK);
    drawStatusBar("Waiting for data");
    tft.fillRect(0, 33, SCREEN_WIDTH, 24, COLOR_HEADER);
    tft.setFont();
    tft.setTextSize(2);
    tft.setTextColor(ST77XX_WHITE);
    tft.setCursor(centerX(mac, 2), 37);
    tft.print(mac);
}

void TagDetail::drawStatusBar(const char* statusText) {
    tft.fillRect(0, 1, SCREEN_WIDTH, 30, COLOR_HEADER);
    tft.setTextColor(ST77XX_WHITE);
    tft.setFont();
    tft.setTextSize(1);
    tft.setCursor(centerX(statusText, 1), 12);
    tft.print(statusText);
}

void TagDetail::drawSignal(int rssi) {
    int clamped = constrain(rssi, RSSI_FLOOR, RSSI_CEIL);
    int w = map(clamped, RSSI_FLOOR, RSSI_CEIL, 0, 151);
    tft.fillRect(10, 64, SCREEN_WIDTH - 10, 14, ST77XX_BLACK);
    tft.fillRect(10, 65, 151, 12, COLOR_DIM);
    tft.fillRect(10, 65, w, 12, rssiColor(rssi));

    String label = formatRssi(rssi);
    tft.setFont();
    tft.setTextSize(1);
    tft.setTextColor(ST77XX_WHITE);
    tft.setCursor(170, 67);
    tft.print(label);
}

void TagDetail::drawTiming(const TagData& tag) {
    tft.fillRect(0, 84, SCREEN_WIDTH, 24, ST77XX_BLACK);
    tft.setFont();
    tft.setTextSize(1);
    tft.setTextColor(COLOR_ACCENT);
    String seen = String(tag.isoTime().c_str());
    tft.setCursor(centerX(seen.c_str(), 1), 86);
    tft.print(seen);

    String age = formatAge(tag);
    tft.setTextColor(ST77XX_WHITE);
    tft.setCursor(centerX(age.c_str(), 1), 98);
    tft.print(age);
}

void TagDetail::drawAdvertisement(const TagEntry& entry) {
    tft.fillRect(0, 112, SCREEN_WIDTH, 70, ST77XX_BLACK);
    tft.setFont();
    tft.setTextSize(1);

    if (!entry.advertisementValid) {
        tft.setTextColor(ST77XX_RED);
        printCenteredWrapped(tft, ("Undecodable: " + entry.decodeError).c_str(), 116, SCREEN_WIDTH, 1);
        return;
    }

    const Advertisement& adv = entry.advertisement;
    int16_t y = 116;
    tft.setTextColor(ST77XX_WHITE);

    if (!adv.localName.empty()) {
        String name = "Name: " + String(adv.localName.c_str());
        tft.setCursor(10, y); tft.print(name);
        y += 12;
    }

    for (const auto& manufacturer : adv.manufacturerData) {
        char line[48];
        snprintf(line, sizeof(line), "Mfr 0x%04X: %u bytes", manufacturer.first,
                 (unsigned)manufacturer.second.size());
        tft.setCursor(10, y); tft.print(line);
        y += 12;
    }

    for (const auto& uuid : adv.serviceUuids) {
        if (y > 170) break;
        tft.setCursor(10, y); tft.print(("Svc " + uuid.substr(0, 8)).c_str());
        y += 12;
    }

    if (adv.hasTxPower && y <= 170) {
        tft.setCursor(10, y);
        tft.print("TX power: " + String((int)adv.txPower) + " dBm");
    }
}

void TagDetail::drawPayload(const TagData& tag) {
    tft.fillRect(0, 186, SCREEN_WIDTH, 94, ST77XX_BLACK);
    tft.drawFastHLine(10, 186, 220, COLOR_DIM);
    tft.setFont();
    tft.setTextColor(COLOR_HEADER);
    printCenteredWrapped(tft, tag.dataHex().c_str(), 192, SCREEN_WIDTH, 1);
}

void TagDetail::drawEntry(const TagEntry& entry) {
    drawStatusBar(("Updates: " + String(entry.changeCount)).c_str());
    drawSignal(entry.tag.rssi);
    drawTiming(entry.tag);
    drawAdvertisement(entry);
    drawPayload(entry.tag);
}
