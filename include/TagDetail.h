#pragma once
#include <Adafruit_GFX.h>
#include <Adafruit_ST7789.h>
#include <TagStore.h>

class TagDetail {
public:
    void drawStatic(const char* mac);
    void drawStatusBar(const char* statusText);
    void drawSignal(int rssi);
    void drawTiming(const TagData& tag);
    void drawAdvertisement(const TagEntry& entry);
    void drawPayload(const TagData& tag);
    void drawEntry(const TagEntry& entry);
};
