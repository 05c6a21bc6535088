#pragma once
#include <Arduino.h>
#include <Adafruit_GFX.h>
#include <TagStore.h>

#define SCREEN_WIDTH  240
#define SCREEN_HEIGHT 280

#define COLOR_HEADER   0x7BEF
#define COLOR_DIM      0x4208
#define COLOR_ACCENT   0xAD55
#define COLOR_GOOD     0x5FF3

extern int16_t centerX(const char* text, uint8_t textSize);
extern int16_t printCenteredWrapped(Adafruit_GFX& gfx, const char* text, int16_t y, uint16_t w, uint8_t textSize);

String formatAge(const TagData& tag);
String formatRssi(int rssi);
uint16_t rssiColor(int rssi);
