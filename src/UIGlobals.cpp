#include "UIGlobals.h"
#include <Adafruit_ST7789.h>

int16_t centerX(const char* text, uint8_t textSize) {
    int16_t charWidth = 6 * textSize;
    int32_t textWidth = (int32_t)strlen(text) * charWidth;
    int16_t x = (SCREEN_WIDTH - textWidth) / 2;
    if (x < 0) return 0;
    return x;
}

static void printLine(Adafruit_GFX& gfx, const String& line, int16_t y, uint16_t w, int16_t charWidth) {
    int32_t lineWidth = (int32_t)line.length() * charWidth;
    int16_t x = (w - lineWidth) / 2;
    if (x < 0) x = 0;
    gfx.setCursor(x, y);
    gfx.print(line);
}

// Word-wraps `text` centered within `w`; words wider than a line (hex
// payloads) are split hard. Returns the y below the last line.
int16_t printCenteredWrapped(Adafruit_GFX& gfx, const char* text, int16_t y, uint16_t w, uint8_t textSize) {
    String str = String(text);
    int len = str.length();
    if (len == 0) return y;

    gfx.setTextSize(textSize);
    gfx.setTextWrap(false);

    int16_t charWidth = 6 * textSize;
    int16_t lineHeight = 8 * textSize;
    unsigned int maxChars = w / charWidth;

    String currentLine = "";
    int start = 0;

    while (start < len) {
        int end = str.indexOf(' ', start);
        if (end == -1) end = len;
        String word = str.substring(start, end);

        if (currentLine.length() + word.length() + (currentLine.length() > 0 ? 1 : 0) <= maxChars) {
            if (currentLine.length() > 0) currentLine += " ";
            currentLine += word;
        } else {
            if (currentLine.length() > 0) {
                printLine(gfx, currentLine, y, w, charWidth);
                y += lineHeight;
            }
            while (word.length() > maxChars) {
                printLine(gfx, word.substring(0, maxChars), y, w, charWidth);
                y += lineHeight;
                word = word.substring(maxChars);
            }
            currentLine = word;
        }
        start = end + 1;
    }

    if (currentLine.length() > 0) {
        printLine(gfx, currentLine, y, w, charWidth);
        y += lineHeight;
    }
    return y;
}

String formatAge(const TagData& tag) {
    if (!tag.hasAgeSeconds) return "age ?";
    long age = (long)tag.ageSeconds;
    if (age < 0) age = 0;
    if (age < 60) return String(age) + "s ago";
    if (age < 3600) return String(age / 60) + "m ago";
    return String(age / 3600) + "h ago";
}

String formatRssi(int rssi) {
    return String(rssi) + " dBm";
}

uint16_t rssiColor(int rssi) {
    if (rssi >= -70) return COLOR_GOOD;
    if (rssi >= -85) return ST77XX_YELLOW;
    return ST77XX_RED;
}
