#include <Arduino.h>
#include <Adafruit_GFX.h>
#include <Adafruit_ST7789.h>
#include "TagList.h"
#include "UIGlobals.h"

extern Adafruit_ST7789 tft;

static const int LIST_TOP = 36;
static const int ROW_HEIGHT = 28;
static const int MAX_VISIBLE = (SCREEN_HEIGHT - LIST_TOP - 12) / ROW_HEIGHT;

void TagList::drawHeader() {
    tft.fillRect(0, 0, SCREEN_WIDTH, 30, COLOR_HEADER);
    tft.setFont();
    tft.setTextSize(1);
    tft.setTextColor(ST77XX_WHITE);
    tft.setCursor(centerX(headerText.c_str(), 1), 12);
    tft.print(headerText);
}

void TagList::updateHeader(const char* title, const char* statusText) {
    headerText = String(title);
    if (statusText != nullptr && strlen(statusText) > 0) {
        headerText += String(" (") + statusText + ")";
    }
    drawHeader();
}

void TagList::setSelectedIndex(int index) {
    selectedIndex = index < 0 ? 0 : index;
}

void TagList::scrollToSelection(int count) {
    if (selectedIndex >= count) selectedIndex = count > 0 ? count - 1 : 0;
    if (selectedIndex < firstVisible) firstVisible = selectedIndex;
    if (selectedIndex >= firstVisible + MAX_VISIBLE) firstVisible = selectedIndex - MAX_VISIBLE + 1;
    if (firstVisible < 0) firstVisible = 0;
}

void TagList::drawTagRow(const TagEntry& entry, int y, bool isSelected) {
    if (isSelected) {
        tft.fillRect(0, y, SCREEN_WIDTH, ROW_HEIGHT, COLOR_DIM);
        tft.drawRect(2, y + 2, 236, 24, ST77XX_WHITE);
    } else {
        tft.fillRect(0, y, SCREEN_WIDTH, ROW_HEIGHT, ST77XX_BLACK);
        tft.drawFastHLine(10, y + 27, 220, COLOR_DIM);
    }

    tft.setFont();
    tft.setTextSize(1);
    tft.setTextColor(isSelected ? ST77XX_YELLOW : ST77XX_WHITE);
    tft.setCursor(16, y + 4);
    tft.print(entry.tag.mac.c_str());

    String rssi = formatRssi(entry.tag.rssi);
    tft.setTextColor(rssiColor(entry.tag.rssi));
    tft.setCursor(SCREEN_WIDTH - 16 - rssi.length() * 6, y + 4);
    tft.print(rssi);

    String detail = entry.advertisementValid && !entry.advertisement.localName.empty()
                        ? String(entry.advertisement.localName.c_str())
                        : String(entry.tag.data.size()) + " bytes";
    detail += "  " + formatAge(entry.tag);
    tft.setTextColor(COLOR_HEADER);
    tft.setCursor(16, y + 16);
    tft.print(detail);
}

void TagList::drawTags(const std::vector<TagEntry>& entries) {
    if (entries.empty()) {
        tft.setFont();
        tft.setTextSize(1);
        tft.setTextColor(COLOR_HEADER);
        tft.setCursor(centerX("No tags seen yet", 1), 140);
        tft.print("No tags seen yet");
        return;
    }

    int count = (int)entries.size();
    scrollToSelection(count);

    int y = LIST_TOP;
    for (int i = firstVisible; i < count && i < firstVisible + MAX_VISIBLE; i++) {
        drawTagRow(entries[i], y, i == selectedIndex);
        y += ROW_HEIGHT;
    }

    int hidden = count - (firstVisible + MAX_VISIBLE);
    if (hidden > 0) {
        String more = String(hidden) + " more...";
        tft.setTextColor(COLOR_HEADER);
        tft.setCursor(centerX(more.c_str(), 1), 270);
        tft.print(more);
    }
}

void TagList::draw(const std::vector<TagEntry>& entries) {
    tft.fillScreen(ST77XX_BLACK);
    drawHeader();
    drawTags(entries);
}

void TagList::clearTagList() {
    tft.fillRect(0, LIST_TOP, SCREEN_WIDTH, SCREEN_HEIGHT - LIST_TOP, ST77XX_BLACK);
}

void TagList::refreshTags(const std::vector<TagEntry>& entries) {
    clearTagList();
    drawTags(entries);
}
