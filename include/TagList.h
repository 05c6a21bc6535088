#pragma once
#include <Adafruit_GFX.h>
#include <Adafruit_ST7789.h>
#include <TagStore.h>
#include <vector>

class TagList {
public:
    void draw(const std::vector<TagEntry>& entries);
    void updateHeader(const char* title, const char* statusText);
    void refreshTags(const std::vector<TagEntry>& entries);
    void setSelectedIndex(int index);
    int getSelectedIndex() const { return selectedIndex; }

private:
    int selectedIndex = 0;
    int firstVisible = 0;
    String headerText = "Ruuvi Gateway";

    void drawHeader();
    void drawTagRow(const TagEntry& entry, int y, bool isSelected);
    void drawTags(const std::vector<TagEntry>& entries);
    void clearTagList();
    void scrollToSelection(int count);
};
