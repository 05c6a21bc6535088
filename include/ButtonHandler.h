#pragma once
#include <Arduino.h>
#include <Adafruit_MCP23X17.h>

enum class Button : uint8_t {
    UP = 0,
    DOWN = 1,
    CLICK = 2,
    COUNT = 3
};

class ButtonHandler {
public:
    ButtonHandler(Adafruit_MCP23X17& mcp, int upPin, int downPin, int clickPin);
    void begin();
    void update();

    // Edge events; each returns true once per press.
    bool pressed(Button button);
    bool longPressed(Button button);

    bool upPressed() { return pressed(Button::UP); }
    bool downPressed() { return pressed(Button::DOWN); }
    bool clickPressed() { return pressed(Button::CLICK); }
    bool downLongPressed() { return longPressed(Button::DOWN); }
    bool clickLongPressed() { return longPressed(Button::CLICK); }

private:
    struct ButtonState {
        int pin;
        bool raw;
        bool stable;
        bool justPressed;
        bool justLongPressed;
        bool longPressHandled;
        unsigned long pressStartTime;
        unsigned long lastChangeTime;
    };

    Adafruit_MCP23X17& _mcp;
    ButtonState _buttons[static_cast<uint8_t>(Button::COUNT)];
    static const unsigned long DEBOUNCE_DELAY = 50;
    static const unsigned long LONG_PRESS_TIME = 600;

    void updateButton(ButtonState& state, unsigned long now);
};
