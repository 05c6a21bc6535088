#include "ButtonHandler.h"

ButtonHandler::ButtonHandler(Adafruit_MCP23X17& mcp, int upPin, int downPin, int clickPin) : _mcp(mcp) {
    const int pins[] = {upPin, downPin, clickPin};
    for (uint8_t i = 0; i < static_cast<uint8_t>(Button::COUNT); i++) {
        _buttons[i] = ButtonState{pins[i], false, false, false, false, false, 0, 0};
    }
}

void ButtonHandler::begin() {
    for (auto& state : _buttons) {
        _mcp.pinMode(state.pin, INPUT_PULLUP);
    }
}

void ButtonHandler::update() {
    unsigned long now = millis();
    for (auto& state : _buttons) {
        updateButton(state, now);
    }
}

void ButtonHandler::updateButton(ButtonState& state, unsigned long now) {
    // LOW when pressed due to pull-up
    bool reading = (_mcp.digitalRead(state.pin) == LOW);
    if (reading != state.raw) {
        state.raw = reading;
        state.lastChangeTime = now;
        return;
    }
    if (now - state.lastChangeTime <= DEBOUNCE_DELAY) return;

    if (reading && !state.stable) {
        state.stable = true;
        state.pressStartTime = now;
        state.longPressHandled = false;
    } else if (!reading && state.stable) {
        state.stable = false;
        // A long press already fired its own event; the release is not a click.
        if (!state.longPressHandled) state.justPressed = true;
    }

    if (state.stable && !state.longPressHandled && now - state.pressStartTime >= LONG_PRESS_TIME) {
        state.longPressHandled = true;
        state.justLongPressed = true;
    }
}

bool ButtonHandler::pressed(Button button) {
    ButtonState& state = _buttons[static_cast<uint8_t>(button)];
    if (state.justPressed) {
        state.justPressed = false;
        return true;
    }
    return false;
}

bool ButtonHandler::longPressed(Button button) {
    ButtonState& state = _buttons[static_cast<uint8_t>(button)];
    if (state.justLongPressed) {
        state.justLongPressed = false;
        return true;
    }
    return false;
}
