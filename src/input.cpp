#include "input.h"

Input::Input(GLFWwindow* windowPtr)
    : window(windowPtr) {
    keyState.fill(false);
    prevKeyState.fill(false);
    buttonState.fill(false);
    prevButtonState.fill(false);
}

void Input::update() {
    if (!window) {
        return;
    }

    glfwPollEvents();

    prevKeyState = keyState;
    // GLFW_KEY_SPACE is the lowest named key
    for (int key = GLFW_KEY_SPACE; key <= GLFW_KEY_LAST; ++key) {
        int state = glfwGetKey(window, key);
        keyState[key] = (state == GLFW_PRESS || state == GLFW_REPEAT);
    }

    prevButtonState = buttonState;
    for (int button = 0; button <= GLFW_MOUSE_BUTTON_LAST; ++button) {
        buttonState[button] = glfwGetMouseButton(window, button) == GLFW_PRESS;
    }

    double xpos = 0.0;
    double ypos = 0.0;
    glfwGetCursorPos(window, &xpos, &ypos);
    mousePos = {xpos, ypos};
}

bool Input::isKeyDown(int key) const {
    return validKey(key) && keyState[key] && !prevKeyState[key];
}

bool Input::isKeyHeld(int key) const {
    return validKey(key) && keyState[key];
}

bool Input::isShiftHeld() const {
    return isKeyHeld(GLFW_KEY_LEFT_SHIFT) || isKeyHeld(GLFW_KEY_RIGHT_SHIFT);
}

bool Input::isMouseButtonHeld(int button) const {
    return validButton(button) && buttonState[button];
}

bool Input::isMouseButtonDown(int button) const {
    return validButton(button) && buttonState[button] && !prevButtonState[button];
}

double Input::takeScroll() {
    double scroll = pendingScroll;
    pendingScroll = 0.0;
    return scroll;
}
