#ifndef INPUT_H
#define INPUT_H

#include <GLFW/glfw3.h>

#include <array>
#include <utility>

// Per-frame keyboard and mouse snapshot with press/release edge detection
class Input {
public:
    explicit Input(GLFWwindow* window = nullptr);

    // Polls GLFW events and rebuilds the edge sets; call once per frame
    void update();

    bool isKeyDown(int key) const;   // pressed this frame
    bool isKeyHeld(int key) const;
    bool isShiftHeld() const;

    bool isMouseButtonHeld(int button) const;
    bool isMouseButtonDown(int button) const;
    std::pair<double, double> getMousePos() const { return mousePos; }

    // Scroll is delivered through a callback; consumed once per frame
    void addScroll(double yoffset) { pendingScroll += yoffset; }
    double takeScroll();

private:
    static bool validKey(int key) { return key >= 0 && key <= GLFW_KEY_LAST; }
    static bool validButton(int button) { return button >= 0 && button <= GLFW_MOUSE_BUTTON_LAST; }

    GLFWwindow* window{nullptr};
    std::pair<double, double> mousePos{0.0, 0.0};
    double pendingScroll{0.0};

    std::array<bool, GLFW_KEY_LAST + 1> keyState{};
    std::array<bool, GLFW_KEY_LAST + 1> prevKeyState{};
    std::array<bool, GLFW_MOUSE_BUTTON_LAST + 1> buttonState{};
    std::array<bool, GLFW_MOUSE_BUTTON_LAST + 1> prevButtonState{};
};

#endif // INPUT_H
