#pragma once

namespace pairs::platform {

enum class InputEventType {
    Quit,
    MouseMove,
    MouseButtonDown,
    KeyDown,
    WindowResized,
    Tick
};

enum class MouseButton { Left, Right, Middle, Unknown };

enum class KeyCode { Escape, R, Unknown };

struct InputEvent {
    InputEventType type = InputEventType::Quit;
    int x = 0;
    int y = 0;
    MouseButton mouse_button = MouseButton::Unknown;
    KeyCode key = KeyCode::Unknown;
    int width = 0;
    int height = 0;
};

}  // namespace pairs::platform
