#include "pairs/platform/SdlInput.hpp"

#include <SDL2/SDL.h>

namespace pairs::platform {

namespace {

MouseButton ToMouseButton(Uint8 button) {
    switch (button) {
        case SDL_BUTTON_LEFT:
            return MouseButton::Left;
        case SDL_BUTTON_RIGHT:
            return MouseButton::Right;
        case SDL_BUTTON_MIDDLE:
            return MouseButton::Middle;
        default:
            return MouseButton::Unknown;
    }
}

KeyCode ToKey(SDL_Keycode key) {
    switch (key) {
        case SDLK_ESCAPE:
            return KeyCode::Escape;
        case SDLK_r:
            return KeyCode::R;
        default:
            return KeyCode::Unknown;
    }
}

}  // namespace

bool SdlInput::Initialize() {
    if (initialized_) {
        return true;
    }
    tick_event_type_ = SDL_RegisterEvents(1);
    if (tick_event_type_ == static_cast<Uint32>(-1)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_RegisterEvents failed: %s", SDL_GetError());
        return false;
    }
    initialized_ = true;
    return true;
}

std::vector<InputEvent> SdlInput::Poll() {
    std::vector<InputEvent> events;
    SDL_Event sdl_event;
    while (SDL_PollEvent(&sdl_event)) {
        InputEvent evt;
        if (initialized_ && sdl_event.type == tick_event_type_) {
            evt.type = InputEventType::Tick;
            events.push_back(evt);
            continue;
        }
        switch (sdl_event.type) {
            case SDL_QUIT:
                evt.type = InputEventType::Quit;
                events.push_back(evt);
                break;
            case SDL_MOUSEMOTION:
                evt.type = InputEventType::MouseMove;
                evt.x = sdl_event.motion.x;
                evt.y = sdl_event.motion.y;
                events.push_back(evt);
                break;
            case SDL_MOUSEBUTTONDOWN:
                evt.type = InputEventType::MouseButtonDown;
                evt.x = sdl_event.button.x;
                evt.y = sdl_event.button.y;
                evt.mouse_button = ToMouseButton(sdl_event.button.button);
                events.push_back(evt);
                break;
            case SDL_KEYDOWN:
                if (sdl_event.key.repeat != 0) {
                    break;
                }
                evt.type = InputEventType::KeyDown;
                evt.key = ToKey(sdl_event.key.keysym.sym);
                events.push_back(evt);
                break;
            case SDL_WINDOWEVENT:
                if (sdl_event.window.event == SDL_WINDOWEVENT_SIZE_CHANGED) {
                    evt.type = InputEventType::WindowResized;
                    evt.width = sdl_event.window.data1;
                    evt.height = sdl_event.window.data2;
                    events.push_back(evt);
                }
                break;
            default:
                break;
        }
    }
    return events;
}

}  // namespace pairs::platform
