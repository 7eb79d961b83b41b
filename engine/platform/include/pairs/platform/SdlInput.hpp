#pragma once

#include <SDL2/SDL.h>

#include <vector>

#include "pairs/platform/InputEvents.hpp"

namespace pairs::platform {

class SdlInput {
public:
    SdlInput() = default;

    // Reserves the user event used by TickClock.
    bool Initialize();
    std::vector<InputEvent> Poll();

    Uint32 tickEventType() const noexcept { return tick_event_type_; }

private:
    bool initialized_ = false;
    Uint32 tick_event_type_ = static_cast<Uint32>(-1);
};

}  // namespace pairs::platform
