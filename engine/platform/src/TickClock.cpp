#include "pairs/platform/TickClock.hpp"

namespace pairs::platform {

TickClock::~TickClock() {
    Stop();
}

bool TickClock::Start(Uint32 event_type, Uint32 interval_ms) {
    Stop();
    event_type_ = event_type;
    timer_id_ = SDL_AddTimer(interval_ms, &TickClock::OnTimer, this);
    if (timer_id_ == 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_AddTimer failed: %s", SDL_GetError());
        return false;
    }
    return true;
}

void TickClock::Stop() {
    if (timer_id_ != 0) {
        SDL_RemoveTimer(timer_id_);
        timer_id_ = 0;
    }
}

Uint32 TickClock::OnTimer(Uint32 interval, void* param) {
    auto* clock = static_cast<TickClock*>(param);
    SDL_Event event;
    SDL_zero(event);
    event.type = clock->event_type_;
    if (SDL_PushEvent(&event) < 0) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Dropped tick: %s", SDL_GetError());
    }
    return interval;
}

}  // namespace pairs::platform
