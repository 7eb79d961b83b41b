#pragma once

#include <SDL2/SDL.h>

namespace pairs::platform {

// Posts one payload-less event of event_type into the SDL queue every
// interval_ms. The SDL timer thread only enqueues; ticks are handled wherever
// the queue is polled.
class TickClock {
public:
    TickClock() = default;
    ~TickClock();

    TickClock(const TickClock&) = delete;
    TickClock& operator=(const TickClock&) = delete;

    bool Start(Uint32 event_type, Uint32 interval_ms);
    void Stop();

    bool running() const noexcept { return timer_id_ != 0; }

private:
    static Uint32 OnTimer(Uint32 interval, void* param);

    SDL_TimerID timer_id_ = 0;
    Uint32 event_type_ = 0;
};

}  // namespace pairs::platform
