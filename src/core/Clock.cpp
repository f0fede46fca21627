#include "core/Clock.hpp"

#include <SDL2/SDL_timer.h>

#include <chrono>

namespace tetrys::clock {

std::uint64_t SdlClock::now_ms() const { return static_cast<std::uint64_t>(SDL_GetTicks64()); }

std::int64_t wall_clock_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

}  // namespace tetrys::clock
