/**
 * @file pico_tick_clock.cpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 */

#include "forge/pico_tick_clock.hpp"

#include <pico/stdlib.h>
#include <pico/time.h>


namespace Forge::Core {

    uint32_t PicoTickClock::nowUs() {
        return time_us_32();
    }

    void PicoTickClock::waitUntilUs(uint32_t deadlineUs) {
        const int32_t remaining = static_cast<int32_t>(deadlineUs - time_us_32());

        if (remaining > 0) {
            busy_wait_us_32(static_cast<uint32_t>(remaining));
        }
    }

} // namespace Forge::Core
