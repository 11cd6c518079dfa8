/**
 * @file pico_tick_clock.hpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 * 
 * TickClock over the RP2350 64-bit microsecond timer, truncated to 32 bits.
 * Waiting spins; the tick loop owns Core 1 and has nothing else to run.
 */

#pragma once

#include <cstdint>

#include <forge/tick_scheduler.hpp>


namespace Forge::Core {

    class PicoTickClock : public Forge::Pipeline::TickClock {
    public:
        uint32_t nowUs() override;
        void waitUntilUs(uint32_t deadlineUs) override;
    };

} // namespace Forge::Core
