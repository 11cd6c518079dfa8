/**
 * @file app.hpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 * 
 * Application Base Class - dual-core startup for Forge firmware.
 * 
 * Core 0 runs FreeRTOS: status reporting, the host transport, and the
 * watchdog manager. Core 1 runs bare-metal code, normally the instrument
 * tick loop, outside the scheduler so that FreeRTOS latency cannot eat into
 * the tick budget.
 * 
 * Startup sequence (run()):
 * 1. stdio and status LED, so the safety system can report the last fault
 * 2. Safety system initialization, which activates registered components
 * 3. _init() for early application setup
 * 4. Core 1 launch into _startCore1()
 * 5. Dual-core watchdog
 * 6. _initCore0() to create Core 0 tasks
 * 7. FreeRTOS scheduler
 * 
 * The App registers itself as a SafeableComponent and as the target of the
 * Core 1 trampoline. Only one App may exist.
 */

#pragma once

#include <cstdio>
#include <cstdlib>

#include <FreeRTOS.h>
#include <task.h>

#include <pico/stdlib.h>
#include <pico/multicore.h>
#include <pico/status_led.h>

#include <forge/safety.hpp>


namespace Forge::Core {

    class App : public Forge::Core::Safety::SafeableComponent {
    public:
        App();

        /**
         * @brief Run the startup sequence and start the scheduler
         * 
         * Does not return.
         * 
         * @note Must be called from Core 0
         */
        virtual void run();

    protected:
        /**
         * @brief The App instance, for the Core 1 trampoline
         */
        static App *_globalInstance;

        static void _core1EntryPoint() {
            if (_globalInstance) {
                _globalInstance->_startCore1();
            }
        }

        /**
         * @brief Early initialization on Core 0, before Core 1 starts
         */
        virtual void _init() {};

        /**
         * @brief Create Core 0 FreeRTOS tasks
         * 
         * Called after Core 1 has been launched and the watchdog started, just
         * before the scheduler starts.
         */
        virtual void _initCore0() = 0;

        /**
         * @brief Core 1 body; should not return
         * 
         * Core 1 must call Forge::Core::Safety::feedWatchdogFromCore1() well
         * within FORGE_SAFETY_CORE1_HEARTBEAT_TIMEOUT_MS.
         */
        virtual void _startCore1() = 0;
    };

} // namespace Forge::Core
