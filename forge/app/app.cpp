/**
 * @file app.cpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 */

#include "forge/app.hpp"


using namespace Forge::Core;

App *App::_globalInstance;

App::App() {
    _globalInstance = this;

    // Activated by Safety::init() in run()
    Safety::registerComponent(this);
}

void App::run() {
    stdio_init_all();
    status_led_init();

    Safety::init();

    _init();

    multicore_reset_core1();
    multicore_launch_core1(_core1EntryPoint);

    if (!Safety::watchdogInit()) {
        Safety::reportFault(Safety::FaultType::HARDWARE_FAULT,
                            "Failed to initialize dual-core watchdog",
                            __FILE__, __LINE__, __FUNCTION__);
    }

    _initCore0();

    vTaskStartScheduler();

    // Only reached if the scheduler could not start
    Safety::reportFault(Safety::FaultType::INVALID_STATE,
                        "FreeRTOS scheduler exited",
                        __FILE__, __LINE__, __FUNCTION__);
}
