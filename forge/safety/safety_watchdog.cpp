/**
 * @file safety_watchdog.cpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 * 
 * Dual-core watchdog.
 * 
 * Core 0 owns the hardware watchdog. A low-priority FreeRTOS task feeds it
 * as long as the scheduler is running and Core 1 has sent a heartbeat within
 * FORGE_SAFETY_CORE1_HEARTBEAT_TIMEOUT_MS. Core 1 sends a heartbeat every
 * tick, so a wedged tick loop starves the watchdog well before the hardware
 * timeout. When a core is found unhealthy, it is recorded in the shared
 * fault record and the watchdog is left to expire; init() reports it after
 * the reset.
 * 
 * Timing, with the defaults:
 * - Core 1 heartbeat: every tick (1 ms)
 * - Heartbeat considered stale after 100 ms
 * - Manager task checks every 50 ms
 * - Hardware watchdog fires 5 s after the last feed
 */

#include "safety_private.hpp"


namespace Forge::Core::Safety {

    /**
     * @brief Time of the last Core 1 heartbeat, in ms since boot
     * 
     * Written by Core 1 every tick and read by the manager task on Core 0.
     * 32-bit stores are single-copy atomic on the Cortex-M33, so no lock is
     * taken. Zero means Core 1 has not started ticking yet.
     */
    static volatile uint32_t gCore1LastHeartbeat = 0;

    /**
     * @brief FreeRTOS task that feeds the hardware watchdog for both cores
     * 
     * Runs every FORGE_SAFETY_WATCHDOG_TASK_PERIOD_MS at
     * FORGE_SAFETY_WATCHDOG_TASK_PRIORITY. The watchdog is fed only when the
     * FreeRTOS scheduler is running and the Core 1 heartbeat is fresh. If
     * either check fails, the first failing core is written to the shared
     * fault record and the task stops feeding, so the hardware watchdog
     * resets the chip and init() reports a WATCHDOG_TIMEOUT on the next boot.
     * 
     * A heartbeat of zero counts as stale: Core 1 must have ticked at least
     * once before the first check.
     * 
     * @param pvParameters Unused
     * 
     * @note Never returns
     */
    static void watchdogManagerTask(void* pvParameters) {
        (void)pvParameters;

        TickType_t lastWakeTime = xTaskGetTickCount();

        while (true) {
            const uint32_t now = to_ms_since_boot(get_absolute_time());
            const uint32_t lastHeartbeat = gCore1LastHeartbeat;

            const bool core1Healthy = lastHeartbeat > 0 &&
                                      (now - lastHeartbeat) < FORGE_SAFETY_CORE1_HEARTBEAT_TIMEOUT_MS;
            const bool core0Healthy = xTaskGetSchedulerState() == taskSCHEDULER_RUNNING;

            if (core0Healthy && core1Healthy) {
                watchdog_update();
                gSharedFaultSystem->watchdogFailureCore = FORGE_SAFETY_INVALID_CORE_ID;
            } else if (gSharedFaultSystem->watchdogFailureCore == FORGE_SAFETY_INVALID_CORE_ID) {
                // First failure wins; the reset comes from the hardware
                gSharedFaultSystem->watchdogFailureCore = core0Healthy ? 1 : 0;
            }

            vTaskDelayUntil(&lastWakeTime, pdMS_TO_TICKS(FORGE_SAFETY_WATCHDOG_TASK_PERIOD_MS));
        }
    }

    /**
     * @brief Start dual-core watchdog supervision
     * 
     * Creates the manager task, then enables the hardware watchdog with
     * FORGE_SAFETY_WATCHDOG_TIMEOUT_MS. The task is created first so that a
     * failed xTaskCreate() does not leave an armed watchdog nobody feeds.
     * 
     * @return true on success or if already initialized, false if called off
     *         Core 0 or if the task could not be created
     * 
     * @note Call on Core 0 after Core 1 has been launched and before
     *       vTaskStartScheduler(); App::run() does this
     * @note The watchdog pauses while a debugger halts the chip
     */
    bool watchdogInit() {
        if (get_core_num() != 0) {
            return false;
        }

        if (gWatchdogInitialized) {
            return true;
        }

        gCore1LastHeartbeat = 0;

        const BaseType_t result = xTaskCreate(
            watchdogManagerTask,
            "WatchdogMgr",
            FORGE_SAFETY_WATCHDOG_TASK_STACK_SIZE,
            nullptr,
            FORGE_SAFETY_WATCHDOG_TASK_PRIORITY,
            nullptr
        );

        if (result != pdPASS) {
            return false;
        }

        // Pause on debug so that a breakpoint does not reset the board
        watchdog_enable(FORGE_SAFETY_WATCHDOG_TIMEOUT_MS, 1);

        gWatchdogInitialized = true;
        return true;
    }

    /**
     * @brief Record a Core 1 heartbeat
     * 
     * Called once per tick from the instrument tick loop. Cheap enough for the
     * tick path: one timer read and one store.
     * 
     * @note No-op on Core 0 and before watchdogInit() has succeeded
     * @note Safe to call from interrupt context on Core 1
     */
    void feedWatchdogFromCore1() {
        if (get_core_num() != 1 || !gWatchdogInitialized) {
            return;
        }

        gCore1LastHeartbeat = to_ms_since_boot(get_absolute_time());
    }

} // namespace Forge::Core::Safety
