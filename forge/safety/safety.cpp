/**
 * @file safety.cpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 * 
 * Fault recording, boot-time fault reporting and fault reset.
 */

#include <cstring>
#include <cstdio>

#include <FreeRTOS.h>
#include <task.h>

#include <pico/stdlib.h>
#include <pico/time.h>
#include <pico/critical_section.h>
#include <pico/status_led.h>
#include <hardware/watchdog.h>

#include <forge/log.hpp>

#include "safety_private.hpp"


namespace Forge::Core::Safety {

    // One-shot alarm that forgives the consecutive fault count once the
    // firmware has run for FORGE_SAFETY_FAULTCOUNT_RESET_SECONDS
    static alarm_id_t gFaultCountResetAlarmId = 0;

    static int64_t faultCountResetAlarmCallback(alarm_id_t /*id*/, void* /*user_data*/) {
        if (gSharedFaultSystem && critical_section_is_initialized(&gSafetyCriticalSection)) {
            critical_section_enter_blocking(&gSafetyCriticalSection);
            gSharedFaultSystem->rebootCount = 0;
            critical_section_exit(&gSafetyCriticalSection);
        }

        gFaultCountResetAlarmId = 0;
        return 0;
    }

    static void scheduleFaultCountReset(uint32_t seconds) {
        if (gFaultCountResetAlarmId != 0) {
            cancel_alarm(gFaultCountResetAlarmId);
            gFaultCountResetAlarmId = 0;
        }

        if (seconds > 0) {
            gFaultCountResetAlarmId = add_alarm_in_ms(static_cast<uint32_t>(seconds) * 1000u,
                                                      faultCountResetAlarmCallback,
                                                      nullptr,
                                                      true);
        }
    }

    // Caller holds gSafetyCriticalSection
    static void appendLastFaultToHistory() {
        if (gSharedFaultSystem->rebootCount < FORGE_SAFETY_MAX_REBOOTS) {
            gSharedFaultSystem->faultHistory[gSharedFaultSystem->rebootCount] = gSharedFaultSystem->lastFaultInfo;
            gSharedFaultSystem->rebootCount++;
        }
    }

    static void resetNow() {
        watchdog_enable(1, 1);

        while (true) {
            tight_loop_contents();
        }
    }

    /**
     * @brief Record a watchdog reset that the safety system did not cause
     * 
     * The watchdog manager leaves the core that stopped responding in the
     * shared record before it stops feeding the watchdog.
     */
    static void recordWatchdogTimeout() {
        static char description[FORGE_SAFETY_MAX_FAULT_DESC_LEN];
        const uint8_t core = gSharedFaultSystem->watchdogFailureCore;

        if (core == 0) {
            snprintf(description, sizeof(description), "Watchdog timeout: Core 0 (FreeRTOS) stopped responding");
        } else if (core == 1) {
            snprintf(description, sizeof(description), "Watchdog timeout: Core 1 (tick loop) stopped responding");
        } else {
            snprintf(description, sizeof(description), "Watchdog timeout: unknown core");
        }

        critical_section_enter_blocking(&gSafetyCriticalSection);
        populateFaultInfo(FaultType::WATCHDOG_TIMEOUT, description, __FILE__, __LINE__, __func__);
        appendLastFaultToHistory();
        critical_section_exit(&gSafetyCriticalSection);
    }

    /**
     * @brief Stop here after too many consecutive fault resets
     * 
     * Outputs are already safe. The status LED blinks and the fault history
     * is printed every few seconds until someone power-cycles the board.
     */
    static void haltWithFaultHistory() {
        bool led = false;
        uint32_t iteration = 0;

        while (true) {
            if (iteration % 50 == 0) {
                LOGC("Halted after %lu consecutive fault resets\n",
                     static_cast<unsigned long>(gSharedFaultSystem->rebootCount));

                for (uint32_t i = 0; i < gSharedFaultSystem->rebootCount && i < FORGE_SAFETY_MAX_REBOOTS; i++) {
                    LOGC("Fault %lu:\n", static_cast<unsigned long>(i + 1));
                    logFaultInfo(gSharedFaultSystem->faultHistory[i]);
                }
            }

            led = !led;
            status_led_set_state(led);

            iteration++;
            sleep_ms(100);
        }
    }

    void init() {
        if (gSafetyInitialized) {
            return;
        }

        gSharedFaultSystem = reinterpret_cast<SharedFaultSystem*>(gSharedMemory);

        if (!critical_section_is_initialized(&gSafetyCriticalSection)) {
            critical_section_init(&gSafetyCriticalSection);
        }

        const bool wasWatchdogReboot = watchdog_caused_reboot();
        bool isFirstBoot = false;

        // Power-on: the uninitialized RAM holds garbage
        if (gSharedFaultSystem->magic != FORGE_FAULT_SYSTEM_MAGIC) {
            isFirstBoot = true;
            memset(gSharedFaultSystem, 0, sizeof(SharedFaultSystem));
            gSharedFaultSystem->magic = FORGE_FAULT_SYSTEM_MAGIC;
            gSharedFaultSystem->watchdogFailureCore = FORGE_SAFETY_INVALID_CORE_ID;
        }

        if (wasWatchdogReboot && !isFirstBoot) {
            if (!gSharedFaultSystem->safetySystemReset) {
                recordWatchdogTimeout();
            }

            LOGE("Reset by fault (%lu consecutive):\n", static_cast<unsigned long>(gSharedFaultSystem->rebootCount));
            logFaultInfo(gSharedFaultSystem->lastFaultInfo);
        }

        gSharedFaultSystem->safetySystemReset = false;
        gSharedFaultSystem->watchdogFailureCore = FORGE_SAFETY_INVALID_CORE_ID;

        makeAllComponentsSafe();

        if (gSharedFaultSystem->rebootCount >= FORGE_SAFETY_MAX_REBOOTS) {
            haltWithFaultHistory();
        }

        scheduleFaultCountReset(FORGE_SAFETY_FAULTCOUNT_RESET_SECONDS);

        gSafetyInitialized = true;

        const char* failingComponentName = nullptr;

        if (!activateAllComponents(&failingComponentName)) {
            static char description[FORGE_SAFETY_MAX_FAULT_DESC_LEN];

            snprintf(description, sizeof(description), "Component activation failed: %s",
                     failingComponentName ? failingComponentName : "(unknown)");
            reportFault(FaultType::ACTIVATION_FAILED, description, __FILE__, __LINE__, __func__);
        }
    }

    void reportFault(FaultType type,
                     const char* description,
                     const char* file,
                     uint32_t line,
                     const char* function) {
        if (!gSharedFaultSystem) {
            resetNow();
        }

        critical_section_enter_blocking(&gSafetyCriticalSection);
        populateFaultInfo(type, description, file, line, function);
        gSharedFaultSystem->safetySystemReset = true;
        appendLastFaultToHistory();
        critical_section_exit(&gSafetyCriticalSection);

        // Outputs go safe before the reset, not only after it
        makeAllComponentsSafe();

        resetNow();
    }

    void clearFaultHistory() {
        if (!gSharedFaultSystem || !critical_section_is_initialized(&gSafetyCriticalSection)) {
            return;
        }

        critical_section_enter_blocking(&gSafetyCriticalSection);
        memset(&gSharedFaultSystem->lastFaultInfo, 0, sizeof(FaultInfo));
        memset(gSharedFaultSystem->faultHistory, 0, sizeof(gSharedFaultSystem->faultHistory));
        gSharedFaultSystem->rebootCount = 0;
        critical_section_exit(&gSafetyCriticalSection);
    }

} // namespace Forge::Core::Safety
