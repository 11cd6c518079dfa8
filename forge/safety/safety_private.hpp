/**
 * @file safety_private.hpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 * 
 * Internal state of the safety system: configuration limits, the
 * reset-persistent fault record and the globals shared by the safety
 * implementation files. Not part of the public API.
 */

#pragma once

#include <cstring>
#include <cstdio>

#include <FreeRTOS.h>
#include <task.h>

#include <pico/stdlib.h>
#include <pico/time.h>
#include <pico/critical_section.h>
#include <hardware/watchdog.h>

#include "forge/safety.hpp"


#ifndef FORGE_SAFETY_MAX_FAULT_DESC_LEN
#define FORGE_SAFETY_MAX_FAULT_DESC_LEN 128             ///< Max fault description length
#endif

#ifndef FORGE_SAFETY_MAX_FUNCTION_NAME_LEN
#define FORGE_SAFETY_MAX_FUNCTION_NAME_LEN 64           ///< Max function name length
#endif

#ifndef FORGE_SAFETY_MAX_FILE_NAME_LEN
#define FORGE_SAFETY_MAX_FILE_NAME_LEN 96               ///< Max file name length (tail is kept)
#endif

#ifndef FORGE_SAFETY_MAX_REBOOTS
#define FORGE_SAFETY_MAX_REBOOTS 3                      ///< Consecutive fault resets before halting at boot
#endif

#ifndef FORGE_SAFETY_FAULTCOUNT_RESET_SECONDS
#define FORGE_SAFETY_FAULTCOUNT_RESET_SECONDS 60        ///< Stable runtime that clears the fault count; 0 disables
#endif

#ifndef FORGE_SAFETY_WATCHDOG_TIMEOUT_MS
#define FORGE_SAFETY_WATCHDOG_TIMEOUT_MS 5000           ///< Hardware watchdog timeout
#endif

#ifndef FORGE_SAFETY_CORE1_HEARTBEAT_TIMEOUT_MS
#define FORGE_SAFETY_CORE1_HEARTBEAT_TIMEOUT_MS 100     ///< Core 1 runs the tick loop, so its heartbeat is tight
#endif

#ifndef FORGE_SAFETY_WATCHDOG_TASK_PERIOD_MS
#define FORGE_SAFETY_WATCHDOG_TASK_PERIOD_MS 50         ///< Watchdog manager check period
#endif

#ifndef FORGE_SAFETY_WATCHDOG_TASK_PRIORITY
#define FORGE_SAFETY_WATCHDOG_TASK_PRIORITY (tskIDLE_PRIORITY + 1)
#endif

#ifndef FORGE_SAFETY_WATCHDOG_TASK_STACK_SIZE
#define FORGE_SAFETY_WATCHDOG_TASK_STACK_SIZE 256       ///< In words
#endif

#ifndef FORGE_SAFETY_MAX_REGISTERED_COMPONENTS
#define FORGE_SAFETY_MAX_REGISTERED_COMPONENTS 16
#endif

#define FORGE_SAFETY_INVALID_CORE_ID 0xFF               ///< No core has failed

#define FORGE_FAULT_SYSTEM_MAGIC 0x464F5247             ///< "FORG"
#define FORGE_COMPONENT_REGISTRY_MAGIC 0x53414645       ///< "SAFE"


namespace Forge::Core::Safety {

    /**
     * @brief Everything recorded about one fault
     */
    struct FaultInfo {
        uint32_t timestamp;                                         ///< ms since boot
        uint32_t coreId;
        FaultType type;
        uint32_t lineNumber;
        char fileName[FORGE_SAFETY_MAX_FILE_NAME_LEN];
        char functionName[FORGE_SAFETY_MAX_FUNCTION_NAME_LEN];
        char description[FORGE_SAFETY_MAX_FAULT_DESC_LEN];
        char taskName[configMAX_TASK_NAME_LEN];                     ///< Empty outside FreeRTOS tasks
        uint32_t heapFreeBytes;
        uint32_t minHeapFreeBytes;
        bool isInInterrupt;
    };

    /**
     * @brief Fault record kept in uninitialized RAM across resets
     */
    struct SharedFaultSystem {
        volatile uint32_t magic;
        FaultInfo lastFaultInfo;

        volatile uint32_t rebootCount;                              ///< Consecutive fault resets
        FaultInfo faultHistory[FORGE_SAFETY_MAX_REBOOTS];

        volatile bool safetySystemReset;                            ///< Last reset came from reportFault()
        volatile uint8_t watchdogFailureCore;                       ///< Core that starved the watchdog
    };

    extern SharedFaultSystem* gSharedFaultSystem;
    extern uint8_t gSharedMemory[];
    extern bool gSafetyInitialized;
    extern critical_section_t gSafetyCriticalSection;
    extern bool gWatchdogInitialized;

    /**
     * @brief Fill gSharedFaultSystem->lastFaultInfo for a new fault
     * 
     * Caller holds gSafetyCriticalSection.
     */
    void populateFaultInfo(FaultType type,
                           const char* description,
                           const char* file,
                           uint32_t line,
                           const char* function);

    /**
     * @brief Print one fault record through the log macros
     */
    void logFaultInfo(const FaultInfo &info);

} // namespace Forge::Core::Safety
