/**
 * @file safety_private.cpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 * 
 * Safety system globals and fault record capture.
 * 
 * Everything here may run in fault context (a hard fault handler, a stack
 * overflow hook), so it works directly on the shared record, uses no heap
 * and keeps its own stack use small.
 */

#include "safety_private.hpp"

#include <forge/log.hpp>


namespace Forge::Core::Safety {

    /**
     * @brief Fault record shared by both cores and preserved across resets
     * 
     * Points into gSharedMemory once init() has run; null before that, which
     * every fault-context path checks for.
     */
    SharedFaultSystem* gSharedFaultSystem = nullptr;

    /**
     * @brief Backing store for gSharedFaultSystem
     * 
     * Lives in .uninitialized_data so that the C runtime does not clear it
     * and the fault record survives the watchdog reset.
     */
    uint8_t gSharedMemory[sizeof(SharedFaultSystem)] __attribute__((section(".uninitialized_data"))) __attribute__((aligned(4)));

    /**
     * @brief Set by init() once the shared record is valid
     */
    bool gSafetyInitialized = false;

    /**
     * @brief Serialises fault recording between the two cores
     */
    critical_section_t gSafetyCriticalSection;

    /**
     * @brief Set by watchdogInit() once the manager task runs
     */
    bool gWatchdogInitialized = false;

    /**
     * @brief Copy a string into a fixed buffer, always terminating it
     * 
     * @param dest Destination buffer; nothing happens if null or empty
     * @param src Source string; null yields an empty string
     * @param size Size of dest in bytes
     */
    static inline void copyBounded(char* dest, const char* src, size_t size) {
        if (!dest || size == 0) {
            return;
        }

        if (!src) {
            dest[0] = '\0';
            return;
        }

        size_t i = 0;
        while (i < size - 1 && src[i] != '\0') {
            dest[i] = src[i];
            i++;
        }
        dest[i] = '\0';
    }

    /**
     * @brief Trim a path to the part that fits a buffer of the given size
     * 
     * Keeps the tail of long paths, since the file name is the useful part.
     * 
     * @return Pointer into path, or null if path is null
     */
    static inline const char* pathTail(const char* path, size_t size) {
        if (!path) {
            return nullptr;
        }

        const size_t length = strlen(path);
        return length < size ? path : path + (length - (size - 1));
    }

    /**
     * @brief True when running in an exception handler
     * 
     * Reads IPSR, which is non-zero in handler mode.
     */
    static inline bool inInterrupt() {
        uint32_t ipsr;
        __asm volatile ("MRS %0, IPSR" : "=r" (ipsr));
        return (ipsr & 0x1FF) != 0;
    }

    /**
     * @brief Fill in the shared fault record for a new fault
     * 
     * Clears the previous record, then captures the time, core, interrupt
     * state and call site. On Core 0 it also captures heap usage and, when
     * called from a task, the task name. Strings are truncated to the
     * FORGE_SAFETY_MAX_* buffer sizes.
     * 
     * @param type Fault category
     * @param description Human-readable reason; may be null
     * @param file Source file; only the tail is kept
     * @param line Source line
     * @param function Function name; may be null
     * 
     * @note Safe in fault context: no heap, no locks, no logging
     * @note No-op before init() has mapped the shared record
     */
    void populateFaultInfo(FaultType type,
                           const char* description,
                           const char* file,
                           uint32_t line,
                           const char* function) {
        if (!gSharedFaultSystem) {
            return;
        }

        FaultInfo &info = gSharedFaultSystem->lastFaultInfo;
        memset(&info, 0, sizeof(FaultInfo));

        info.timestamp = to_ms_since_boot(get_absolute_time());
        info.coreId = get_core_num();
        info.type = type;
        info.lineNumber = line;
        info.isInInterrupt = inInterrupt();

        copyBounded(info.fileName, pathTail(file, sizeof(info.fileName)), sizeof(info.fileName));
        copyBounded(info.functionName, function, sizeof(info.functionName));
        copyBounded(info.description, description, sizeof(info.description));

        // Heap and task details only exist on the FreeRTOS core
        if (info.coreId == 0) {
            info.heapFreeBytes = xPortGetFreeHeapSize();
            info.minHeapFreeBytes = xPortGetMinimumEverFreeHeapSize();

            if (!info.isInInterrupt && xTaskGetSchedulerState() == taskSCHEDULER_RUNNING) {
                TaskHandle_t task = xTaskGetCurrentTaskHandle();

                if (task != nullptr) {
                    copyBounded(info.taskName, pcTaskGetName(task), sizeof(info.taskName));
                }
            }
        }
    }

    /**
     * @brief Print a fault record at critical level
     * 
     * Used on boot for the fault that caused the reset, and by the halt loop
     * for the fault history. Heap figures are only printed for Core 0
     * faults, where they were captured.
     */
    void logFaultInfo(const FaultInfo &info) {
        LOGC("  %s on core %lu at %lu ms\n",
             faultTypeName(info.type),
             static_cast<unsigned long>(info.coreId),
             static_cast<unsigned long>(info.timestamp));
        LOGC("  %s\n", info.description);
        LOGC("  %s:%lu in %s\n", info.fileName, static_cast<unsigned long>(info.lineNumber), info.functionName);

        if (info.taskName[0] != '\0') {
            LOGC("  task %s\n", info.taskName);
        }

        if (info.coreId == 0) {
            LOGC("  heap %lu free, %lu minimum\n",
                 static_cast<unsigned long>(info.heapFreeBytes),
                 static_cast<unsigned long>(info.minHeapFreeBytes));
        }

        if (info.isInInterrupt) {
            LOGC("  in interrupt context\n");
        }
    }

    /**
     * @brief Printable name of a fault type
     * 
     * @return Static string; "UNKNOWN" for values outside the enum
     */
    const char *faultTypeName(FaultType type) {
        switch (type) {
            case FaultType::FREERTOS_ASSERT:    return "FREERTOS_ASSERT";
            case FaultType::STACK_OVERFLOW:     return "STACK_OVERFLOW";
            case FaultType::MALLOC_FAILED:      return "MALLOC_FAILED";
            case FaultType::C_ASSERT:           return "C_ASSERT";
            case FaultType::HARDWARE_FAULT:     return "HARDWARE_FAULT";
            case FaultType::INVALID_STATE:      return "INVALID_STATE";
            case FaultType::WATCHDOG_TIMEOUT:   return "WATCHDOG_TIMEOUT";
            case FaultType::ACTIVATION_FAILED:  return "ACTIVATION_FAILED";
            case FaultType::LAYOUT_INVALID:     return "LAYOUT_INVALID";
            case FaultType::UNKNOWN:            break;
        }

        return "UNKNOWN";
    }

} // namespace Forge::Core::Safety
