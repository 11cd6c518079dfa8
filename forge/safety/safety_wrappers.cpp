/**
 * @file safety_wrappers.cpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 * 
 * C entry points that route FreeRTOS hooks, Cortex-M fault vectors, assert()
 * and abort() into the safety system.
 */

// System headers before forge/safety.hpp, which redefines abort()
#include <cstring>
#include <cstdlib>

#include <pico/stdlib.h>
#include <FreeRTOS.h>
#include <task.h>

#include "safety_private.hpp"


using Forge::Core::Safety::FaultType;
using Forge::Core::Safety::reportFault;

// Shared by every wrapper; only one fault is ever handled before the reset
static char gWrapperDescription[FORGE_SAFETY_MAX_FAULT_DESC_LEN];

// prefix + detail into gWrapperDescription without snprintf
static const char* describe(const char* prefix, const char* detail) {
    const size_t prefixLength = strlen(prefix);

    strcpy(gWrapperDescription, prefix);

    if (detail && prefixLength < sizeof(gWrapperDescription) - 1) {
        strncpy(gWrapperDescription + prefixLength, detail, sizeof(gWrapperDescription) - prefixLength - 1);
        gWrapperDescription[sizeof(gWrapperDescription) - 1] = '\0';
    }

    return gWrapperDescription;
}

extern "C" {

    /**
     * @brief configASSERT target (see config/FreeRTOSConfig.h)
     */
    void my_assert_func(const char* file, int line, const char* func, const char* expr) {
        reportFault(FaultType::FREERTOS_ASSERT, describe("FreeRTOS assertion failed: ", expr),
                    file, static_cast<uint32_t>(line), func);
    }

    void vApplicationMallocFailedHook(void) {
        reportFault(FaultType::MALLOC_FAILED, "FreeRTOS heap exhausted",
                    __FILE__, __LINE__, __func__);
    }

    void vApplicationStackOverflowHook(TaskHandle_t xTask, char* pcTaskName) {
        (void)xTask;

        reportFault(FaultType::STACK_OVERFLOW, describe("Stack overflow in task: ", pcTaskName),
                    __FILE__, __LINE__, __func__);
    }

    void isr_hardfault(void) {
        reportFault(FaultType::HARDWARE_FAULT, "HardFault", __FILE__, __LINE__, __func__);
    }

    void isr_memmanage(void) {
        reportFault(FaultType::HARDWARE_FAULT, "MemManage fault", __FILE__, __LINE__, __func__);
    }

    void isr_busfault(void) {
        reportFault(FaultType::HARDWARE_FAULT, "BusFault", __FILE__, __LINE__, __func__);
    }

    void isr_usagefault(void) {
        reportFault(FaultType::HARDWARE_FAULT, "UsageFault", __FILE__, __LINE__, __func__);
    }

    void isr_securefault(void) {
        reportFault(FaultType::HARDWARE_FAULT, "SecureFault", __FILE__, __LINE__, __func__);
    }

    /**
     * @brief newlib assert() failure hook
     */
    void __assert_func(const char *file, int line, const char *func, const char *expr) {
        reportFault(FaultType::C_ASSERT, describe("Assertion failed: ", expr),
                    file, static_cast<uint32_t>(line), func);

        while (true) {
            tight_loop_contents();
        }
    }

    void __forge_abort_impl(const char *file, int line, const char *func) {
        reportFault(FaultType::C_ASSERT, "abort() called", file, static_cast<uint32_t>(line), func);

        while (true) {
            tight_loop_contents();
        }
    }

} // extern "C"
