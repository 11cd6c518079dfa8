/**
 * @file safety.hpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 * 
 * Fault handling for Forge instruments on the RP2350.
 * 
 * Any fault the firmware cannot handle locally (a failed component
 * activation, a FreeRTOS assertion, stack overflow or heap exhaustion, a
 * hardware exception, a core that stops responding) is funnelled through
 * reportFault(). The fault is recorded in memory that survives a reset,
 * every registered component is made safe, and the chip is reset through
 * the watchdog. The record is logged by init() on the next boot.
 * 
 * After FORGE_SAFETY_MAX_REBOOTS consecutive fault resets the firmware stops
 * at boot and keeps printing the fault history instead of running the
 * instrument again.
 * 
 * Faults inside an instrument's state machine (invalid configuration, a
 * missed tick deadline) are not system faults: the machine enters its own
 * Fault state and reports it in the status bank. Only faults that leave the
 * firmware itself in doubt come here.
 * 
 * Dual-core operation:
 * - Core 0 runs FreeRTOS and owns the hardware watchdog
 * - Core 1 runs the tick loop and proves it is alive by calling
 *   feedWatchdogFromCore1() every tick
 */

#pragma once

#include <cstdint>

#include <FreeRTOS.h>
#include <task.h>


namespace Forge::Core::Safety {

    /**
     * @brief Classification of system faults
     */
    enum class FaultType : uint8_t {
        UNKNOWN = 0,
        FREERTOS_ASSERT,          ///< configASSERT failure
        STACK_OVERFLOW,           ///< FreeRTOS stack overflow hook
        MALLOC_FAILED,            ///< FreeRTOS heap exhausted
        C_ASSERT,                 ///< assert() or abort()
        HARDWARE_FAULT,           ///< Cortex-M exception
        INVALID_STATE,            ///< FORGE_PANIC_IF_NOT failure
        WATCHDOG_TIMEOUT,         ///< A core stopped feeding the watchdog
        ACTIVATION_FAILED,        ///< A component refused to activate at boot
        LAYOUT_INVALID,           ///< Instrument register layout failed validation
    };

    /**
     * @brief Name of a fault type for log output
     */
    const char *faultTypeName(FaultType type);

    /**
     * @brief A part of the firmware that can be activated and made safe
     * 
     * Components register with the safety system and are activated in
     * registration order at boot. makeSafe() is called on every registered
     * component before any fault reset; it must be idempotent and must work
     * from fault context, so it may not block or allocate.
     */
    class SafeableComponent {
    public:
        virtual ~SafeableComponent() = default;

        /**
         * @brief Bring the component into service
         * 
         * @return true on success; false aborts boot with ACTIVATION_FAILED
         */
        virtual bool activate() = 0;

        /**
         * @brief Component name for fault records (static storage)
         */
        virtual const char* getComponentName() const = 0;

        /**
         * @brief Put outputs into their safe state
         */
        virtual void makeSafe() = 0;
    };

    /**
     * @brief Initialize the safety system
     * 
     * Must be the first thing the firmware does on Core 0. Logs the fault
     * that caused the previous reset (if any), halts in the fault history
     * loop if too many consecutive fault resets have happened, then activates
     * every registered component.
     */
    void init();

    /**
     * @brief Start the dual-core watchdog
     * 
     * Enables the hardware watchdog and creates the low-priority FreeRTOS
     * task that feeds it while both cores are healthy.
     * 
     * @return true on success, false if called on Core 1 or the task could not
     *         be created
     */
    bool watchdogInit();

    /**
     * @brief Heartbeat from Core 1; no-op on Core 0
     */
    void feedWatchdogFromCore1();

    /**
     * @brief Register a component
     * 
     * @return false if the registry is full, the component is null or it is
     *         already registered
     */
    bool registerComponent(SafeableComponent* component);

    bool unregisterComponent(SafeableComponent* component);

    /**
     * @brief Activate every registered component in registration order
     * 
     * Stops at the first failure and makes every component safe.
     * 
     * @param failingComponentName Receives the name of the component that
     *                             failed, if not null
     * @return true if every component activated
     */
    bool activateAllComponents(const char** failingComponentName = nullptr);

    void makeAllComponentsSafe();

    /**
     * @brief Record a fault and reset the chip. Never returns.
     */
    void reportFault(FaultType type,
                     const char* description,
                     const char* file,
                     uint32_t line,
                     const char* function);

    /**
     * @brief Forget the consecutive fault count and the fault history
     */
    void clearFaultHistory();

} // namespace Forge::Core::Safety

/**
 * @brief Fault the system if a condition does not hold
 * 
 * @code
 * FORGE_PANIC_IF_NOT(runner != nullptr, "Runner must exist before the tick loop");
 * @endcode
 */
#define FORGE_PANIC_IF_NOT(expr, reason) \
    do { \
        if (!(expr)) { \
            Forge::Core::Safety::reportFault( \
                Forge::Core::Safety::FaultType::INVALID_STATE, \
                reason, \
                __FILE__, \
                __LINE__, \
                __FUNCTION__ \
            ); \
        } \
    } while(0)

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Target of the abort() override (use abort())
 */
void __forge_abort_impl(const char *file, int line, const char *func);

#ifdef __cplusplus
}
#endif

/**
 * @brief Route abort() through the safety system with its location
 */
#define abort() __forge_abort_impl(__FILE__, __LINE__, __FUNCTION__)
