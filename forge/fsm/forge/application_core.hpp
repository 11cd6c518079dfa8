/**
 * @file application_core.hpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 * Application Core - generic driver for instrument state machines.
 *
 * The driver owns the rules that every instrument shares, and leaves the
 * instrument-specific transitions to a machine class. It has no knowledge of
 * the register layout: it only sees the typed configuration and signals the
 * shim hands it, plus a small per-tick context.
 *
 * Rules applied by the driver, in priority order:
 *
 * 1. Fault is terminal. The machine leaves it only on a rising edge of the
 *    fault-clear input, which is honoured whether or not app_enable is set.
 * 2. A missed tick deadline faults the machine from any state.
 * 3. A configuration or phase invariant reported by the machine faults it.
 * 4. Without app_enable the machine does not advance; it is given the
 *    chance to take its abort path instead (onDisabled).
 * 5. On the tick where a configuration swap is in flight the machine is
 *    held in its current state (update fence).
 * 6. Otherwise the machine takes one enabled step.
 *
 * A machine class provides:
 *
 * @code
 * class MyMachine {
 * public:
 *     using Config = ...;
 *     using Signals = ...;
 *     using Status = ...;
 *
 *     void reset();
 *     void step(const Config &config, const Signals &signals);
 *     void onDisabled(const Config &config, const Signals &signals);
 *     void latchInputs(const Config &config, const Signals &signals);
 *     Forge::Fsm::FaultCode checkInvariants(const Config &config) const;
 *     void enterFault(Forge::Fsm::FaultCode code);
 *     void clearFault();
 *     bool inFault() const;
 *     bool readyForUpdates() const;
 *     bool appSpecificReady() const;
 *     Status status() const;
 * };
 * @endcode
 */

#pragma once

#include <forge/fsm_state.hpp>
#include <forge/log.hpp>


namespace Forge::Fsm {

    /**
     * @brief Per-tick inputs that are not part of the instrument's signals
     */
    struct TickContext {
        bool appEnable = false;         ///< Output of the enable gate for this tick
        bool updateFence = false;       ///< A configuration swap is in flight this tick
        bool deadlineMissed = false;    ///< The previous tick overran its deadline
        bool faultClear = false;        ///< Level of the fault-clear input
    };

    template<typename MachineT>
    class ApplicationCore {
    public:
        using Config = typename MachineT::Config;
        using Signals = typename MachineT::Signals;
        using Status = typename MachineT::Status;

        ApplicationCore() {
            reset();
        }

        /**
         * @brief Cold reset: machine back to Idle
         *
         * A fault-clear input still high across the reset does not count as
         * an edge.
         */
        void reset() {
            _machine.reset();
            _previousFaultClear = true;
        }

        /**
         * @brief Advance the application by one tick
         *
         * @param config Live configuration as of the start of the tick
         * @param signals Live signals decoded this tick
         * @param context Enable, fence, deadline and fault-clear inputs
         */
        void step(const Config &config, const Signals &signals, const TickContext &context) {
            const bool clearEdge = context.faultClear && !_previousFaultClear;
            _previousFaultClear = context.faultClear;

            const bool fenced = _evaluate(config, signals, context, clearEdge);

            // Edge detection in the machine needs every tick's levels, even
            // on ticks where it did not step. A fenced tick is skipped so that
            // an edge arriving on it is seen on the next tick instead.
            if (!fenced) {
                _machine.latchInputs(config, signals);
            }
        }

        /**
         * @brief True when a configuration swap cannot corrupt in-flight work
         */
        bool readyForUpdates() const { return _machine.readyForUpdates(); }

        /**
         * @brief The application's contribution to the enable gate
         */
        bool appSpecificReady() const { return _machine.appSpecificReady(); }

        bool inFault() const { return _machine.inFault(); }
        Status status() const { return _machine.status(); }
        const MachineT &machine() const { return _machine; }

    protected:
        MachineT _machine;
        bool _previousFaultClear;

        /**
         * @return true if the machine was held by the update fence
         */
        bool _evaluate(const Config &config, const Signals &signals, const TickContext &context, bool clearEdge) {
            if (_machine.inFault()) {
                if (clearEdge) {
                    LOGD("ApplicationCore: fault cleared\n");
                    _machine.clearFault();
                }

                return false;
            }

            if (context.deadlineMissed) {
                _fault(FaultCode::DeadlineMissed);
                return false;
            }

            const FaultCode invariant = _machine.checkInvariants(config);

            if (invariant != FaultCode::None) {
                _fault(invariant);
                return false;
            }

            if (!context.appEnable) {
                _machine.onDisabled(config, signals);
                return false;
            }

            if (context.updateFence) {
                return true;
            }

            _machine.step(config, signals);
            return false;
        }

        void _fault(FaultCode code) {
            LOGE("ApplicationCore: fault (%s)\n", faultCodeName(code));
            _machine.enterFault(code);
        }
    };

} // namespace Forge::Fsm
