/**
 * @file instrument_app.hpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 * 
 * App specialisation that runs one instrument's tick pipeline on Core 1.
 * 
 * Core 1 loop, once per FORGE_TICK_PERIOD_US:
 * 
 * 1. _sampleInputs() reads the hardware inputs
 * 2. The runner snapshots the control bank, steps the pipeline and
 *    publishes the status bank
 * 3. _applyOutputs() drives the hardware from the tick's outputs
 * 4. Core 1 feeds the watchdog and waits for the next tick
 * 
 * A tick that overruns its period is reported to the next tick, which faults
 * the instrument's state machine. The loop itself keeps running, so the host
 * can read the fault and clear it.
 * 
 * The register file is the only state shared with Core 0. A host transport
 * running on Core 0 writes the control bank and reads the status bank
 * through _runner.registers().
 * 
 * Derived classes provide the hardware side:
 * 
 * @code
 * class MyApp : public Forge::Core::InstrumentApp<MyInstrument> {
 *     External _sampleInputs() override;
 *     void _applyOutputs(const Outputs &outputs) override;
 *     void _makeOutputsSafe() override;
 *     void _initCore0() override;
 * };
 * @endcode
 */

#pragma once

#include <cstdint>

#include <forge/instrument_runner.hpp>
#include <forge/log.hpp>
#include <forge/pico_tick_clock.hpp>

// Last: forge/safety.hpp redefines abort()
#include <forge/app.hpp>


#ifndef FORGE_TICK_PERIOD_US
#define FORGE_TICK_PERIOD_US 1000       ///< Tick period of the Core 1 loop
#endif


namespace Forge::Core {

    template<typename InstrumentT>
    class InstrumentApp : public App {
    public:
        using Runner = Forge::Pipeline::InstrumentRunner<InstrumentT>;
        using External = typename InstrumentT::External;
        using Outputs = typename Runner::Outputs;

        InstrumentApp() : _runner(_clock, FORGE_TICK_PERIOD_US) {
        }

        /**
         * @brief Refuse to start with an invalid register layout
         * 
         * The layout is also checked at compile time; this catches a layout
         * that was changed without rebuilding everything that includes it,
         * and names the offending field in the fault record.
         */
        bool activate() override {
            const char *failingField = nullptr;
            const Forge::Registers::LayoutError error = Runner::Pipeline::Shim::validate(&failingField);

            if (error != Forge::Registers::LayoutError::None) {
                LOGE("Register layout invalid: %s (%s)\n",
                     Forge::Registers::layoutErrorName(error),
                     failingField ? failingField : "reserved bits");
                return false;
            }

            LOGD("Register layout version %u, tick period %lu us\n",
                 static_cast<unsigned>(Runner::Pipeline::Shim::layoutVersion()),
                 static_cast<unsigned long>(FORGE_TICK_PERIOD_US));

            return _activateHardware();
        }

        void makeSafe() override {
            _makeOutputsSafe();
        }

    protected:
        PicoTickClock _clock;
        Runner _runner;

        /**
         * @brief Sample the hardware inputs for this tick (Core 1)
         */
        virtual External _sampleInputs() = 0;

        /**
         * @brief Drive the hardware from this tick's outputs (Core 1)
         */
        virtual void _applyOutputs(const Outputs &outputs) = 0;

        /**
         * @brief Drive every output to its safe level
         * 
         * Called from fault context on either core; must not block.
         */
        virtual void _makeOutputsSafe() = 0;

        /**
         * @brief Configure peripherals; outputs must start safe
         */
        virtual bool _activateHardware() { return true; }

        void _startCore1() override {
            _runner.start();

            while (true) {
                const Outputs outputs = _runner.runTick(_sampleInputs());
                _applyOutputs(outputs);

                Forge::Core::Safety::feedWatchdogFromCore1();

                _runner.waitForNextTick();
            }
        }
    };

} // namespace Forge::Core
