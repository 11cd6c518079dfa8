/**
 * @file pulse_bench.hpp
 * @brief Host test bench for the pulse instrument.
 * @copyright Copyright (c) 2025 MTA, Inc.
 * 
 */

#ifndef FORGE_PULSE_BENCH_HPP
#define FORGE_PULSE_BENCH_HPP

#include <cstdint>

#include <forge/instrument_runner.hpp>
#include <forge/pulse_instrument.hpp>

#include "fake_tick_clock.hpp"

namespace Forge::Testing {

    /**
     * @brief Pulse generator on a host test bench.
     * 
     * Plays the part of the host transport (writing control words and
     * reading status words) and of the Core 1 tick loop (running ticks on
     * a fake clock).
     */
    class PulseBench {
    public:
        using Runner = Forge::Pipeline::InstrumentRunner<Forge::Instruments::PulseInstrument>;
        using Outputs = Runner::Outputs;
        using Shim = Runner::Pipeline::Shim;

        static constexpr uint32_t PERIOD_US = 1000;

        PulseBench();

        // Host writes
        void setEnables(bool forgeReady, bool userEnable, bool clkEnable);
        void enableAll();
        void writeConfig(const Forge::Instruments::PulseConfig &config);
        void writeRawConfig(uint32_t cfg0, uint32_t cfg1);
        void setArm(bool value);
        void setSoftwareTrigger(bool value);
        void setCommit(bool value);
        void setFaultClear(bool value);

        /**
         * @brief Raise commit, run one tick, lower commit.
         */
        Outputs pulseCommit();

        /**
         * @brief Raise fault_clear, run one tick, lower it.
         */
        Outputs pulseFaultClear();

        /**
         * @brief Raise sw_trigger, run one tick, lower it.
         */
        Outputs pulseSoftwareTrigger();

        /**
         * @brief Write a configuration, commit it and tick until it is applied.
         * 
         * @return true if the configuration was applied within maxTicks
         */
        bool configure(const Forge::Instruments::PulseConfig &config, int maxTicks = 8);

        // Ticks
        Outputs tick();
        Outputs tickN(int count);

        /**
         * @brief Make the next tick overrun its deadline.
         */
        void overrunNextTick();

        void coldReset();

        /**
         * @brief Decode the published status bank the way a host would.
         */
        Shim::StatusView readStatus() const;

        uint16_t inputLevel = 0;
        Outputs last;

        Runner &runner() { return _runner; }

    private:
        FakeTickClock _clock;
        Runner _runner;
        bool _overrun;

        void _setControlBit(const Forge::Registers::BitPosition &position, bool value);
        void _setControlField(const Forge::Registers::FieldDescriptor &field, uint32_t value);
    };

}

#endif // FORGE_PULSE_BENCH_HPP
