/**
 * @file app.hpp
 * @brief Pulse generator example application
 * @copyright Copyright (c) 2025 MTA, Inc.
 * 
 * Runs the pulse instrument on Core 1 with ADC0 as the level input and a
 * GPIO as the pulse output. Core 0 reports the published status once a
 * second and, with no host transport attached, plays the host once at
 * startup: it enables the instrument, commits a configuration and arms it.
 */

#pragma once

#include <cstdint>

#include <forge/pulse_instrument.hpp>
#include <forge/instrument_app.hpp>


namespace Forge {

    class App : public Forge::Core::InstrumentApp<Forge::Instruments::PulseInstrument> {
    public:
        static constexpr uint32_t OUTPUT_PIN = 15;
        static constexpr uint32_t ADC_PIN = 26;         ///< ADC0
        static constexpr uint32_t ADC_CHANNEL = 0;

        const char* getComponentName() const override;

    protected:
        bool _activateHardware() override;
        External _sampleInputs() override;
        void _applyOutputs(const Outputs &outputs) override;
        void _makeOutputsSafe() override;

        void _initCore0() override;

        void _statusTask();
        void _demoHostTask();

        void _setControlBit(const Forge::Registers::BitPosition &position, bool value);
        void _setControlField(const Forge::Registers::FieldDescriptor &field, uint32_t value);
        bool _waitForHandshakeIdle(uint16_t generationBefore);
    };

} // namespace Forge
