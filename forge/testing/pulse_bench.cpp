/**
 * @file pulse_bench.cpp
 * @brief Host test bench for the pulse instrument.
 * @copyright Copyright (c) 2025 MTA, Inc.
 * 
 */

#include "pulse_bench.hpp"

using namespace Forge::Testing;
using Forge::Instruments::PulseConfig;
using Forge::Instruments::PulseInstrument;
namespace PulseFields = Forge::Instruments::PulseFields;

PulseBench::PulseBench() : _clock(0), _runner(_clock, PERIOD_US), _overrun(false) {
    _runner.start();

    // Power-on tick with an all-zero control bank, so edge detection has
    // seen every control bit low
    tick();
}

void PulseBench::setEnables(bool forgeReady, bool userEnable, bool clkEnable) {
    const auto &bits = PulseInstrument::layout.controlBits;
    _setControlBit(bits.forgeReady, forgeReady);
    _setControlBit(bits.userEnable, userEnable);
    _setControlBit(bits.clkEnable, clkEnable);
}

void PulseBench::enableAll() {
    setEnables(true, true, true);
}

void PulseBench::writeConfig(const PulseConfig &config) {
    uint32_t cfg0 = 0;
    uint32_t cfg1 = 0;

    cfg0 = Forge::Registers::insertField(PulseFields::Threshold, cfg0, config.threshold);
    cfg0 = Forge::Registers::insertField(PulseFields::Source, cfg0, static_cast<uint32_t>(config.triggerSource));
    cfg0 = Forge::Registers::insertField(PulseFields::Mode, cfg0, static_cast<uint32_t>(config.mode));
    cfg1 = Forge::Registers::insertField(PulseFields::Duration, cfg1, config.durationTicks);
    cfg1 = Forge::Registers::insertField(PulseFields::Settle, cfg1, config.settleTicks);

    writeRawConfig(cfg0, cfg1);
}

void PulseBench::writeRawConfig(uint32_t cfg0, uint32_t cfg1) {
    _runner.registers().writeControl(PulseFields::CFG0, cfg0);
    _runner.registers().writeControl(PulseFields::CFG1, cfg1);
}

void PulseBench::setArm(bool value) {
    _setControlField(PulseFields::Arm, value ? 1 : 0);
}

void PulseBench::setSoftwareTrigger(bool value) {
    _setControlField(PulseFields::SoftwareTrigger, value ? 1 : 0);
}

void PulseBench::setCommit(bool value) {
    _setControlBit(PulseInstrument::layout.controlBits.commit, value);
}

void PulseBench::setFaultClear(bool value) {
    _setControlBit(PulseInstrument::layout.controlBits.faultClear, value);
}

PulseBench::Outputs PulseBench::pulseCommit() {
    setCommit(true);
    Outputs outputs = tick();
    setCommit(false);
    return outputs;
}

PulseBench::Outputs PulseBench::pulseFaultClear() {
    setFaultClear(true);
    Outputs outputs = tick();
    setFaultClear(false);
    return outputs;
}

PulseBench::Outputs PulseBench::pulseSoftwareTrigger() {
    setSoftwareTrigger(true);
    Outputs outputs = tick();
    setSoftwareTrigger(false);
    return outputs;
}

bool PulseBench::configure(const PulseConfig &config, int maxTicks) {
    writeConfig(config);
    const uint16_t before = last.shim.configGeneration;

    pulseCommit();

    for (int i = 0; i < maxTicks; i++) {
        if (last.shim.configGeneration != before && last.shim.handshake == Forge::Shim::HandshakeState::Idle) {
            return true;
        }
        tick();
    }

    return last.shim.configGeneration != before && last.shim.handshake == Forge::Shim::HandshakeState::Idle;
}

PulseBench::Outputs PulseBench::tick() {
    Forge::Instruments::PulseExternal external;
    external.inputLevel = inputLevel;

    last = _runner.runTick(external);

    if (_overrun) {
        _clock.advance(PERIOD_US * 2);
        _overrun = false;
    }

    _runner.waitForNextTick();
    return last;
}

PulseBench::Outputs PulseBench::tickN(int count) {
    for (int i = 0; i < count; i++) {
        tick();
    }
    return last;
}

void PulseBench::overrunNextTick() {
    _overrun = true;
}

void PulseBench::coldReset() {
    _runner.reset();
    last = Outputs{};
}

PulseBench::Shim::StatusView PulseBench::readStatus() const {
    return Shim::decodeStatus(_runner.registers().snapshotStatus());
}

void PulseBench::_setControlBit(const Forge::Registers::BitPosition &position, bool value) {
    const uint32_t mask = Forge::Registers::bitMask(position);
    _runner.registers().modifyControl(position.reg, value ? mask : 0, value ? 0 : mask);
}

void PulseBench::_setControlField(const Forge::Registers::FieldDescriptor &field, uint32_t value) {
    uint32_t word = 0;
    _runner.registers().readControl(field.reg, word);
    _runner.registers().writeControl(field.reg, Forge::Registers::insertField(field, word, value));
}
