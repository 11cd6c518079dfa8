/**
 * @file pulse_instrument.cpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 */

#include "forge/pulse_instrument.hpp"

#include <variant>

#include <forge/log.hpp>


namespace Forge::Instruments {

    namespace States = Forge::Fsm::States;

    using Forge::Fsm::FaultCode;
    using Forge::Registers::readField;
    using Forge::Registers::writeField;

    bool isValidPulseConfig(const PulseConfig &config) {
        return config.generation != 0 &&
               config.durationTicks >= 1 &&
               config.durationTicks <= PULSE_MAX_DURATION_TICKS &&
               config.settleTicks <= PULSE_MAX_SETTLE_TICKS &&
               config.threshold <= PULSE_MAX_THRESHOLD;
    }

    // PulseMachine

    PulseMachine::PulseMachine() {
        reset();
    }

    void PulseMachine::reset() {
        _state = States::Idle{};
        _pulseCount = 0;
        _previousArm = true;
        _previousTrigger = true;
        _observed = Config{};
    }

    void PulseMachine::step(const Config &config, const Signals &signals) {
        if (std::holds_alternative<States::Idle>(_state)) {
            if (signals.arm && !_previousArm) {
                if (isValidPulseConfig(config)) {
                    _transition(States::Armed{});
                } else {
                    LOGW("PulseMachine: arm ignored, configuration generation %u is not valid\n",
                         static_cast<unsigned>(config.generation));
                }
            }
        } else if (std::holds_alternative<States::Armed>(_state)) {
            if (!signals.arm) {
                _transition(States::Idle{});
            } else if (_triggered(config, signals)) {
                _transition(States::Active{});
            }
        } else if (auto *active = std::get_if<States::Active>(&_state)) {
            active->elapsed++;

            if (active->elapsed >= config.durationTicks) {
                _pulseCount++;
                _transition(States::Cooldown{});
            }
        } else if (auto *cooldown = std::get_if<States::Cooldown>(&_state)) {
            cooldown->elapsed++;

            // A refused configuration can arrive during Cooldown; its settle
            // time is still honoured up to the validated maximum
            const uint32_t settle = config.settleTicks < PULSE_MAX_SETTLE_TICKS ? config.settleTicks : PULSE_MAX_SETTLE_TICKS;

            if (cooldown->elapsed >= settle) {
                const bool rearm = config.mode == PulseMode::Continuous && signals.arm;

                if (rearm && isValidPulseConfig(config)) {
                    _transition(States::Armed{});
                } else {
                    if (rearm) {
                        LOGW("PulseMachine: re-arm refused, configuration generation %u is not valid\n",
                             static_cast<unsigned>(config.generation));
                    }
                    _transition(States::Idle{});
                }
            }
        }
    }

    void PulseMachine::onDisabled(const Config &config, const Signals &signals) {
        (void)config;
        (void)signals;

        if (std::holds_alternative<States::Active>(_state)) {
            LOGW("PulseMachine: enable dropped while active, aborting pulse\n");
            _transition(States::Cooldown{.elapsed = 0, .aborted = true});
        } else if (std::holds_alternative<States::Armed>(_state)) {
            _transition(States::Idle{});
        }
    }

    void PulseMachine::latchInputs(const Config &config, const Signals &signals) {
        _previousArm = signals.arm;
        _previousTrigger = signals.softwareTrigger;
        _observed = config;
    }

    FaultCode PulseMachine::checkInvariants(const Config &config) const {
        // Idle and Cooldown are the only states a new configuration can land
        // in. An out-of-range one is refused there, never faulted, so the
        // outcome does not depend on when the host's commit was applied.
        if (!std::holds_alternative<States::Armed>(_state) && !std::holds_alternative<States::Active>(_state)) {
            return FaultCode::None;
        }

        if (!isValidPulseConfig(config)) {
            return FaultCode::InvalidConfig;
        }

        // The configuration cannot change while Active, so the counter can
        // never legitimately run past the duration
        if (auto *active = std::get_if<States::Active>(&_state)) {
            if (active->elapsed > config.durationTicks) {
                return FaultCode::PhaseOverrun;
            }
        }

        return FaultCode::None;
    }

    void PulseMachine::enterFault(FaultCode code) {
        _transition(States::Fault{code});
    }

    void PulseMachine::clearFault() {
        if (std::holds_alternative<States::Fault>(_state)) {
            _transition(States::Idle{});
        }
    }

    bool PulseMachine::inFault() const {
        return std::holds_alternative<States::Fault>(_state);
    }

    bool PulseMachine::readyForUpdates() const {
        return std::holds_alternative<States::Idle>(_state) || std::holds_alternative<States::Cooldown>(_state);
    }

    bool PulseMachine::appSpecificReady() const {
        return !inFault();
    }

    PulseStatus PulseMachine::status() const {
        PulseStatus status;

        status.state = Forge::Fsm::stateCode(_state);
        status.pulseCount = _pulseCount;
        status.threshold = _observed.threshold;
        status.duration = _observed.durationTicks;

        if (auto *active = std::get_if<States::Active>(&_state)) {
            status.output = true;
            status.phaseTicks = static_cast<uint16_t>(active->elapsed);
        } else if (auto *cooldown = std::get_if<States::Cooldown>(&_state)) {
            status.aborted = cooldown->aborted;
            status.phaseTicks = static_cast<uint16_t>(cooldown->elapsed);
        } else if (auto *fault = std::get_if<States::Fault>(&_state)) {
            status.faulted = true;
            status.fault = fault->code;
        }

        return status;
    }

    bool PulseMachine::_triggered(const Config &config, const Signals &signals) const {
        switch (config.triggerSource) {
            case TriggerSource::Level:
                return signals.inputLevel >= config.threshold;
            case TriggerSource::Software:
                return signals.softwareTrigger && !_previousTrigger;
        }

        return false;
    }

    void PulseMachine::_transition(Forge::Fsm::State next) {
        LOGD("PulseMachine: %s -> %s\n", Forge::Fsm::stateName(_state), Forge::Fsm::stateName(next));
        _state = next;
    }

    // PulseInstrument

    PulseConfig PulseInstrument::decodeConfig(const Layout::ControlWords &words) {
        PulseConfig config;

        config.threshold = static_cast<uint16_t>(readField(PulseFields::Threshold, words));
        config.durationTicks = static_cast<uint16_t>(readField(PulseFields::Duration, words));
        config.settleTicks = static_cast<uint16_t>(readField(PulseFields::Settle, words));

        switch (readField(PulseFields::Source, words)) {
            case 1:
                config.triggerSource = TriggerSource::Level;
                break;
            default:
                config.triggerSource = TriggerSource::Software;
                break;
        }

        switch (readField(PulseFields::Mode, words)) {
            case 1:
                config.mode = PulseMode::Continuous;
                break;
            default:
                config.mode = PulseMode::Single;
                break;
        }

        return config;
    }

    PulseSignals PulseInstrument::decodeSignals(const Layout::ControlWords &words, const External &external) {
        PulseSignals signals;

        signals.arm = readField(PulseFields::Arm, words) != 0;
        signals.softwareTrigger = readField(PulseFields::SoftwareTrigger, words) != 0;
        signals.inputLevel = external.inputLevel;

        return signals;
    }

    void PulseInstrument::encodeStatus(const Status &status, Layout::StatusWords &words) {
        writeField(PulseFields::State, words, static_cast<uint32_t>(status.state));
        writeField(PulseFields::Fault, words, static_cast<uint32_t>(status.fault));
        writeField(PulseFields::Output, words, status.output ? 1u : 0u);
        writeField(PulseFields::Aborted, words, status.aborted ? 1u : 0u);
        writeField(PulseFields::Faulted, words, status.faulted ? 1u : 0u);
        writeField(PulseFields::PulseCount, words, status.pulseCount);
        writeField(PulseFields::PhaseTicks, words, status.phaseTicks);
        writeField(PulseFields::ThresholdEcho, words, status.threshold);
        writeField(PulseFields::DurationEcho, words, status.duration);
    }

    PulseStatus PulseInstrument::decodeStatus(const Layout::StatusWords &words) {
        PulseStatus status;

        status.state = static_cast<Forge::Fsm::StateCode>(readField(PulseFields::State, words));
        status.fault = static_cast<FaultCode>(readField(PulseFields::Fault, words));
        status.output = readField(PulseFields::Output, words) != 0;
        status.aborted = readField(PulseFields::Aborted, words) != 0;
        status.faulted = readField(PulseFields::Faulted, words) != 0;
        status.pulseCount = static_cast<uint16_t>(readField(PulseFields::PulseCount, words));
        status.phaseTicks = static_cast<uint16_t>(readField(PulseFields::PhaseTicks, words));
        status.threshold = static_cast<uint16_t>(readField(PulseFields::ThresholdEcho, words));
        status.duration = static_cast<uint16_t>(readField(PulseFields::DurationEcho, words));

        return status;
    }

} // namespace Forge::Instruments
