/**
 * @file pulse_instrument.hpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 * Pulse generator instrument.
 *
 * The pulse generator is armed by the host, waits for a trigger (either a
 * software trigger bit or an analog input crossing a threshold), drives its
 * output for a configured number of ticks, then holds off for a configured
 * settle time before it can fire again. In continuous mode it re-arms itself
 * after every settle period for as long as the arm bit stays high.
 *
 * Register map (layout version 2)
 *
 * Control bank:
 *
 *     CTRL   [0]  forge_ready
 *            [1]  user_enable
 *            [2]  clk_enable
 *            [3]  commit          (rising edge)
 *            [4]  fault_clear     (rising edge)
 *            [8]  arm
 *            [9]  sw_trigger      (rising edge)
 *     CFG0   [15:0]  threshold
 *            [17:16] trigger source (0 = software, 1 = level)
 *            [19:18] mode           (0 = single, 1 = continuous)
 *     CFG1   [15:0]  duration ticks
 *            [31:16] settle ticks
 *
 * Status bank:
 *
 *     SHIM   [1:0]   handshake state
 *            [2]     app_enable
 *            [3]     request_update
 *            [4]     ready_for_updates
 *            [31:16] layout version
 *     STATE  [15:0]  config generation
 *            [18:16] state
 *            [23:20] fault code
 *            [24]    output
 *            [25]    last cooldown was an abort
 *            [26]    fault: set exactly while the state is Fault
 *     COUNT  [15:0]  completed pulses (wraps)
 *            [31:16] ticks spent in the current phase
 *     ECHO   [15:0]  threshold in use
 *            [31:16] duration in use
 *
 * Configuration fields only take effect through the commit handshake. The
 * arm, sw_trigger and fault_clear bits are live and are read every tick.
 */

#pragma once

#include <cstdint>

#include <forge/fsm_state.hpp>
#include <forge/register_layout.hpp>


namespace Forge::Instruments {

    // Validated ranges. Configurations outside these ranges are refused.
    constexpr uint16_t PULSE_MAX_THRESHOLD = 4095;          ///< 12-bit converter full scale
    constexpr uint16_t PULSE_MAX_DURATION_TICKS = 10000;
    constexpr uint16_t PULSE_MAX_SETTLE_TICKS = 10000;

    constexpr uint16_t PULSE_LAYOUT_VERSION = 2;

    enum class TriggerSource : uint8_t {
        Software = 0,   ///< Rising edge of sw_trigger
        Level = 1,      ///< Input level at or above threshold
    };

    enum class PulseMode : uint8_t {
        Single = 0,
        Continuous = 1,
    };

    /**
     * @brief Pulse generator configuration
     *
     * The default value is the safe default: generation 0 marks an
     * instrument that has never received a configuration, and such an
     * instrument cannot be armed.
     */
    struct PulseConfig {
        uint16_t threshold = 0;
        TriggerSource triggerSource = TriggerSource::Software;
        PulseMode mode = PulseMode::Single;
        uint16_t durationTicks = 0;
        uint16_t settleTicks = 0;
        uint16_t generation = 0;

        bool operator==(const PulseConfig &) const = default;
    };

    /**
     * @brief Check a configuration against the validated ranges
     *
     * @return true if the configuration has been applied at least once and
     *         every field is within range
     */
    bool isValidPulseConfig(const PulseConfig &config);

    /**
     * @brief Inputs sampled from hardware rather than from registers
     */
    struct PulseExternal {
        uint16_t inputLevel = 0;
    };

    /**
     * @brief Live signals, read every tick and not subject to the handshake
     */
    struct PulseSignals {
        bool arm = false;
        bool softwareTrigger = false;
        uint16_t inputLevel = 0;
    };

    struct PulseStatus {
        Forge::Fsm::StateCode state = Forge::Fsm::StateCode::Idle;
        Forge::Fsm::FaultCode fault = Forge::Fsm::FaultCode::None;
        bool output = false;
        bool aborted = false;
        bool faulted = false;
        uint16_t pulseCount = 0;
        uint16_t phaseTicks = 0;
        uint16_t threshold = 0;
        uint16_t duration = 0;

        bool operator==(const PulseStatus &) const = default;
    };

    /**
     * @brief Pulse generator state machine
     *
     * Driven by Forge::Fsm::ApplicationCore, which handles enable gating,
     * fault precedence and fault clearing. This class only implements the
     * instrument's own transitions:
     *
     * - Idle -> Armed on a rising edge of arm, if the configuration is valid
     * - Armed -> Idle when arm is released
     * - Armed -> Active on trigger
     * - Active -> Cooldown after durationTicks
     * - Cooldown -> Armed after settleTicks in continuous mode with arm held
     * - Cooldown -> Idle after settleTicks otherwise
     *
     * When app_enable drops, Active aborts into Cooldown and Armed disarms.
     */
    class PulseMachine {
    public:
        using Config = PulseConfig;
        using Signals = PulseSignals;
        using Status = PulseStatus;

        PulseMachine();

        void reset();
        void step(const Config &config, const Signals &signals);
        void onDisabled(const Config &config, const Signals &signals);
        void latchInputs(const Config &config, const Signals &signals);

        /**
         * @brief Report a configuration or phase invariant violation
         *
         * Only Armed and Active can fault on the configuration, and the
         * handshake never applies one in those states. In Idle and Cooldown an
         * invalid configuration is refused instead: arming and continuous
         * re-arm are ignored, so the host can commit a corrected one.
         */
        Forge::Fsm::FaultCode checkInvariants(const Config &config) const;

        void enterFault(Forge::Fsm::FaultCode code);
        void clearFault();

        bool inFault() const;
        bool readyForUpdates() const;
        bool appSpecificReady() const;
        Status status() const;

        const Forge::Fsm::State &state() const { return _state; }

    protected:
        Forge::Fsm::State _state;
        uint16_t _pulseCount;
        bool _previousArm;
        bool _previousTrigger;
        Config _observed;

        bool _triggered(const Config &config, const Signals &signals) const;
        void _transition(Forge::Fsm::State next);
    };

    /**
     * @brief Register field positions for the pulse generator
     */
    namespace PulseFields {

        using Forge::Registers::Bank;
        using Forge::Registers::FieldDescriptor;

        constexpr uint8_t CTRL = 0;
        constexpr uint8_t CFG0 = 1;
        constexpr uint8_t CFG1 = 2;

        constexpr uint8_t SHIM = 0;
        constexpr uint8_t STATE = 1;
        constexpr uint8_t COUNT = 2;
        constexpr uint8_t ECHO = 3;

        constexpr FieldDescriptor Arm               {"arm",               Bank::Control, CTRL,  8,  1,  1};
        constexpr FieldDescriptor SoftwareTrigger   {"sw_trigger",        Bank::Control, CTRL,  9,  1,  1};
        constexpr FieldDescriptor Threshold         {"threshold",         Bank::Control, CFG0,  0,  16, 16};
        constexpr FieldDescriptor Source            {"trigger_source",    Bank::Control, CFG0,  16, 2,  2};
        constexpr FieldDescriptor Mode              {"mode",              Bank::Control, CFG0,  18, 2,  2};
        constexpr FieldDescriptor Duration          {"duration",          Bank::Control, CFG1,  0,  16, 16};
        constexpr FieldDescriptor Settle            {"settle",            Bank::Control, CFG1,  16, 16, 16};

        constexpr FieldDescriptor State             {"state",             Bank::Status,  STATE, 16, 3,  3};
        constexpr FieldDescriptor Fault             {"fault_code",        Bank::Status,  STATE, 20, 4,  4};
        constexpr FieldDescriptor Output            {"output",            Bank::Status,  STATE, 24, 1,  1};
        constexpr FieldDescriptor Aborted           {"aborted",           Bank::Status,  STATE, 25, 1,  1};
        constexpr FieldDescriptor Faulted           {"fault",             Bank::Status,  STATE, 26, 1,  1};
        constexpr FieldDescriptor PulseCount        {"pulse_count",       Bank::Status,  COUNT, 0,  16, 16};
        constexpr FieldDescriptor PhaseTicks        {"phase_ticks",       Bank::Status,  COUNT, 16, 16, 16};
        constexpr FieldDescriptor ThresholdEcho     {"threshold_echo",    Bank::Status,  ECHO,  0,  16, 16};
        constexpr FieldDescriptor DurationEcho      {"duration_echo",     Bank::Status,  ECHO,  16, 16, 16};

    } // namespace PulseFields

    /**
     * @brief Instrument description consumed by the shim and the pipeline
     */
    struct PulseInstrument {
        using Layout = Forge::Registers::RegisterLayout<3, 4, 16>;
        using Config = PulseConfig;
        using Signals = PulseSignals;
        using External = PulseExternal;
        using Status = PulseStatus;
        using Machine = PulseMachine;

        static constexpr Layout layout = {
            .version = PULSE_LAYOUT_VERSION,
            .controlBits = {
                .forgeReady = {PulseFields::CTRL, 0},
                .userEnable = {PulseFields::CTRL, 1},
                .clkEnable  = {PulseFields::CTRL, 2},
                .commit     = {PulseFields::CTRL, 3},
                .faultClear = {PulseFields::CTRL, 4},
            },
            .shimStatus = {
                .handshakeState   = {"handshake_state",   Forge::Registers::Bank::Status, PulseFields::SHIM,  0,  2,  2},
                .appEnable        = {"app_enable",        Forge::Registers::Bank::Status, PulseFields::SHIM,  2,  1,  1},
                .requestUpdate    = {"request_update",    Forge::Registers::Bank::Status, PulseFields::SHIM,  3,  1,  1},
                .readyForUpdates  = {"ready_for_updates", Forge::Registers::Bank::Status, PulseFields::SHIM,  4,  1,  1},
                .configGeneration = {"config_generation", Forge::Registers::Bank::Status, PulseFields::STATE, 0,  16, 16},
                .layoutVersion    = {"layout_version",    Forge::Registers::Bank::Status, PulseFields::SHIM,  16, 16, 16},
            },
            .fields = {{
                PulseFields::Arm,
                PulseFields::SoftwareTrigger,
                PulseFields::Threshold,
                PulseFields::Source,
                PulseFields::Mode,
                PulseFields::Duration,
                PulseFields::Settle,
                PulseFields::State,
                PulseFields::Fault,
                PulseFields::Output,
                PulseFields::Aborted,
                PulseFields::Faulted,
                PulseFields::PulseCount,
                PulseFields::PhaseTicks,
                PulseFields::ThresholdEcho,
                PulseFields::DurationEcho,
            }},
        };

        /**
         * @brief Decode the configuration fields
         *
         * Reserved trigger source and mode encodings decode to Software and
         * Single. Generation is left at 0; the handshake stamps it on apply.
         */
        static Config decodeConfig(const Layout::ControlWords &words);

        static Signals decodeSignals(const Layout::ControlWords &words, const External &external);
        static void encodeStatus(const Status &status, Layout::StatusWords &words);

        /**
         * @brief Decode the application status fields
         *
         * Unknown state and fault codes are carried through unchanged.
         */
        static Status decodeStatus(const Layout::StatusWords &words);
    };

} // namespace Forge::Instruments
