/**
 * @file register_shim.hpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 * Register Shim - translation layer between raw register words and the
 * typed signals consumed by the application.
 *
 * The shim owns four jobs, each evaluated once per tick:
 *
 * - Decode: turn a snapshot of the control bank into a candidate
 *   configuration, the instrument's live signals and the reserved control
 *   bits. Decoding is pure and total. Reserved or out-of-range encodings
 *   decode to the instrument's documented safe default rather than failing.
 * - Gate: compute app_enable as the conjunction of forge_ready, user_enable,
 *   clk_enable and the application's own readiness. Nothing is remembered
 *   between ticks; a single false input drops app_enable on the same tick.
 * - Handshake: drive the commit protocol (see handshake.hpp) and own the live
 *   configuration snapshot.
 * - Encode: pack the application status and the shim's own status into the
 *   status bank.
 *
 * The shim is parameterised on an instrument description. An instrument
 * provides:
 *
 * @code
 * struct MyInstrument {
 *     using Layout = Forge::Registers::RegisterLayout<C, S, F>;
 *     using Config = ...;     // default value is the safe default, has uint16_t generation
 *     using Signals = ...;    // live, non-handshaked inputs
 *     using External = ...;   // inputs sampled from hardware rather than registers
 *     using Status = ...;     // application status
 *     using Machine = ...;    // state machine driven by ApplicationCore
 *
 *     static constexpr Layout layout = { ... };
 *
 *     static Config decodeConfig(const Layout::ControlWords &words);
 *     static Signals decodeSignals(const Layout::ControlWords &words, const External &external);
 *     static void encodeStatus(const Status &status, Layout::StatusWords &words);
 *     static Status decodeStatus(const Layout::StatusWords &words);
 * };
 * @endcode
 *
 * The layout is checked with a static_assert when the shim is instantiated,
 * so a field that cannot be encoded losslessly stops the build.
 */

#pragma once

#include <cstdint>

#include <forge/handshake.hpp>
#include <forge/register_layout.hpp>


namespace Forge::Shim {

    /**
     * @brief Platform and host enable inputs decoded from the control bank
     */
    struct EnableInputs {
        bool forgeReady = false;
        bool userEnable = false;
        bool clkEnable = false;
    };

    /**
     * @brief Status fields published by the shim itself
     */
    struct ShimStatus {
        HandshakeState handshake = HandshakeState::Idle;
        bool appEnable = false;
        bool requestUpdate = false;
        bool readyForUpdates = false;
        uint16_t configGeneration = 0;
        uint16_t layoutVersion = 0;

        bool operator==(const ShimStatus &) const = default;
    };

    /**
     * @brief Evaluate the enable gate
     *
     * @param inputs Enable bits decoded this tick
     * @param appSpecificReady Application readiness as of the end of the previous tick
     * @return The app_enable signal for this tick
     */
    inline bool computeAppEnable(const EnableInputs &inputs, bool appSpecificReady) {
        return inputs.forgeReady && inputs.userEnable && inputs.clkEnable && appSpecificReady;
    }

    template<typename InstrumentT>
    class RegisterShim {
    public:
        using Layout = typename InstrumentT::Layout;
        using ControlWords = typename Layout::ControlWords;
        using StatusWords = typename Layout::StatusWords;
        using Config = typename InstrumentT::Config;
        using Signals = typename InstrumentT::Signals;
        using External = typename InstrumentT::External;
        using Status = typename InstrumentT::Status;
        using HandshakeResult = typename Handshake<Config>::Result;

        static_assert(Forge::Registers::validateLayout(InstrumentT::layout) == Forge::Registers::LayoutError::None,
                      "Instrument register layout is invalid");

        /**
         * @brief Everything decoded from one control bank snapshot
         */
        struct Decoded {
            Config candidate;
            Signals signals;
            EnableInputs enables;
            bool commit;
            bool faultClear;
        };

        /**
         * @brief Host-side view of a status bank
         */
        struct StatusView {
            ShimStatus shim;
            Status app;
        };

        /**
         * @brief Decode a control bank snapshot
         *
         * Pure and total: any bit pattern produces a valid Decoded value.
         */
        static Decoded decode(const ControlWords &words, const External &external) {
            const auto &bits = InstrumentT::layout.controlBits;

            return Decoded{
                InstrumentT::decodeConfig(words),
                InstrumentT::decodeSignals(words, external),
                EnableInputs{
                    Forge::Registers::readBit(bits.forgeReady, words),
                    Forge::Registers::readBit(bits.userEnable, words),
                    Forge::Registers::readBit(bits.clkEnable, words),
                },
                Forge::Registers::readBit(bits.commit, words),
                Forge::Registers::readBit(bits.faultClear, words),
            };
        }

        /**
         * @brief Run the handshake for this tick
         *
         * @param commitLevel Level of the commit bit in this tick's snapshot
         * @param candidate Configuration decoded this tick
         * @param readyForUpdates Application readiness as of the end of the previous tick
         */
        HandshakeResult evaluateHandshake(bool commitLevel, const Config &candidate, bool readyForUpdates) {
            return _handshake.evaluate(commitLevel, candidate, readyForUpdates);
        }

        /**
         * @brief Pack shim and application status into a status bank image
         */
        static StatusWords encode(const ShimStatus &shim, const Status &status) {
            using Forge::Registers::writeField;

            const auto &map = InstrumentT::layout.shimStatus;
            StatusWords words{};

            writeField(map.handshakeState, words, static_cast<uint32_t>(shim.handshake));
            writeField(map.appEnable, words, shim.appEnable ? 1u : 0u);
            writeField(map.requestUpdate, words, shim.requestUpdate ? 1u : 0u);
            writeField(map.readyForUpdates, words, shim.readyForUpdates ? 1u : 0u);
            writeField(map.configGeneration, words, shim.configGeneration);
            writeField(map.layoutVersion, words, shim.layoutVersion);

            InstrumentT::encodeStatus(status, words);

            return words;
        }

        /**
         * @brief Decode a status bank image back into typed status
         *
         * This is what a host driver does after reading the status bank.
         */
        static StatusView decodeStatus(const StatusWords &words) {
            using Forge::Registers::readField;

            const auto &map = InstrumentT::layout.shimStatus;
            StatusView view{};

            view.shim.handshake = static_cast<HandshakeState>(readField(map.handshakeState, words) & 0x3u);
            view.shim.appEnable = readField(map.appEnable, words) != 0;
            view.shim.requestUpdate = readField(map.requestUpdate, words) != 0;
            view.shim.readyForUpdates = readField(map.readyForUpdates, words) != 0;
            view.shim.configGeneration = static_cast<uint16_t>(readField(map.configGeneration, words));
            view.shim.layoutVersion = static_cast<uint16_t>(readField(map.layoutVersion, words));
            view.app = InstrumentT::decodeStatus(words);

            return view;
        }

        /**
         * @brief Check the instrument layout at runtime
         *
         * The same check runs at compile time; this entry point exists so the
         * target can refuse to activate with a diagnostic naming the field.
         */
        static Forge::Registers::LayoutError validate(const char **failingField = nullptr) {
            return Forge::Registers::validateLayout(InstrumentT::layout, failingField);
        }

        static constexpr uint16_t layoutVersion() { return InstrumentT::layout.version; }

        /**
         * @brief Cold reset: handshake Idle, live configuration back to the safe default
         */
        void reset() {
            _handshake.reset();
        }

        const Config &liveConfig() const { return _handshake.live(); }
        HandshakeState handshakeState() const { return _handshake.state(); }
        bool requestUpdate() const { return _handshake.requestUpdate(); }
        bool hasQueuedCommit() const { return _handshake.hasQueuedCommit(); }

    protected:
        Handshake<Config> _handshake;
    };

} // namespace Forge::Shim
