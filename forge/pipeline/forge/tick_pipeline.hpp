/**
 * @file tick_pipeline.hpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 * Tick Pipeline - one synchronous evaluation of shim and application.
 *
 * Each call to step() performs, in this fixed order:
 *
 * 1. Decode the control bank snapshot
 * 2. Compute app_enable
 * 3. Evaluate the configuration handshake
 * 4. Advance the application state machine
 * 5. Encode the status bank
 *
 * Values cross the shim/application boundary only from one tick to the
 * next. The application sees the live configuration as it stood at the start
 * of the tick; the enable gate and the handshake see the application's
 * readiness as it stood at the end of the previous tick.
 *
 * On the tick where the handshake copies a new configuration into the live
 * snapshot, the application is held in its current (ready) state. Without
 * this fence the application could leave Idle or Cooldown on that tick using
 * the old configuration and then see the new one mid-operation.
 *
 * The pipeline does not touch the register file. The caller snapshots the
 * control bank, passes it in, and publishes the returned status words. This
 * keeps step() a plain function of its inputs and the pipeline state, which
 * is what the host tests drive directly.
 */

#pragma once

#include <cstdint>

#include <forge/application_core.hpp>
#include <forge/register_shim.hpp>


namespace Forge::Pipeline {

    template<typename InstrumentT>
    class TickPipeline {
    public:
        using Shim = Forge::Shim::RegisterShim<InstrumentT>;
        using Core = Forge::Fsm::ApplicationCore<typename InstrumentT::Machine>;
        using ControlWords = typename Shim::ControlWords;
        using StatusWords = typename Shim::StatusWords;
        using Config = typename InstrumentT::Config;
        using External = typename InstrumentT::External;
        using Status = typename InstrumentT::Status;

        struct Inputs {
            ControlWords control{};     ///< Control bank snapshot taken at the start of the tick
            External external{};        ///< Hardware inputs sampled for this tick
            bool deadlineMissed = false;///< The previous tick overran its deadline
        };

        struct Outputs {
            StatusWords status{};               ///< Status bank image to publish
            Forge::Shim::ShimStatus shim{};     ///< Typed shim status (also encoded in status)
            Status app{};                       ///< Typed application status (also encoded in status)
            Config config{};                    ///< Configuration the application ran with this tick
        };

        TickPipeline() {
            reset();
        }

        /**
         * @brief Cold reset
         *
         * Handshake back to Idle, application back to Idle, live configuration
         * back to the safe default. The control bank is owned by the host and
         * is not touched.
         */
        void reset() {
            _shim.reset();
            _core.reset();
            _tickCount = 0;
        }

        /**
         * @brief Evaluate one tick
         */
        Outputs step(const Inputs &inputs) {
            const auto decoded = Shim::decode(inputs.control, inputs.external);
            const Config config = _shim.liveConfig();

            const bool appEnable = Forge::Shim::computeAppEnable(decoded.enables, _core.appSpecificReady());

            const auto handshake = _shim.evaluateHandshake(decoded.commit, decoded.candidate, _core.readyForUpdates());

            Forge::Fsm::TickContext context;
            context.appEnable = appEnable;
            context.updateFence = handshake.applied;
            context.deadlineMissed = inputs.deadlineMissed;
            context.faultClear = decoded.faultClear;

            _core.step(config, decoded.signals, context);

            Outputs outputs;
            outputs.shim.handshake = handshake.state;
            outputs.shim.appEnable = appEnable;
            outputs.shim.requestUpdate = handshake.requestUpdate;
            outputs.shim.readyForUpdates = _core.readyForUpdates();
            outputs.shim.configGeneration = _shim.liveConfig().generation;
            outputs.shim.layoutVersion = Shim::layoutVersion();
            outputs.app = _core.status();
            outputs.config = config;
            outputs.status = Shim::encode(outputs.shim, outputs.app);

            _tickCount++;

            return outputs;
        }

        const Shim &shim() const { return _shim; }
        const Core &core() const { return _core; }
        uint32_t tickCount() const { return _tickCount; }

    protected:
        Shim _shim;
        Core _core;
        uint32_t _tickCount;
    };

} // namespace Forge::Pipeline
