/**
 * @file instrument_runner.hpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 * Binds a register file, a tick pipeline and a tick scheduler together.
 *
 * The runner is what the tick loop on Core 1 calls. One tick is:
 *
 * @code
 * runner.start();
 * for (;;) {
 *     runner.runTick(sampleHardware());
 *     runner.waitForNextTick();
 * }
 * @endcode
 *
 * runTick() snapshots the control bank once, steps the pipeline with the
 * deadline result of the previous tick, and publishes the status bank.
 * waitForNextTick() records whether the tick overran so the next runTick()
 * can report it.
 */

#pragma once

#include <cstdint>

#include <forge/register_file.hpp>
#include <forge/tick_pipeline.hpp>
#include <forge/tick_scheduler.hpp>


namespace Forge::Pipeline {

    template<typename InstrumentT>
    class InstrumentRunner {
    public:
        using Layout = typename InstrumentT::Layout;
        using Registers = Forge::Registers::RegisterFile<Layout::controlCount, Layout::statusCount>;
        using Pipeline = TickPipeline<InstrumentT>;
        using External = typename InstrumentT::External;
        using Outputs = typename Pipeline::Outputs;

        /**
         * @param clock Time source for the scheduler; must outlive the runner
         * @param periodUs Tick period in microseconds
         */
        InstrumentRunner(TickClock &clock, uint32_t periodUs) :
            _scheduler(clock, periodUs),
            _deadlineMissed(false) {
            _publishResetStatus();
        }

        /**
         * @brief Start tick timing
         */
        void start() {
            _deadlineMissed = false;
            _scheduler.start();
        }

        /**
         * @brief Run one tick against the register file
         *
         * @param external Hardware inputs sampled for this tick
         * @return The pipeline outputs for this tick
         */
        Outputs runTick(const External &external) {
            typename Pipeline::Inputs inputs;
            inputs.control = _registers.snapshotControl();
            inputs.external = external;
            inputs.deadlineMissed = _deadlineMissed;

            const Outputs outputs = _pipeline.step(inputs);
            _registers.publishStatus(outputs.status);

            _deadlineMissed = false;
            return outputs;
        }

        /**
         * @brief Wait for the next tick
         *
         * @return true if the tick that just finished overran its deadline
         */
        bool waitForNextTick() {
            _deadlineMissed = _scheduler.waitForNextTick();
            return _deadlineMissed;
        }

        /**
         * @brief Cold reset of the pipeline; the control bank is left alone
         */
        void reset() {
            _pipeline.reset();
            _deadlineMissed = false;
            _publishResetStatus();
        }

        Registers &registers() { return _registers; }
        const Registers &registers() const { return _registers; }
        const Pipeline &pipeline() const { return _pipeline; }
        const TickScheduler &scheduler() const { return _scheduler; }

    protected:
        Registers _registers;
        Pipeline _pipeline;
        TickScheduler _scheduler;
        bool _deadlineMissed;

        void _publishResetStatus() {
            Forge::Shim::ShimStatus shim;
            shim.layoutVersion = Pipeline::Shim::layoutVersion();
            shim.readyForUpdates = _pipeline.core().readyForUpdates();

            _registers.publishStatus(Pipeline::Shim::encode(shim, _pipeline.core().status()));
        }
    };

} // namespace Forge::Pipeline
