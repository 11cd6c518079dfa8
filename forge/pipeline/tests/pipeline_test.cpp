/**
 * @file pipeline_test.cpp
 * @brief End-to-end tests of the tick pipeline through the register file.
 * @copyright Copyright (c) 2025 MTA, Inc.
 * 
 */

#include "test_check.hpp"
#include "pulse_bench.hpp"

#include <iostream>

using namespace Forge::Instruments;
using Forge::Fsm::FaultCode;
using Forge::Fsm::StateCode;
using Forge::Shim::HandshakeState;
using Forge::Testing::PulseBench;

namespace {

    PulseConfig makeConfig(uint16_t threshold, uint16_t duration, uint16_t settle,
                           PulseMode mode = PulseMode::Single,
                           TriggerSource source = TriggerSource::Software) {
        PulseConfig config;
        config.threshold = threshold;
        config.triggerSource = source;
        config.mode = mode;
        config.durationTicks = duration;
        config.settleTicks = settle;
        return config;
    }

    bool sameSettings(const PulseConfig &a, const PulseConfig &b) {
        return a.threshold == b.threshold &&
               a.triggerSource == b.triggerSource &&
               a.mode == b.mode &&
               a.durationTicks == b.durationTicks &&
               a.settleTicks == b.settleTicks;
    }

    // Enabled, configured, armed and fired: the bench is left in Active
    void startPulse(PulseBench &bench, const PulseConfig &config) {
        bench.enableAll();
        bench.tick();
        bench.configure(config);
        bench.setArm(true);
        bench.tick();
        bench.pulseSoftwareTrigger();
    }

}

int main() {
    std::cout << "=== Tick Pipeline Test ===" << std::endl;

    test_section("Scenario A: partial enable");
    {
        PulseBench bench;
        bench.coldReset();
        bench.setEnables(true, false, false);
        auto outputs = bench.tick();
        test_check(!outputs.shim.appEnable, "forge_ready alone does not enable the application");
        test_check(!bench.readStatus().shim.appEnable, "app_enable bit clear in the status bank");

        bench.setEnables(true, true, false);
        test_check(!bench.tick().shim.appEnable, "clk_enable still required");

        bench.setEnables(true, true, true);
        test_check(bench.tick().shim.appEnable, "all three bits plus a healthy application enable it");

        bench.setEnables(false, true, true);
        test_check(!bench.tick().shim.appEnable, "dropping one bit disables on the same tick");
    }

    test_section("Scenario B: arm");
    {
        PulseBench bench;
        bench.enableAll();
        bench.tick();
        test_check(bench.configure(makeConfig(100, 5, 2)), "configuration applied");
        test_check(bench.last.shim.configGeneration == 1, "generation published");

        bench.setArm(true);
        auto outputs = bench.tick();
        test_check(outputs.app.state == StateCode::Armed, "arm with a valid config arms on the next tick");
        test_check(bench.readStatus().app.state == StateCode::Armed, "Armed visible in the status bank");
    }

    test_section("Scenario C: commit while Active");
    {
        PulseBench bench;
        PulseConfig first = makeConfig(100, 10, 3);
        startPulse(bench, first);
        first.generation = 1;
        test_check(bench.last.app.state == StateCode::Active, "application is Active");

        const PulseConfig second = makeConfig(3000, 4, 1);
        bench.writeConfig(second);
        bench.pulseCommit();

        bool pendingWhileActive = true;
        bool configHeld = true;
        int guard = 0;

        while (bench.last.app.state == StateCode::Active && guard++ < 50) {
            pendingWhileActive = pendingWhileActive && bench.last.shim.handshake == HandshakeState::UpdatePending;
            pendingWhileActive = pendingWhileActive && bench.last.shim.requestUpdate;
            configHeld = configHeld && bench.last.config == first;
            bench.tick();
        }

        test_check(pendingWhileActive, "handshake stays UpdatePending while Active");
        test_check(configHeld, "configuration unchanged while Active");
        test_check(bench.last.app.state == StateCode::Cooldown, "application reached Cooldown");
        test_check(bench.last.shim.handshake == HandshakeState::UpdatePending && bench.last.config == first,
                   "no change on the tick the application becomes ready");

        auto outputs = bench.tick();
        test_check(outputs.shim.handshake == HandshakeState::Applying, "applied on the next tick");
        test_check(outputs.config == first, "application still runs with the old config on the apply tick");
        test_check(outputs.app.state == StateCode::Cooldown && outputs.app.phaseTicks == 0, "application held by the fence");

        outputs = bench.tick();
        test_check(outputs.shim.handshake == HandshakeState::Applied, "Applying -> Applied");
        test_check(sameSettings(outputs.config, second) && outputs.config.generation == 2, "new config visible after the apply tick");
        test_check(outputs.app.threshold == 3000 && outputs.app.duration == 4, "status echoes the new config");

        outputs = bench.tick();
        test_check(outputs.shim.handshake == HandshakeState::Idle, "handshake back to Idle");
    }

    test_section("Scenario D: enable dropped while Active");
    {
        PulseBench bench;
        startPulse(bench, makeConfig(100, 20, 3));
        test_check(bench.last.app.state == StateCode::Active, "application is Active");

        bench.setEnables(true, false, true);
        auto outputs = bench.tick();
        test_check(outputs.app.state == StateCode::Cooldown && outputs.app.aborted, "abort path taken on the next tick");
        test_check(!outputs.app.output, "output released");
        test_check(bench.readStatus().app.aborted, "abort flag visible in the status bank");
    }

    test_section("Scenario E: overlapping commits");
    {
        PulseBench bench;
        startPulse(bench, makeConfig(100, 10, 2));

        const PulseConfig a = makeConfig(200, 3, 1);
        const PulseConfig b = makeConfig(300, 3, 1);
        const PulseConfig c = makeConfig(400, 3, 1);

        bench.writeConfig(a);
        bench.pulseCommit();
        test_check(bench.last.shim.handshake == HandshakeState::UpdatePending, "first commit pending");

        // Commit has to be seen low for a tick between writes
        bench.tick();
        bench.writeConfig(b);
        bench.pulseCommit();
        bench.tick();
        bench.writeConfig(c);
        bench.pulseCommit();
        test_check(bench.last.app.state == StateCode::Active, "all three commits arrived while Active");

        bool sawA = false;
        bool sawB = false;
        int applies = 0;

        for (int i = 0; i < 30; i++) {
            auto outputs = bench.tick();
            sawA = sawA || sameSettings(outputs.config, a);
            sawB = sawB || sameSettings(outputs.config, b);
            if (outputs.shim.handshake == HandshakeState::Applying) {
                applies++;
            }
        }

        test_check(sameSettings(bench.last.config, c), "latest commit applied");
        test_check(!sawA && !sawB, "superseded commits never applied");
        test_check(applies == 1 && bench.last.shim.configGeneration == 2, "exactly one apply for the three commits");
    }

    test_section("Status round trip");
    {
        PulseBench bench;
        startPulse(bench, makeConfig(1234, 4, 2));

        bool matches = true;
        for (int i = 0; i < 12; i++) {
            bench.tick();
            const auto view = bench.readStatus();
            matches = matches && view.app == bench.last.app && view.shim == bench.last.shim;
        }

        test_check(matches, "host decode of the status bank matches the typed status every tick");
        test_check(bench.readStatus().shim.layoutVersion == PULSE_LAYOUT_VERSION, "layout version published");
        test_check(bench.readStatus().app.pulseCount == 1, "pulse count published");
    }

    test_section("Deadline miss");
    {
        PulseBench bench;
        startPulse(bench, makeConfig(100, 10, 2));

        bench.overrunNextTick();
        bench.tick();
        test_check(bench.runner().scheduler().missedDeadlines() == 1, "scheduler reports the overrun");

        auto outputs = bench.tick();
        test_check(outputs.app.state == StateCode::Fault && outputs.app.fault == FaultCode::DeadlineMissed,
                   "overrun faults the application on the next tick");
        test_check(!outputs.app.output, "output released on fault");
        test_check(bench.readStatus().app.faulted, "fault bit set in the status bank");

        outputs = bench.tick();
        test_check(!outputs.shim.appEnable, "app_enable withdrawn while faulted");
        test_check(!outputs.shim.readyForUpdates, "no updates accepted while faulted");

        bench.tickN(20);
        test_check(bench.last.app.state == StateCode::Fault, "fault persists");

        bench.setArm(false);
        outputs = bench.pulseFaultClear();
        test_check(outputs.app.state == StateCode::Idle, "fault cleared by the explicit reset bit");
        test_check(!bench.readStatus().app.faulted, "fault bit cleared with the fault");

        outputs = bench.tick();
        test_check(outputs.shim.appEnable, "application enabled again");
    }

    test_section("Cold reset");
    {
        PulseBench bench;
        startPulse(bench, makeConfig(100, 10, 2));

        bench.writeConfig(makeConfig(500, 2, 2));
        bench.pulseCommit();
        test_check(bench.last.shim.handshake == HandshakeState::UpdatePending, "commit pending before reset");

        bench.coldReset();
        const auto view = bench.readStatus();
        test_check(view.shim.handshake == HandshakeState::Idle, "reset status shows handshake Idle");
        test_check(view.app.state == StateCode::Idle, "reset status shows application Idle");
        test_check(view.shim.configGeneration == 0, "reset status shows the safe default config");

        auto outputs = bench.tick();
        test_check(outputs.config == PulseConfig{}, "application runs with the safe default after reset");
        test_check(outputs.app.state == StateCode::Idle, "armed bit held across reset does not re-arm");
        test_check(outputs.shim.handshake == HandshakeState::Idle, "pending commit discarded by reset");
    }

    test_section("Invariants under random traffic");
    {
        PulseBench bench;
        uint32_t seed = 0xC0FFEE;
        auto next = [&seed](uint32_t range) {
            seed = seed * 1664525u + 1013904223u;
            return (seed >> 8) % range;
        };

        bool gateHolds = true;
        bool neverReadyWhenActive = true;
        bool configChangesOnlyAfterApply = true;
        bool appliedIsLatest = true;
        bool legalSequence = true;
        bool faultBitTracksState = true;

        auto previous = bench.last;
        bool previousCommit = false;
        PulseConfig latestCommitted;
        bool forgeReady = false;
        bool userEnable = false;
        bool clkEnable = false;

        for (int i = 0; i < 5000; i++) {
            if (next(8) == 0) forgeReady = !forgeReady;
            if (next(8) == 0) userEnable = !userEnable;
            if (next(8) == 0) clkEnable = !clkEnable;
            bench.setEnables(forgeReady, userEnable, clkEnable);

            bench.setArm(next(4) != 0);
            bench.setSoftwareTrigger(next(3) == 0);
            bench.setFaultClear(next(40) == 0);
            bench.inputLevel = static_cast<uint16_t>(next(4096));

            PulseConfig candidate = makeConfig(static_cast<uint16_t>(next(4096)),
                                               static_cast<uint16_t>(next(12)),
                                               static_cast<uint16_t>(next(6)),
                                               next(2) ? PulseMode::Continuous : PulseMode::Single,
                                               next(2) ? TriggerSource::Level : TriggerSource::Software);
            const bool commit = next(6) == 0;
            if (commit) {
                bench.writeConfig(candidate);
            }
            bench.setCommit(commit);

            if (commit && !previousCommit) {
                latestCommitted = candidate;
            }
            previousCommit = commit;

            if (next(300) == 0) {
                bench.overrunNextTick();
            }

            const auto outputs = bench.tick();

            const bool expectedEnable = forgeReady && userEnable && clkEnable && previous.app.state != StateCode::Fault;
            gateHolds = gateHolds && outputs.shim.appEnable == expectedEnable;

            if (outputs.shim.readyForUpdates && outputs.app.state == StateCode::Active) {
                neverReadyWhenActive = false;
            }

            faultBitTracksState = faultBitTracksState &&
                                  outputs.app.faulted == (outputs.app.state == StateCode::Fault);

            if (!(outputs.config == previous.config) && previous.shim.handshake != HandshakeState::Applying) {
                configChangesOnlyAfterApply = false;
            }

            if (outputs.shim.handshake == HandshakeState::Applying) {
                legalSequence = legalSequence && previous.shim.handshake == HandshakeState::UpdatePending;
                appliedIsLatest = appliedIsLatest &&
                                  sameSettings(bench.runner().pipeline().shim().liveConfig(), latestCommitted);
            }

            previous = outputs;
        }

        test_check(gateHolds, "app_enable equals the four-way conjunction every tick");
        test_check(neverReadyWhenActive, "ready_for_updates never asserted in Active");
        test_check(faultBitTracksState, "fault bit set exactly while in Fault");
        test_check(configChangesOnlyAfterApply, "config seen by the application changes only after UpdatePending -> Applying");
        test_check(appliedIsLatest, "applied config is always the most recent commit");
        test_check(legalSequence, "Applying is only entered from UpdatePending");
    }

    return test_summary();
}
