/**
 * @file scheduler_test.cpp
 * @brief Tests for fixed-rate tick scheduling and deadline-miss detection.
 * @copyright Copyright (c) 2025 MTA, Inc.
 * 
 */

#include "test_check.hpp"
#include "fake_tick_clock.hpp"

#include <iostream>

#include <forge/tick_scheduler.hpp>

using Forge::Pipeline::TickScheduler;
using Forge::Testing::FakeTickClock;

int main() {
    std::cout << "=== Tick Scheduler Test ===" << std::endl;

    test_section("Steady ticks");
    {
        FakeTickClock clock(5000);
        TickScheduler scheduler(clock, 1000);
        scheduler.start();

        bool anyMissed = false;
        for (int i = 0; i < 10; i++) {
            clock.advance(300);
            anyMissed = anyMissed || scheduler.waitForNextTick();
        }

        test_check(!anyMissed, "no misses when work fits the period");
        test_check(scheduler.tickCount() == 10, "ten ticks counted");
        test_check(clock.nowUs() == 15000, "ticks land on the period grid");
        test_check(scheduler.lastBusyUs() == 300 && scheduler.worstBusyUs() == 300, "busy time tracked");
        test_check(clock.waits() == 10, "scheduler waited once per tick");
    }

    test_section("Work exactly filling the period");
    {
        FakeTickClock clock;
        TickScheduler scheduler(clock, 1000);
        scheduler.start();

        clock.advance(1000);
        test_check(!scheduler.waitForNextTick(), "reaching the deadline exactly is not a miss");
    }

    test_section("Overrun");
    {
        FakeTickClock clock;
        TickScheduler scheduler(clock, 1000);
        scheduler.start();

        clock.advance(200);
        scheduler.waitForNextTick();

        clock.advance(1500);
        test_check(scheduler.waitForNextTick(), "overrun reported");
        test_check(scheduler.missedDeadlines() == 1, "miss counted");
        test_check(scheduler.lastOverrunUs() == 500, "overrun amount recorded");
        test_check(scheduler.worstBusyUs() == 1500, "worst busy time records the overrun");
        test_check(clock.nowUs() == 2500, "no wait after an overrun");

        clock.advance(400);
        test_check(!scheduler.waitForNextTick(), "next tick is on time after resynchronising");
        test_check(clock.nowUs() == 3500, "new grid starts at the overrun");
        test_check(scheduler.lastBusyUs() == 400, "busy time measured from the resynchronised start");
        test_check(scheduler.missedDeadlines() == 1, "a single overrun does not cascade");
    }

    test_section("Stall while handling a miss");
    {
        FakeTickClock clock;
        TickScheduler scheduler(clock, 1000);
        scheduler.start();

        clock.advance(1500);
        clock.stallAfterNextRead(3500);
        test_check(scheduler.waitForNextTick(), "overrun reported");
        test_check(clock.nowUs() == 5000, "clock moved on while the miss was handled");

        test_check(!scheduler.waitForNextTick(), "zero-work tick after the stall is on time");
        test_check(scheduler.missedDeadlines() == 1, "stall is not charged to the next tick");
        test_check(scheduler.lastBusyUs() == 0, "next tick starts after the stall");
        test_check(clock.nowUs() == 6000, "new grid starts after the stall");
    }

    test_section("Timer wrap");
    {
        FakeTickClock clock(0xFFFFFF00u);
        TickScheduler scheduler(clock, 1000);
        scheduler.start();

        clock.advance(500);
        test_check(!scheduler.waitForNextTick(), "deadline across the wrap is not a miss");
        test_check(clock.nowUs() == 744, "wait crosses the wrap");

        clock.advance(2000);
        test_check(scheduler.waitForNextTick(), "overrun detected after the wrap");
    }

    test_section("Restart");
    {
        FakeTickClock clock;
        TickScheduler scheduler(clock, 0);
        test_check(scheduler.periodUs() == 1, "zero period clamped");

        scheduler.start();
        clock.advance(10);
        scheduler.waitForNextTick();
        test_check(scheduler.missedDeadlines() == 1, "overrun with the clamped period");

        scheduler.start();
        test_check(scheduler.tickCount() == 0 && scheduler.missedDeadlines() == 0, "start clears the counters");
    }

    return test_summary();
}
