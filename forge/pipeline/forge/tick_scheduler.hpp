/**
 * @file tick_scheduler.hpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 * Fixed-rate tick scheduling with deadline-miss detection.
 *
 * The scheduler keeps an absolute deadline for the end of every tick. After
 * the work for a tick is done, waitForNextTick() either waits until the
 * deadline, or, if the deadline has already passed, reports a miss and
 * re-synchronises so that a single overrun does not cascade into a burst of
 * back-to-back ticks.
 *
 * A miss is reported to the caller rather than absorbed: the caller feeds it
 * into the next tick, where the application treats it as a fault. The
 * scheduler never logs, since it runs on the tick path; misses are counted
 * and read back from another core with missedDeadlines() and lastOverrunUs().
 *
 * Time comes from a TickClock. The target uses the RP2350 microsecond timer;
 * tests use a clock they advance by hand. Timestamps are 32-bit microsecond
 * counters and all comparisons are wrap-safe.
 */

#pragma once

#include <atomic>
#include <cstdint>


namespace Forge::Pipeline {

    /**
     * @brief Microsecond time source used by the scheduler
     */
    class TickClock {
    public:
        virtual ~TickClock() = default;

        /**
         * @brief Current time in microseconds (free-running, wraps)
         */
        virtual uint32_t nowUs() = 0;

        /**
         * @brief Block until the clock reaches the given time
         *
         * Returns immediately if the time has already passed.
         */
        virtual void waitUntilUs(uint32_t deadlineUs) = 0;
    };

    class TickScheduler {
    public:
        /**
         * @param clock Time source; must outlive the scheduler
         * @param periodUs Tick period in microseconds, must be non-zero
         */
        TickScheduler(TickClock &clock, uint32_t periodUs);

        /**
         * @brief Start timing; the first tick begins now
         */
        void start();

        /**
         * @brief Finish the current tick and wait for the next one
         *
         * @return true if the tick that just finished overran its deadline
         */
        bool waitForNextTick();

        uint32_t periodUs() const { return _periodUs; }
        uint32_t tickCount() const { return _tickCount; }
        uint32_t missedDeadlines() const { return _missedDeadlines.load(std::memory_order_relaxed); }

        /**
         * @brief Time spent in the most recent tick before waiting, in microseconds
         */
        uint32_t lastBusyUs() const { return _lastBusyUs; }

        /**
         * @brief Longest busy time observed since start(), in microseconds
         */
        uint32_t worstBusyUs() const { return _worstBusyUs; }

        /**
         * @brief How far past its deadline the most recent missed tick ended
         */
        uint32_t lastOverrunUs() const { return _lastOverrunUs.load(std::memory_order_relaxed); }

    protected:
        TickClock &_clock;
        uint32_t _periodUs;
        uint32_t _tickStartUs;
        uint32_t _deadlineUs;
        uint32_t _tickCount;
        std::atomic<uint32_t> _missedDeadlines;     ///< Read from Core 0
        uint32_t _lastBusyUs;
        uint32_t _worstBusyUs;
        std::atomic<uint32_t> _lastOverrunUs;       ///< Read from Core 0
    };

} // namespace Forge::Pipeline
