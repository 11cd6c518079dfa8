/**
 * @file tick_scheduler.cpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 */

#include "forge/tick_scheduler.hpp"


namespace Forge::Pipeline {

    TickScheduler::TickScheduler(TickClock &clock, uint32_t periodUs) :
        _clock(clock),
        _periodUs(periodUs == 0 ? 1 : periodUs),
        _tickStartUs(0),
        _deadlineUs(0),
        _tickCount(0),
        _missedDeadlines(0),
        _lastBusyUs(0),
        _worstBusyUs(0),
        _lastOverrunUs(0) {
    }

    void TickScheduler::start() {
        _tickStartUs = _clock.nowUs();
        _deadlineUs = _tickStartUs + _periodUs;
        _tickCount = 0;
        _missedDeadlines.store(0, std::memory_order_relaxed);
        _lastBusyUs = 0;
        _worstBusyUs = 0;
        _lastOverrunUs.store(0, std::memory_order_relaxed);
    }

    bool TickScheduler::waitForNextTick() {
        const uint32_t now = _clock.nowUs();

        _lastBusyUs = now - _tickStartUs;

        if (_lastBusyUs > _worstBusyUs) {
            _worstBusyUs = _lastBusyUs;
        }

        _tickCount++;

        // Wrap-safe: positive difference means the deadline is behind us
        if (static_cast<int32_t>(now - _deadlineUs) > 0) {
            _missedDeadlines.fetch_add(1, std::memory_order_relaxed);
            _lastOverrunUs.store(now - _deadlineUs, std::memory_order_relaxed);

            // Nothing here may block: the miss is counted for Core 0 to
            // report. Re-synchronise on a fresh reading so that time spent
            // since `now` is not charged to the next tick.
            _tickStartUs = _clock.nowUs();
            _deadlineUs = _tickStartUs + _periodUs;
            return true;
        }

        _clock.waitUntilUs(_deadlineUs);

        _tickStartUs = _deadlineUs;
        _deadlineUs += _periodUs;
        return false;
    }

} // namespace Forge::Pipeline
