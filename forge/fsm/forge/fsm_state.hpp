/**
 * @file fsm_state.hpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 * Common application states shared by every instrument machine.
 *
 * A state is a std::variant of per-state structs, each carrying only the data
 * that is meaningful while the machine is in that state. The numeric state
 * code published in the status registers is derived from the variant at the
 * register boundary and is never used to drive transitions.
 */

#pragma once

#include <cstdint>
#include <variant>


namespace Forge::Fsm {

    /**
     * @brief Reason the machine entered the Fault state
     */
    enum class FaultCode : uint8_t {
        None = 0,
        InvalidConfig = 1,      ///< Applied configuration violates its own ranges
        DeadlineMissed = 2,     ///< A tick did not complete before the next one was due
        PhaseOverrun = 3,       ///< A phase counter ran past its configured length
    };

    namespace States {

        struct Idle {};

        struct Armed {};

        struct Active {
            uint32_t elapsed = 0;   ///< Enabled ticks spent in Active
        };

        struct Cooldown {
            uint32_t elapsed = 0;   ///< Enabled ticks spent in Cooldown
            bool aborted = false;   ///< Entered through the abort path
        };

        struct Fault {
            FaultCode code = FaultCode::None;
        };

    } // namespace States

    using State = std::variant<States::Idle, States::Armed, States::Active, States::Cooldown, States::Fault>;

    /**
     * @brief Register encoding of a state
     *
     * Values follow the alternative order of State.
     */
    enum class StateCode : uint8_t {
        Idle = 0,
        Armed = 1,
        Active = 2,
        Cooldown = 3,
        Fault = 4,
    };

    inline StateCode stateCode(const State &state) {
        return static_cast<StateCode>(state.index());
    }

    const char *stateName(StateCode code);
    const char *faultCodeName(FaultCode code);

    inline const char *stateName(const State &state) {
        return stateName(stateCode(state));
    }

} // namespace Forge::Fsm
