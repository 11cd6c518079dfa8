/**
 * @file fsm_state.cpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 */

#include "forge/fsm_state.hpp"


namespace Forge::Fsm {

    const char *stateName(StateCode code) {
        switch (code) {
            case StateCode::Idle:
                return "Idle";
            case StateCode::Armed:
                return "Armed";
            case StateCode::Active:
                return "Active";
            case StateCode::Cooldown:
                return "Cooldown";
            case StateCode::Fault:
                return "Fault";
        }

        return "Unknown";
    }

    const char *faultCodeName(FaultCode code) {
        switch (code) {
            case FaultCode::None:
                return "none";
            case FaultCode::InvalidConfig:
                return "invalid configuration";
            case FaultCode::DeadlineMissed:
                return "tick deadline missed";
            case FaultCode::PhaseOverrun:
                return "phase overrun";
        }

        return "unknown";
    }

} // namespace Forge::Fsm
