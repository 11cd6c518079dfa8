/**
 * @file handshake.cpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 */

#include "forge/handshake.hpp"


namespace Forge::Shim {

    const char *handshakeStateName(HandshakeState state) {
        switch (state) {
            case HandshakeState::Idle:
                return "Idle";
            case HandshakeState::UpdatePending:
                return "UpdatePending";
            case HandshakeState::Applying:
                return "Applying";
            case HandshakeState::Applied:
                return "Applied";
        }

        return "Unknown";
    }

} // namespace Forge::Shim
