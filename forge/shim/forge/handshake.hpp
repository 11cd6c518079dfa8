/**
 * @file handshake.hpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 * Configuration update handshake between the host and the application.
 *
 * A configuration is never copied into the live snapshot while the
 * application is mid-operation. The host writes the configuration words and
 * then raises the commit bit. The handshake latches the decoded candidate as
 * the pending configuration and asserts request_update until the
 * application reports ready_for_updates. It then copies the pending value into
 * the live snapshot in one step:
 *
 *     Idle -> UpdatePending -> Applying -> Applied -> Idle
 *
 * Both request_update and ready_for_updates are sampled as they stood at the
 * end of the previous tick, so the handshake never reacts to a value the
 * application produces later in the same tick.
 *
 * The pending slot holds a single value. A commit that arrives before the
 * pending value is applied overwrites it (last write wins). A commit that
 * arrives while Applying or Applied is held and starts a new cycle once the
 * handshake is back in Idle, so no state is ever skipped.
 */

#pragma once

#include <cstdint>

#include <forge/log.hpp>


namespace Forge::Shim {

    enum class HandshakeState : uint8_t {
        Idle = 0,
        UpdatePending = 1,
        Applying = 2,
        Applied = 3,
    };

    const char *handshakeStateName(HandshakeState state);

    /**
     * @brief Pending/live configuration pair driven by the commit protocol
     *
     * @tparam ConfigT Instrument configuration. Must be default-constructible
     *                 to its safe default and carry a uint16_t generation
     *                 member, which the handshake stamps on every apply.
     */
    template<typename ConfigT>
    class Handshake {
    public:
        struct Result {
            HandshakeState state;   ///< State after this tick's evaluation
            bool requestUpdate;     ///< Asserted while UpdatePending
            bool applied;           ///< Live configuration replaced on this tick
        };

        Handshake() {
            reset();
        }

        /**
         * @brief Return to the cold-reset state
         *
         * The handshake goes to Idle, both pending and live configurations
         * return to the safe default and the generation counter restarts.
         * A commit bit that is still high across the reset is not treated as
         * a new commit; the host has to lower and raise it again.
         */
        void reset() {
            _state = HandshakeState::Idle;
            _pending = ConfigT{};
            _live = ConfigT{};
            _queued = false;
            _generation = 0;
            _previousCommit = true;
        }

        /**
         * @brief Evaluate one tick of the handshake
         *
         * @param commitLevel Current level of the commit bit
         * @param candidate Configuration decoded from the control bank this tick
         * @param readyForUpdates Application readiness as of the end of the previous tick
         * @return The handshake outputs for this tick
         */
        Result evaluate(bool commitLevel, const ConfigT &candidate, bool readyForUpdates) {
            const bool commitEdge = commitLevel && !_previousCommit;
            _previousCommit = commitLevel;

            bool applied = false;

            switch (_state) {
                case HandshakeState::Idle:
                    if (commitEdge) {
                        _pending = candidate;
                        _queued = false;
                        _transition(HandshakeState::UpdatePending);
                    } else if (_queued) {
                        _queued = false;
                        _transition(HandshakeState::UpdatePending);
                    }
                    break;

                case HandshakeState::UpdatePending:
                    if (commitEdge) {
                        LOGD("Handshake: pending configuration replaced\n");
                        _pending = candidate;
                    }

                    if (readyForUpdates) {
                        _apply();
                        applied = true;
                        _transition(HandshakeState::Applying);
                    }
                    break;

                case HandshakeState::Applying:
                    _holdCommit(commitEdge, candidate);
                    _transition(HandshakeState::Applied);
                    break;

                case HandshakeState::Applied:
                    _holdCommit(commitEdge, candidate);
                    _transition(HandshakeState::Idle);
                    break;
            }

            return Result{_state, _state == HandshakeState::UpdatePending, applied};
        }

        HandshakeState state() const { return _state; }
        bool requestUpdate() const { return _state == HandshakeState::UpdatePending; }

        /**
         * @brief True if a commit is waiting for the next cycle
         */
        bool hasQueuedCommit() const { return _queued; }

        const ConfigT &live() const { return _live; }
        const ConfigT &pending() const { return _pending; }
        uint16_t generation() const { return _generation; }

    protected:
        HandshakeState _state;
        ConfigT _pending;
        ConfigT _live;
        bool _queued;
        uint16_t _generation;
        bool _previousCommit;

        void _transition(HandshakeState next) {
            LOGD("Handshake: %s -> %s\n", handshakeStateName(_state), handshakeStateName(next));
            _state = next;
        }

        void _holdCommit(bool commitEdge, const ConfigT &candidate) {
            if (commitEdge) {
                _pending = candidate;
                _queued = true;
            }
        }

        void _apply() {
            // Generation 0 is reserved for the safe default
            _generation = _generation == UINT16_MAX ? 1 : static_cast<uint16_t>(_generation + 1);
            _live = _pending;
            _live.generation = _generation;
        }
    };

} // namespace Forge::Shim
