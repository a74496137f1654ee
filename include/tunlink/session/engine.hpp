/* SPDX-License-Identifier: MIT */
/*
 * Tunlink Session Engine
 * Pluggable handshake and transport-crypto state machine for one peer
 */

#pragma once

#include <datapod/datapod.hpp>
#include <tunlink/core/result.hpp>
#include <tunlink/core/types.hpp>

namespace tunlink {

    using namespace dp;

    namespace session {

        // =============================================================================
        // Engine Result
        // =============================================================================

        enum class EngineAction : u8 {
            NoAction = 0,          // Consumed or dropped, nothing to emit
            SendToNetwork = 1,     // `data` is a reply datagram for the sender
            DeliverV4 = 2,         // `data` is a decrypted IPv4 packet
            DeliverV6 = 3,         // `data` is a decrypted IPv6 packet
            HandshakeComplete = 4, // Transport keys are now in place
            Failed = 5,            // Fatal for this session; `error` says why
        };

        [[nodiscard]] inline auto engine_action_to_string(EngineAction action) -> const char * {
            switch (action) {
            case EngineAction::NoAction:
                return "no_action";
            case EngineAction::SendToNetwork:
                return "send_to_network";
            case EngineAction::DeliverV4:
                return "deliver_v4";
            case EngineAction::DeliverV6:
                return "deliver_v6";
            case EngineAction::HandshakeComplete:
                return "handshake_complete";
            case EngineAction::Failed:
                return "failed";
            default:
                return "unknown";
            }
        }

        struct EngineResult {
            EngineAction action = EngineAction::NoAction;
            Vector<u8> data;
            boolean authenticated = false; // Datagram verified as coming from the peer
            SessionError error;

            static auto none(boolean authenticated = false) -> EngineResult {
                EngineResult r;
                r.authenticated = authenticated;
                return r;
            }

            static auto with(EngineAction action, Vector<u8> data, boolean authenticated) -> EngineResult {
                EngineResult r;
                r.action = action;
                r.data = std::move(data);
                r.authenticated = authenticated;
                return r;
            }

            static auto failed(SessionErrorKind kind, const String &message) -> EngineResult {
                EngineResult r;
                r.action = EngineAction::Failed;
                r.error = SessionError{kind, message};
                return r;
            }
        };

        // =============================================================================
        // Session Engine Interface
        // =============================================================================

        // Not thread-safe; each engine is driven by exactly one protocol session.
        class SessionEngine {
          public:
            virtual ~SessionEngine() = default;

            // Build a handshake initiation for the configured peer
            virtual auto initiate() -> Result<Vector<u8>, SessionError> = 0;

            // Process one datagram from the network
            virtual auto decapsulate(const Vector<u8> &datagram) -> EngineResult = 0;

            // Seal a plaintext packet (empty plaintext is a keepalive)
            virtual auto encapsulate(const Vector<u8> &plaintext) -> Result<Vector<u8>, SessionError> = 0;

            // Drop all handshake and transport state
            virtual auto reset() -> void = 0;

            // Remote static key, known up front for initiators and after the handshake for responders
            [[nodiscard]] virtual auto peer_key() const -> Optional<PublicKey> = 0;
        };

    } // namespace session

} // namespace tunlink
