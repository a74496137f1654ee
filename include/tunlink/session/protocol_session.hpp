/* SPDX-License-Identifier: MIT */
/*
 * Tunlink Protocol Session
 * Explicit per-peer session state machine wrapped around a session engine
 */

#pragma once

#include <memory>

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <tunlink/cfg/config.hpp>
#include <tunlink/core/metrics.hpp>
#include <tunlink/core/result.hpp>
#include <tunlink/core/time.hpp>
#include <tunlink/core/types.hpp>
#include <tunlink/net/endpoint.hpp>
#include <tunlink/session/engine.hpp>

namespace tunlink {

    using namespace dp;

    namespace session {

        // =============================================================================
        // Session Timers
        // =============================================================================

        struct SessionTimers {
            usize max_datagram_size = MAX_DATAGRAM_SIZE;
            u64 housekeeping_ms = 1000;
            u64 handshake_timeout_ms = 5000;
            u32 max_handshake_attempts = 3;
            u64 session_lifetime_ms = 180000;
            u64 idle_timeout_ms = 180000;
            u64 keepalive_ms = 0; // Persistent keepalive, 0 disables

            static auto from_options(const TunnelOptions &options, u64 keepalive_ms) -> SessionTimers {
                SessionTimers t;
                t.max_datagram_size = options.max_datagram_size;
                t.housekeeping_ms = options.housekeeping_interval_ms;
                t.handshake_timeout_ms = options.handshake_timeout_ms;
                t.max_handshake_attempts = options.max_handshake_attempts;
                t.session_lifetime_ms = options.session_lifetime_ms;
                t.idle_timeout_ms = options.idle_timeout_ms;
                t.keepalive_ms = keepalive_ms;
                return t;
            }
        };

        // =============================================================================
        // Session Output
        // =============================================================================

        enum class OutputKind : u8 {
            NoAction = 0,
            SendToNetwork = 1,
            DeliverPlaintextV4 = 2,
            DeliverPlaintextV6 = 3,
            HandshakeComplete = 4,
        };

        struct SessionOutput {
            OutputKind kind = OutputKind::NoAction;
            Vector<u8> data;

            SessionOutput() = default;
            SessionOutput(OutputKind k, Vector<u8> d) : kind(k), data(std::move(d)) {}
        };

        // =============================================================================
        // Protocol Session
        // =============================================================================

        // Idle -> HandshakeInitiated -> Established -> Expired -> (reset) -> Idle.
        // Every entry point takes the current clock so the owner decides what time it is.
        class ProtocolSession {
          private:
            std::unique_ptr<SessionEngine> engine_;
            Endpoint endpoint_;
            SessionTimers timers_;

            SessionState state_ = SessionState::Idle;
            boolean initiator_ = false;
            boolean wants_handshake_ = false;
            boolean confirm_pending_ = false;
            u32 attempts_ = 0;

            u64 handshake_started_ms_ = 0;
            u64 established_ms_ = 0;
            u64 last_send_ms_ = 0;
            u64 last_recv_ms_ = 0;

          public:
            ProtocolSession(std::unique_ptr<SessionEngine> engine, const Endpoint &endpoint,
                            const SessionTimers &timers)
                : engine_(std::move(engine)), endpoint_(endpoint), timers_(timers) {}

            ProtocolSession(const ProtocolSession &) = delete;
            auto operator=(const ProtocolSession &) -> ProtocolSession & = delete;

            // =============================================================================
            // Inbound
            // =============================================================================

            auto decapsulate(const Vector<u8> &datagram, u64 now) -> SessionOutput {
                if (datagram.size() > timers_.max_datagram_size) {
                    metrics::inc_datagrams_dropped_oversize();
                    echo::debug("ProtocolSession: dropping oversize datagram (", datagram.size(), " bytes)");
                    return {};
                }
                if (state_ == SessionState::Expired) {
                    return {};
                }

                EngineResult res = engine_->decapsulate(datagram);
                if (res.authenticated) {
                    last_recv_ms_ = now;
                }

                switch (res.action) {
                case EngineAction::SendToNetwork:
                    // Answering a peer initiation makes us the responder, whatever we were doing
                    transition(SessionState::HandshakeInitiated);
                    initiator_ = false;
                    confirm_pending_ = false;
                    handshake_started_ms_ = now;
                    last_send_ms_ = now;
                    return SessionOutput(OutputKind::SendToNetwork, std::move(res.data));

                case EngineAction::HandshakeComplete:
                    transition(SessionState::Established);
                    established_ms_ = now;
                    last_recv_ms_ = now;
                    attempts_ = 0;
                    confirm_pending_ = initiator_;
                    metrics::inc_handshakes_completed();
                    echo::info("ProtocolSession: ", net::format_endpoint(endpoint_).c_str(), " established as ",
                               initiator_ ? "initiator" : "responder");
                    return SessionOutput(OutputKind::HandshakeComplete, std::move(res.data));

                case EngineAction::DeliverV4:
                case EngineAction::DeliverV6:
                    if (state_ != SessionState::Established) {
                        return {};
                    }
                    return SessionOutput(res.action == EngineAction::DeliverV4 ? OutputKind::DeliverPlaintextV4
                                                                               : OutputKind::DeliverPlaintextV6,
                                         std::move(res.data));

                case EngineAction::Failed:
                    metrics::inc_handshakes_failed();
                    echo::warn("ProtocolSession: ", net::format_endpoint(endpoint_).c_str(), ": ",
                               res.error.describe().c_str());
                    if (state_ != SessionState::Idle) {
                        expire();
                    }
                    return {};

                case EngineAction::NoAction:
                default:
                    return {};
                }
            }

            // =============================================================================
            // Outbound
            // =============================================================================

            auto encapsulate(const Vector<u8> &plaintext, u64 now) -> Result<Vector<u8>, SessionError> {
                if (state_ == SessionState::Expired) {
                    return result::err(SessionError{SessionErrorKind::Expired, String("session expired")});
                }
                if (state_ != SessionState::Established) {
                    return result::err(SessionError{SessionErrorKind::NotEstablished, String("no transport keys")});
                }
                if (time::elapsed_ms(established_ms_, now) >= timers_.session_lifetime_ms) {
                    expire();
                    return result::err(SessionError{SessionErrorKind::Expired, String("session lifetime exceeded")});
                }

                auto res = engine_->encapsulate(plaintext);
                if (res.is_err()) {
                    if (res.error().kind == SessionErrorKind::Expired) {
                        expire();
                    }
                    return res;
                }

                last_send_ms_ = now;
                confirm_pending_ = false;
                return res;
            }

            // =============================================================================
            // Timers
            // =============================================================================

            auto tick(u64 now) -> Optional<Vector<u8>> {
                switch (state_) {
                case SessionState::Idle:
                    if (wants_handshake_ && can_initiate()) {
                        return start_handshake(now);
                    }
                    return dp::nullopt;

                case SessionState::HandshakeInitiated:
                    if (time::elapsed_ms(handshake_started_ms_, now) < timers_.handshake_timeout_ms) {
                        return dp::nullopt;
                    }
                    if (initiator_ && attempts_ < timers_.max_handshake_attempts) {
                        echo::debug("ProtocolSession: retrying handshake to ", net::format_endpoint(endpoint_).c_str(),
                                    " (attempt ", attempts_ + 1, ")");
                        return start_handshake(now);
                    }
                    metrics::inc_handshakes_timed_out();
                    echo::warn("ProtocolSession: handshake with ", net::format_endpoint(endpoint_).c_str(),
                               " timed out");
                    expire();
                    return dp::nullopt;

                case SessionState::Established:
                    if (time::elapsed_ms(established_ms_, now) >= timers_.session_lifetime_ms) {
                        expire();
                        return dp::nullopt;
                    }
                    if (timers_.idle_timeout_ms > 0 &&
                        time::elapsed_ms(last_recv_ms_, now) >= timers_.idle_timeout_ms) {
                        echo::warn("ProtocolSession: ", net::format_endpoint(endpoint_).c_str(), " went silent");
                        expire();
                        return dp::nullopt;
                    }
                    if (confirm_pending_ ||
                        (timers_.keepalive_ms > 0 && time::elapsed_ms(last_send_ms_, now) >= timers_.keepalive_ms)) {
                        return send_keepalive(now);
                    }
                    return dp::nullopt;

                case SessionState::Expired:
                default:
                    return dp::nullopt;
                }
            }

            // Keepalive interval when one is configured, otherwise the housekeeping cadence
            [[nodiscard]] auto recommended_tick_ms() const -> u64 {
                return timers_.keepalive_ms > 0 ? timers_.keepalive_ms : timers_.housekeeping_ms;
            }

            // Milliseconds until this session next needs a tick
            [[nodiscard]] auto next_timer_ms(u64 now) const -> u64 {
                u64 wait = timers_.housekeeping_ms;
                if (state_ == SessionState::HandshakeInitiated) {
                    u64 elapsed = time::elapsed_ms(handshake_started_ms_, now);
                    u64 remaining = elapsed >= timers_.handshake_timeout_ms ? 0 : timers_.handshake_timeout_ms - elapsed;
                    wait = remaining < wait ? remaining : wait;
                } else if (state_ == SessionState::Established) {
                    if (confirm_pending_) {
                        return 0;
                    }
                    if (timers_.keepalive_ms > 0) {
                        u64 elapsed = time::elapsed_ms(last_send_ms_, now);
                        u64 remaining = elapsed >= timers_.keepalive_ms ? 0 : timers_.keepalive_ms - elapsed;
                        wait = remaining < wait ? remaining : wait;
                    }
                } else if (state_ == SessionState::Idle && wants_handshake_ && can_initiate()) {
                    return 0;
                }
                return wait;
            }

            // =============================================================================
            // Control
            // =============================================================================

            // Outbound intent: the next tick from Idle starts a handshake
            auto request_handshake() -> void { wants_handshake_ = true; }

            auto reset() -> void {
                engine_->reset();
                transition(SessionState::Idle);
                initiator_ = false;
                confirm_pending_ = false;
                attempts_ = 0;
                metrics::inc_sessions_reset();
            }

            auto set_endpoint(const Endpoint &ep) -> void { endpoint_ = ep; }
            auto set_keepalive_ms(u64 keepalive_ms) -> void { timers_.keepalive_ms = keepalive_ms; }

            [[nodiscard]] auto state() const -> SessionState { return state_; }
            [[nodiscard]] auto endpoint() const -> const Endpoint & { return endpoint_; }
            [[nodiscard]] auto peer_key() const -> Optional<PublicKey> { return engine_->peer_key(); }
            [[nodiscard]] auto is_initiator() const -> boolean { return initiator_; }
            [[nodiscard]] auto wants_handshake() const -> boolean { return wants_handshake_; }
            [[nodiscard]] auto handshake_attempts() const -> u32 { return attempts_; }

          private:
            [[nodiscard]] auto can_initiate() const -> boolean {
                return endpoint_.is_valid() && engine_->peer_key().has_value();
            }

            auto start_handshake(u64 now) -> Optional<Vector<u8>> {
                auto res = engine_->initiate();
                if (res.is_err()) {
                    echo::warn("ProtocolSession: cannot initiate handshake: ", res.error().describe().c_str());
                    expire();
                    return dp::nullopt;
                }

                transition(SessionState::HandshakeInitiated);
                initiator_ = true;
                ++attempts_;
                handshake_started_ms_ = now;
                last_send_ms_ = now;
                metrics::inc_handshakes_initiated();
                return std::move(res.value());
            }

            auto send_keepalive(u64 now) -> Optional<Vector<u8>> {
                auto res = engine_->encapsulate(Vector<u8>{});
                if (res.is_err()) {
                    echo::warn("ProtocolSession: keepalive failed: ", res.error().describe().c_str());
                    expire();
                    return dp::nullopt;
                }
                last_send_ms_ = now;
                confirm_pending_ = false;
                return std::move(res.value());
            }

            auto expire() -> void {
                if (state_ == SessionState::Expired) {
                    return;
                }
                transition(SessionState::Expired);
                metrics::inc_sessions_expired();
            }

            auto transition(SessionState next) -> void {
                if (next == state_) {
                    return;
                }
                echo::debug("ProtocolSession: ", net::format_endpoint(endpoint_).c_str(), " ",
                            session_state_to_string(state_), " -> ", session_state_to_string(next));
                state_ = next;
            }
        };

    } // namespace session

} // namespace tunlink
